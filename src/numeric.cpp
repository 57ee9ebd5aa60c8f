// SPDX-License-Identifier: MIT

#include "qcl/numeric.hpp"
#include "qcl/errors.hpp"
#include <algorithm>
#include <cmath>

namespace qcl {

static std::size_t checked_width(const Batch& x, const char* what){
  if (x.empty()) throw DimensionMismatch(std::string(what) + " is empty");
  std::size_t w = x[0].size();
  for (const auto& row : x){
    if (row.size() != w) throw DimensionMismatch(std::string(what) + " has rows of different lengths");
  }
  return w;
}

Batch min_max_scaling(const Batch& x){
  std::size_t w = checked_width(x, "batch");
  Batch out = x;
  for (std::size_t c=0;c<w;++c){
    double lo = x[0][c], hi = x[0][c];
    for (const auto& row : x){ lo = std::min(lo, row[c]); hi = std::max(hi, row[c]); }
    double span = hi - lo;
    for (std::size_t r=0;r<x.size();++r){
      if (span == 0.0) { out[r][c] = 0.0; continue; }
      out[r][c] = 2.0 * ((x[r][c] - lo) / span) - 1.0;
    }
    // exact endpoints regardless of rounding
    if (span != 0.0){
      for (std::size_t r=0;r<x.size();++r){
        if (x[r][c] == lo) out[r][c] = -1.0;
        else if (x[r][c] == hi) out[r][c] = 1.0;
      }
    }
  }
  return out;
}

std::vector<double> softmax(std::span<const double> x){
  std::vector<double> y(x.begin(), x.end());
  if (y.empty()) return y;
  double m = *std::max_element(y.begin(), y.end());
  double s = 0.0;
  for (auto& v : y){ v = std::exp(v - m); s += v; }
  for (auto& v : y) v /= s;
  return y;
}

double log_loss(const Batch& y_true, const Batch& y_pred, double eps){
  std::size_t w = checked_width(y_true, "targets");
  if (checked_width(y_pred, "predictions") != w || y_pred.size() != y_true.size())
    throw DimensionMismatch("targets and predictions have different shapes");
  double total = 0.0;
  for (std::size_t r=0;r<y_true.size();++r){
    std::vector<double> p(w);
    double s = 0.0;
    for (std::size_t c=0;c<w;++c){ p[c] = std::clamp(y_pred[r][c], eps, 1.0 - eps); s += p[c]; }
    for (std::size_t c=0;c<w;++c) total -= y_true[r][c] * std::log(p[c] / s);
  }
  return total / (double)y_true.size();
}

std::vector<std::size_t> argmax_rows(const Batch& m){
  std::vector<std::size_t> out;
  out.reserve(m.size());
  for (const auto& row : m){
    out.push_back(row.empty() ? 0 : (std::size_t)std::distance(row.begin(), std::max_element(row.begin(), row.end())));
  }
  return out;
}

} // namespace qcl
