// SPDX-License-Identifier: MIT

#include "qcl/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace qcl {

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

static bool parse_size_t(const std::string& s, std::size_t& out) {
  if (s.empty() || s[0]=='-') return false;
  try {
    std::size_t pos=0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::logic_error&) { return false; }
}

static bool parse_double(const std::string& s, double& out) {
  try {
    std::size_t pos=0;
    out = std::stod(s, &pos);
    return pos == s.size();
  } catch (const std::logic_error&) { return false; }
}

std::optional<ClassifierOptions> parse_options(std::istream& in, std::string& err){
  ClassifierOptions o;
  std::string line;
  std::size_t lineno = 0;
  auto fail = [&](const std::string& msg){ err = msg + " at line " + std::to_string(lineno); return std::nullopt; };
  while (std::getline(in, line)){
    ++lineno;
    auto hash = line.find('#');
    if (hash != std::string::npos) line = line.substr(0, hash);
    line = trim(line);
    if (line.empty()) continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) return fail("Expected key=value");
    std::string key = trim(line.substr(0, eq)), val = trim(line.substr(eq+1));
    std::size_t n = 0;
    double d = 0.0;
    if (key == "nqubit" || key == "c_depth" || key == "num_class" || key == "seed" || key == "report_interval"){
      if (!parse_size_t(val, n)) return fail("Invalid integer for '" + key + "'");
      if (key == "nqubit") o.nqubit = n;
      else if (key == "c_depth") o.c_depth = n;
      else if (key == "num_class") o.num_class = n;
      else if (key == "seed") o.seed = n;
      else o.report_interval = (int)n;
    } else if (key == "time_step" || key == "gtol"){
      if (!parse_double(val, d)) return fail("Invalid number for '" + key + "'");
      if (key == "gtol" && !(d > 0.0)) return fail("gtol must be positive");
      if (key == "time_step") o.time_step = d; else o.gtol = d;
    } else if (key == "layer_axes"){
      if (val.empty()) return fail("Empty layer_axes");
      std::vector<Axis> axes;
      try {
        for (char c : val) axes.push_back(axis_from_char(c));
      } catch (const UnsupportedAxis& e) {
        return fail(e.what());
      }
      o.layer_axes = std::move(axes);
    } else if (key == "gradient"){
      if (val == "parameter_shift") o.gradient = GradientMethod::ParameterShift;
      else if (val == "adjoint") o.gradient = GradientMethod::Adjoint;
      else return fail("Unknown gradient method '" + val + "'");
    } else if (key == "verbose"){
      if (val == "true" || val == "1") o.log = &std::cout;
      else if (val == "false" || val == "0") o.log = nullptr;
      else return fail("Invalid boolean for 'verbose'");
    } else {
      return fail("Unknown key '" + key + "'");
    }
  }
  if (o.nqubit == 0) { err = "nqubit must be positive"; return std::nullopt; }
  if (o.num_class > o.nqubit) { err = "num_class must not exceed nqubit"; return std::nullopt; }
  return o;
}

std::optional<ClassifierOptions> load_options(const std::string& path, std::string& err){
  std::ifstream in(path);
  if (!in) { err = "Cannot open options file: " + path; return std::nullopt; }
  return parse_options(in, err);
}

} // namespace qcl
