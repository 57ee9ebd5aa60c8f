// SPDX-License-Identifier: MIT

#include "qcl/optimizer.hpp"
#include "qcl/errors.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace qcl;

static int fails=0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++fails; } }while(0)
#define CHECK_NEAR(a,b,e) do{ if (std::fabs((a)-(b))>(e)) { std::cerr << "Mismatch at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++fails; } }while(0)

int main(){
  // Separable quadratic with minimum at (0, 1, 2, 3)
  auto f = [](const std::vector<double>& x){
    double s = 0.0;
    for (std::size_t i=0;i<x.size();++i) s += (i + 1.0) * (x[i] - i) * (x[i] - i);
    return s;
  };
  auto g = [](const std::vector<double>& x){
    std::vector<double> d(x.size());
    for (std::size_t i=0;i<x.size();++i) d[i] = 2.0 * (i + 1.0) * (x[i] - i);
    return d;
  };

  {
    std::vector<int> seen;
    OptimizerOptions oo; oo.report_interval = 3;
    auto r = minimize_bfgs(f, {5.0, -4.0, 0.5, 9.0}, g, 100,
                           [&](int it, const std::vector<double>&){ seen.push_back(it); }, oo);
    for (std::size_t i=0;i<4;++i) CHECK_NEAR(r.x[i], (double)i, 1e-4);
    CHECK(r.fun < 1e-8);
    CHECK(r.converged);
    CHECK(!seen.empty());
    for (std::size_t i=1;i<seen.size();++i) CHECK(seen[i] > seen[i-1]);
    CHECK(r.evaluations >= r.iterations);
  }

  // Never worse than the starting point, even with a single iteration
  {
    std::vector<double> x0 = {5.0, -4.0, 0.5, 9.0};
    auto r = minimize_bfgs(f, x0, g, 1);
    CHECK(r.fun <= f(x0));
    CHECK(r.iterations <= 1);
    auto z = minimize_bfgs(f, x0, g, 0);
    CHECK(z.x == x0 && z.iterations == 0);
  }

  // Gradient of the wrong length is a caller error, not an early stop
  {
    bool threw = false;
    try {
      minimize_bfgs(f, {1.0, 1.0}, [](const std::vector<double>&){ return std::vector<double>{1.0}; }, 10);
    } catch (const DimensionMismatch&) { threw = true; }
    CHECK(threw);
  }

  // Convergence on the last iteration of a chunk ends the run
  {
    auto f1 = [](const std::vector<double>& x){ return (x[0] - 3.0) * (x[0] - 3.0); };
    auto g1 = [](const std::vector<double>& x){ return std::vector<double>{2.0 * (x[0] - 3.0)}; };
    OptimizerOptions oo; oo.report_interval = 1;
    int calls = 0;
    auto r = minimize_bfgs(f1, {5.0}, g1, 50, [&](int, const std::vector<double>&){ ++calls; }, oo);
    CHECK(r.converged);
    CHECK_NEAR(r.x[0], 3.0, 1e-6);
    CHECK(r.iterations < 50);
    CHECK(calls == r.iterations);
  }

  // Bad tolerance is rejected up front
  {
    OptimizerOptions oo; oo.gtol = -1.0;
    bool threw = false;
    try { minimize_bfgs(f, {1.0, 1.0}, g, 10, {}, oo); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
    oo.gtol = 1e-5; oo.max_linesearch = 0;
    threw = false;
    try { minimize_bfgs(f, {1.0, 1.0}, g, 10, {}, oo); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
  }

  // Errors raised by the objective or the callback are not treated as an early stop
  {
    std::ostringstream log;
    OptimizerOptions oo; oo.log = &log;
    bool threw = false;
    try {
      minimize_bfgs([](const std::vector<double>&) -> double { throw std::domain_error("objective outside domain"); },
                    {1.0}, g, 10, {}, oo);
    } catch (const std::domain_error&) { threw = true; }
    CHECK(threw);
    threw = false;
    try {
      minimize_bfgs(f, {5.0, -4.0}, g, 10,
                    [](int, const std::vector<double>&){ throw std::runtime_error("report sink closed"); }, oo);
    } catch (const std::runtime_error&) { threw = true; }
    CHECK(threw);
    CHECK(log.str().empty());
  }

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
