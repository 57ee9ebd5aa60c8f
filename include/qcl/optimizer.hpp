// SPDX-License-Identifier: MIT

#pragma once
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace qcl {

using ObjectiveFn = std::function<double(const std::vector<double>&)>;
using GradientFn = std::function<std::vector<double>(const std::vector<double>&)>;
// (iterations completed so far, current point)
using IterationCallback = std::function<void(int, const std::vector<double>&)>;

struct OptimizerOptions {
  double gtol = 1e-5;        // stop when |grad| <= gtol
  int report_interval = 0;   // callback period in iterations; 0 = once at the end
  int max_linesearch = 20;
  std::ostream* log = nullptr; // warnings (line-search failures)
};

struct OptimizeResult {
  std::vector<double> x;   // best point evaluated
  double fun = 0.0;        // objective at x
  int iterations = 0;
  int evaluations = 0;
  bool converged = false;
  std::string message;
};

// Quasi-Newton (L-BFGS) minimisation. The solver's memory is reset at every
// report_interval boundary. Throws DimensionMismatch if gradient() returns a
// vector of the wrong length and std::invalid_argument if gtol <= 0.
// Exceptions from objective, gradient or callback propagate; only line-search
// failures end the run early.
OptimizeResult minimize_bfgs(const ObjectiveFn& objective, std::vector<double> x0, const GradientFn& gradient,
                             int max_iterations, const IterationCallback& callback = {},
                             const OptimizerOptions& opts = {});

} // namespace qcl
