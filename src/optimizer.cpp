// SPDX-License-Identifier: MIT

#include "qcl/optimizer.hpp"
#include "qcl/errors.hpp"
#include <Eigen/Core>
#include <LBFGS.h>
#include <algorithm>
#include <exception>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace qcl {

namespace {

// Functor in the form LBFGS++ expects; remembers the best point it has seen.
class ObjectiveAdapter {
  const ObjectiveFn& objective_;
  const GradientFn& gradient_;
public:
  std::vector<double> best_x;
  double best_f = std::numeric_limits<double>::infinity();
  int evaluations = 0;

  ObjectiveAdapter(const ObjectiveFn& f, const GradientFn& g) : objective_(f), gradient_(g) {}

  // Set when an exception leaves the user callbacks rather than the solver.
  std::exception_ptr callback_error;

  double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad){
    std::vector<double> v(x.data(), x.data() + x.size());
    double f = 0.0;
    std::vector<double> g;
    try {
      f = objective_(v);
      g = gradient_(v);
      if (g.size() != v.size())
        throw DimensionMismatch("gradient has " + std::to_string(g.size()) + " entries, expected " + std::to_string(v.size()));
    } catch (const std::exception&) {
      callback_error = std::current_exception();
      throw;
    }
    grad = Eigen::Map<const Eigen::VectorXd>(g.data(), (Eigen::Index)g.size());
    ++evaluations;
    if (f < best_f){ best_f = f; best_x = std::move(v); }
    return f;
  }
};

} // namespace

OptimizeResult minimize_bfgs(const ObjectiveFn& objective, std::vector<double> x0, const GradientFn& gradient,
                             int max_iterations, const IterationCallback& callback, const OptimizerOptions& opts){
  if (!(opts.gtol > 0.0))
    throw std::invalid_argument("gtol must be positive, got " + std::to_string(opts.gtol));
  LBFGSpp::LBFGSParam<double> param;
  param.epsilon = opts.gtol;
  param.max_linesearch = opts.max_linesearch;
  param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_ARMIJO;
  // throws std::invalid_argument on a bad tolerance or line-search budget
  param.check_param();

  OptimizeResult res;
  ObjectiveAdapter fun(objective, gradient);
  if (max_iterations <= 0 || x0.empty()){
    res.x = x0;
    res.fun = objective(x0);
    res.evaluations = 1;
    res.converged = x0.empty();
    res.message = "no iterations requested";
    return res;
  }

  Eigen::VectorXd x = Eigen::Map<const Eigen::VectorXd>(x0.data(), (Eigen::Index)x0.size());
  const int interval = opts.report_interval > 0 ? opts.report_interval : max_iterations;
  int done = 0;
  res.message = "maximum number of iterations reached";
  try {
    while (done < max_iterations){
      const int chunk = std::min(interval, max_iterations - done);
      param.max_iterations = chunk;
      LBFGSpp::LBFGSSolver<double, LBFGSpp::LineSearchBacktracking> solver(param);
      double fx = 0.0;
      int niter = solver.minimize(fun, x, fx);
      done += std::min(niter, chunk);
      if (callback){
        try {
          callback(done, std::vector<double>(x.data(), x.data() + x.size()));
        } catch (const std::exception&) {
          fun.callback_error = std::current_exception();
          throw;
        }
      }
      // same test LBFGS++ applies before returning early
      const double gnorm = solver.final_grad_norm();
      if (gnorm <= param.epsilon || gnorm <= param.epsilon_rel * x.norm()){
        res.converged = true;
        res.message = "gradient norm below tolerance";
        break;
      }
    }
  } catch (const std::runtime_error& e) {
    // line search hit its step or iteration limit; keep the best point seen
    if (fun.callback_error) throw;
    res.message = e.what();
    if (opts.log) *opts.log << "Warning: optimizer stopped early: " << e.what() << "\n";
  } catch (const std::logic_error& e) {
    // search direction is not a descent direction for the objective
    if (fun.callback_error) throw;
    res.message = e.what();
    if (opts.log) *opts.log << "Warning: optimizer stopped early: " << e.what() << "\n";
  }

  res.iterations = done;
  res.evaluations = fun.evaluations;
  if (fun.best_x.empty()){
    res.x = x0;
    res.fun = objective(x0);
  } else {
    res.x = fun.best_x;
    res.fun = fun.best_f;
  }
  return res;
}

} // namespace qcl
