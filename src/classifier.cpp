// SPDX-License-Identifier: MIT

#include "qcl/classifier.hpp"
#include "qcl/encoding.hpp"
#include "qcl/errors.hpp"
#include "qcl/gradient.hpp"
#include "qcl/numeric.hpp"
#include "qcl/operators.hpp"
#include <algorithm>
#include <iomanip>
#include <ios>
#include <numbers>
#include <ostream>

namespace qcl {

QclClassifier::QclClassifier(ClassifierOptions opts)
  : opts_(std::move(opts)), obs_(make_class_observables(opts_.nqubit, opts_.num_class)), rng_(opts_.seed) {
  if (opts_.layer_axes.empty()) throw std::invalid_argument("layer_axes must name at least one rotation");
}

QclClassifier::QclClassifier(std::size_t nqubit, std::size_t c_depth, std::size_t num_class)
  : QclClassifier([&]{
      ClassifierOptions o;
      o.nqubit = nqubit; o.c_depth = c_depth; o.num_class = num_class;
      return o;
    }()) {}

void QclClassifier::require_output_gate_() const {
  if (!output_gate_) throw std::logic_error("output gate not created; call create_initial_output_gate() or fit()");
}

void QclClassifier::set_input_state(const Batch& x_list){
  input_state_list_ = encode_batch(x_list, opts_.nqubit);
}

void QclClassifier::set_targets(const Batch& y_list){
  if (!input_state_list_.empty() && y_list.size() != input_state_list_.size())
    throw DimensionMismatch("have " + std::to_string(input_state_list_.size()) + " input states but " +
                            std::to_string(y_list.size()) + " targets");
  for (const auto& row : y_list){
    if (row.size() != opts_.num_class)
      throw DimensionMismatch("target rows must have " + std::to_string(opts_.num_class) + " entries");
  }
  y_list_ = y_list;
}

void QclClassifier::create_initial_output_gate(){
  const std::size_t n = opts_.nqubit;
  std::vector<std::size_t> all(n);
  for (std::size_t i=0;i<n;++i) all[i] = i;
  const Matrix time_evol = time_evolution_operator(random_ising_hamiltonian(n, rng_), opts_.time_step);

  auto u_out = std::make_unique<LearningCircuit>(n);
  theta_.clear();
  theta_.reserve(parameter_count());
  for (std::size_t d=0;d<opts_.c_depth;++d){
    u_out->add_dense_gate(all, time_evol);
    for (std::size_t i=0;i<n;++i){
      for (Axis a : opts_.layer_axes){
        double angle = 2.0 * std::numbers::pi * rng_.uniform01();
        u_out->add_parametric_R_gate(i, a, angle);
        theta_.push_back(angle);
      }
    }
  }
  output_gate_ = std::move(u_out);
}

void QclClassifier::update_output_gate(std::span<const double> theta){
  require_output_gate_();
  // theta may view theta_ itself
  std::vector<double> t(theta.begin(), theta.end());
  output_gate_->update_parameters(t);
  theta_ = std::move(t);
}

std::vector<double> QclClassifier::get_output_gate_parameter() const {
  require_output_gate_();
  return output_gate_->get_parameters();
}

Batch QclClassifier::pred_states_(const std::vector<StateVector>& states, std::span<const double> theta){
  update_output_gate(theta);
  Batch res;
  res.reserve(states.size());
  std::vector<double> r(obs_.size());
  for (const auto& st_in : states){
    // U_out mutates the state in place; every sample gets its own copy
    StateVector st = st_in.copy();
    output_gate_->apply_to(st);
    for (std::size_t j=0;j<obs_.size();++j) r[j] = obs_[j].expectation_value(st);
    res.push_back(softmax(r));
  }
  return res;
}

Batch QclClassifier::pred(std::span<const double> theta){
  return pred_states_(input_state_list_, theta);
}

double QclClassifier::cost_func(std::span<const double> theta){
  Batch y_pred = pred(theta);
  return log_loss(y_list_, y_pred);
}

std::vector<Batch> QclClassifier::b_grad(std::span<const double> theta){
  if (opts_.gradient == GradientMethod::Adjoint) return b_grad_adjoint_(theta);
  const std::vector<double> t(theta.begin(), theta.end());
  std::vector<Batch> grad;
  grad.reserve(t.size());
  for (std::size_t k=0;k<t.size();++k){
    std::vector<double> plus = t, minus = t;
    plus[k]  += kParameterShift;
    minus[k] -= kParameterShift;
    Batch p_plus = pred(plus);
    Batch p_minus = pred(minus);
    for (std::size_t n=0;n<p_plus.size();++n)
      for (std::size_t c=0;c<p_plus[n].size();++c)
        p_plus[n][c] = 0.5 * (p_plus[n][c] - p_minus[n][c]);
    grad.push_back(std::move(p_plus));
  }
  update_output_gate(t);
  return grad;
}

std::vector<Batch> QclClassifier::b_grad_adjoint_(std::span<const double> theta){
  update_output_gate(theta);
  const std::size_t P = theta.size(), C = obs_.size();
  std::vector<Batch> grad(P, Batch(input_state_list_.size(), std::vector<double>(C, 0.0)));
  std::vector<double> e(C);
  std::vector<std::vector<double>> de(C);
  for (std::size_t n=0;n<input_state_list_.size();++n){
    const StateVector& st_in = input_state_list_[n];
    StateVector st = st_in.copy();
    output_gate_->apply_to(st);
    for (std::size_t j=0;j<C;++j){
      e[j] = obs_[j].expectation_value(st);
      de[j] = output_gate_->backprop_from(st_in, obs_[j]);
    }
    std::vector<double> p = softmax(e);
    // d p_c = sum_j p_c (delta_cj - p_j) d e_j
    for (std::size_t k=0;k<P;++k){
      for (std::size_t c=0;c<C;++c){
        double acc = 0.0;
        for (std::size_t j=0;j<C;++j) acc += p[c] * ((c == j ? 1.0 : 0.0) - p[j]) * de[j][k];
        grad[k][n][c] = acc;
      }
    }
  }
  return grad;
}

std::vector<double> QclClassifier::cost_func_grad(std::span<const double> theta){
  Batch y_minus_t = pred(theta);
  if (y_minus_t.size() != y_list_.size())
    throw DimensionMismatch("targets not set for the captured input states");
  for (std::size_t n=0;n<y_minus_t.size();++n)
    for (std::size_t c=0;c<y_minus_t[n].size();++c)
      y_minus_t[n][c] -= y_list_[n][c];
  std::vector<Batch> b_gr_list = b_grad(theta);
  std::vector<double> grad(b_gr_list.size(), 0.0);
  for (std::size_t k=0;k<b_gr_list.size();++k){
    double s = 0.0;
    for (std::size_t n=0;n<y_minus_t.size();++n)
      for (std::size_t c=0;c<y_minus_t[n].size();++c)
        s += y_minus_t[n][c] * b_gr_list[k][n][c];
    grad[k] = s;
  }
  return grad;
}

namespace {

// Restores the caller's float formatting when fit() returns or throws.
class StreamFormatGuard {
  std::ostream* os_;
  std::ios_base::fmtflags flags_{};
  std::streamsize precision_ = 0;
public:
  explicit StreamFormatGuard(std::ostream* os) : os_(os) {
    if (os_){ flags_ = os_->flags(); precision_ = os_->precision(); }
  }
  ~StreamFormatGuard(){
    if (os_){ os_->flags(flags_); os_->precision(precision_); }
  }
  StreamFormatGuard(const StreamFormatGuard&) = delete;
  StreamFormatGuard& operator=(const StreamFormatGuard&) = delete;
};

void print_parameters(std::ostream& os, const char* title, const std::vector<double>& theta){
  os << title << "\n" << std::defaultfloat << std::setprecision(8) << "[";
  for (std::size_t i=0;i<theta.size();++i) os << (i ? " " : "") << theta[i];
  os << "]\n\n" << std::fixed << std::setprecision(4);
}

} // namespace

FitResult QclClassifier::fit(const Batch& x_list, const Batch& y_list, int maxiter){
  set_input_state(x_list);
  create_initial_output_gate();
  FitResult fr;
  fr.theta_init = theta_;
  set_targets(y_list);

  std::ostream* log = opts_.log;
  StreamFormatGuard format_guard(log);
  if (log){
    *log << std::fixed << std::setprecision(4);
    print_parameters(*log, "Initial parameter:", theta_);
    *log << "Initial value of cost function:  " << cost_func(theta_) << "\n\n";
    *log << "============================================================\n";
    *log << "Iteration count...\n";
  }

  const int interval = opts_.report_interval > 0 ? opts_.report_interval : std::max(1, maxiter / 10);
  IterationCallback callback;
  if (log){
    callback = [&](int it, const std::vector<double>& theta){
      *log << "Iteration: " << it << " / " << maxiter << ",   Value of cost_func: " << cost_func(theta) << "\n";
    };
  }
  OptimizerOptions oo;
  oo.gtol = opts_.gtol;
  oo.report_interval = interval;
  oo.log = log;

  fr.result = minimize_bfgs([this](const std::vector<double>& t){ return cost_func(t); },
                            theta_,
                            [this](const std::vector<double>& t){ return cost_func_grad(t); },
                            maxiter, callback, oo);
  update_output_gate(fr.result.x);
  fr.theta_opt = theta_;

  if (log){
    *log << "============================================================\n\n";
    print_parameters(*log, "Optimized parameter:", theta_);
    *log << "Final value of cost function:  " << cost_func(theta_) << "\n\n";
  }
  return fr;
}

Batch QclClassifier::predict(const Batch& x_list){
  require_output_gate_();
  std::vector<StateVector> states = encode_batch(x_list, opts_.nqubit);
  const std::vector<double> t = theta_;
  return pred_states_(states, t);
}

std::vector<std::size_t> QclClassifier::classify(const Batch& x_list){
  return argmax_rows(predict(x_list));
}

} // namespace qcl
