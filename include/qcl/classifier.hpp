// SPDX-License-Identifier: MIT

#pragma once
#include "config.hpp"
#include "learning_circuit.hpp"
#include "optimizer.hpp"
#include "rng.hpp"
#include <memory>
#include <vector>

namespace qcl {

struct FitResult {
  OptimizeResult result;
  std::vector<double> theta_init;
  std::vector<double> theta_opt;
};

// Quantum circuit learning classifier.
//
// Each sample x (2 features) is min-max scaled with the rest of its batch and
// encoded into |psi_in(x)>. The trainable unitary U_out is c_depth layers of
//   [random Ising time evolution] [R_a(theta) on every qubit for a in layer_axes],
// and class probabilities are softmax(<Z_0>, ..., <Z_{num_class-1}>).
class QclClassifier {
  ClassifierOptions opts_;
  std::vector<Observable> obs_;
  std::vector<StateVector> input_state_list_;
  std::unique_ptr<LearningCircuit> output_gate_;
  std::vector<double> theta_;
  Batch y_list_;
  Pcg32 rng_;

  void require_output_gate_() const;
  Batch pred_states_(const std::vector<StateVector>& states, std::span<const double> theta);
  std::vector<Batch> b_grad_adjoint_(std::span<const double> theta);

public:
  explicit QclClassifier(ClassifierOptions opts);
  QclClassifier(std::size_t nqubit, std::size_t c_depth, std::size_t num_class);

  const ClassifierOptions& options() const { return opts_; }
  const std::vector<Observable>& observables() const { return obs_; }
  const std::vector<StateVector>& input_states() const { return input_state_list_; }
  const std::vector<double>& theta() const { return theta_; }
  std::size_t parameter_count() const { return opts_.c_depth * opts_.nqubit * opts_.layer_axes.size(); }

  // Scale x_list and capture one encoded state per sample.
  void set_input_state(const Batch& x_list);
  // Targets (one-hot rows) used by cost_func / cost_func_grad.
  void set_targets(const Batch& y_list);
  // Fresh U_out with random couplings and angles uniform in [0, 2π).
  void create_initial_output_gate();
  void update_output_gate(std::span<const double> theta);
  std::vector<double> get_output_gate_parameter() const;

  // Class probabilities for every captured input state (N x num_class).
  Batch pred(std::span<const double> theta);
  double cost_func(std::span<const double> theta);
  // d pred / d theta_k for every k (P x N x num_class).
  std::vector<Batch> b_grad(std::span<const double> theta);
  // sum_n sum_c (pred - y) * d pred / d theta_k
  std::vector<double> cost_func_grad(std::span<const double> theta);

  FitResult fit(const Batch& x_list, const Batch& y_list, int maxiter = 200);

  // Encode a new batch (normalised on its own) and evaluate with the current theta.
  // The captured training states are left untouched.
  Batch predict(const Batch& x_list);
  std::vector<std::size_t> classify(const Batch& x_list);
};

} // namespace qcl
