// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include "parameter_registry.hpp"
#include <span>
#include <vector>

namespace qcl {

// Parametric circuit plus the bookkeeping of which angles are trained and which
// are recomputed from the input x.
//
// Execution flow:
//   1. add gates with add_*_gate();
//   2. run(x) binds every input slot from x and applies the circuit to |0...0>;
//   3. update_parameters(theta) writes optimizer values into the learning slots.
class LearningCircuit {
  ParametricCircuit circuit_;
  ParameterRegistry registry_;

public:
  explicit LearningCircuit(std::size_t n_qubit) : circuit_(n_qubit) {}

  std::size_t num_qubits() const { return circuit_.num_qubits(); }
  const ParametricCircuit& circuit() const { return circuit_; }
  const ParameterRegistry& registry() const { return registry_; }
  std::size_t learning_parameter_count() const { return registry_.learning_count(); }

  // Commit phase: push registry assignments into the circuit.
  void commit(const std::vector<ParameterAssignment>& assignments);

  void update_parameters(std::span<const double> theta);
  std::vector<double> get_parameters() const { return registry_.snapshot_theta(); }

  StateVector run(std::span<const double> x);
  // Re-executes with the angles currently stored (x unchanged since the last run).
  StateVector run_x_no_change() const;
  void apply_to(StateVector& state) const { circuit_.apply_to(state); }

  // d<obs>/d(theta) after binding x. Input-driven learning parameters get 0.
  std::vector<double> backprop(std::span<const double> x, const Observable& obs);
  // Same, from a prepared state and without rebinding inputs.
  std::vector<double> backprop_from(const StateVector& initial, const Observable& obs) const;

  void add_X_gate(std::size_t index) { circuit_.add_X_gate(index); }
  void add_Y_gate(std::size_t index) { circuit_.add_Y_gate(index); }
  void add_Z_gate(std::size_t index) { circuit_.add_Z_gate(index); }
  void add_H_gate(std::size_t index) { circuit_.add_H_gate(index); }
  void add_S_gate(std::size_t index) { circuit_.add_S_gate(index); }
  void add_CNOT_gate(std::size_t control, std::size_t target) { circuit_.add_CNOT_gate(control, target); }
  void add_dense_gate(std::vector<std::size_t> targets, Matrix m) { circuit_.add_dense_gate(std::move(targets), std::move(m)); }

  // Fixed rotation, not tracked by the registry.
  void add_R_gate(std::size_t index, Axis axis, double angle) { circuit_.add_rotation_gate(index, axis, angle); }
  void add_RX_gate(std::size_t index, double angle) { add_R_gate(index, Axis::X, angle); }
  void add_RY_gate(std::size_t index, double angle) { add_R_gate(index, Axis::Y, angle); }
  void add_RZ_gate(std::size_t index, double angle) { add_R_gate(index, Axis::Z, angle); }

  // Angle recomputed from x on every run(). Defaults to x[0].
  void add_input_R_gate(std::size_t index, Axis axis, InputFunc f = default_input);
  void add_input_RX_gate(std::size_t index, InputFunc f = default_input) { add_input_R_gate(index, Axis::X, std::move(f)); }
  void add_input_RY_gate(std::size_t index, InputFunc f = default_input) { add_input_R_gate(index, Axis::Y, std::move(f)); }
  void add_input_RZ_gate(std::size_t index, InputFunc f = default_input) { add_input_R_gate(index, Axis::Z, std::move(f)); }

  // Trained angle. Returns its theta index.
  std::size_t add_parametric_R_gate(std::size_t index, Axis axis, double initial);
  std::size_t add_parametric_RX_gate(std::size_t index, double initial) { return add_parametric_R_gate(index, Axis::X, initial); }
  std::size_t add_parametric_RY_gate(std::size_t index, double initial) { return add_parametric_R_gate(index, Axis::Y, initial); }
  std::size_t add_parametric_RZ_gate(std::size_t index, double initial) { return add_parametric_R_gate(index, Axis::Z, initial); }

  // Trained angle that run() overwrites with f(current value, x). Returns its theta index.
  std::size_t add_parametric_input_R_gate(std::size_t index, Axis axis, double initial, InputFuncWithParam f = default_param_input);
  std::size_t add_parametric_input_RX_gate(std::size_t index, double initial, InputFuncWithParam f = default_param_input) {
    return add_parametric_input_R_gate(index, Axis::X, initial, std::move(f));
  }
  std::size_t add_parametric_input_RY_gate(std::size_t index, double initial, InputFuncWithParam f = default_param_input) {
    return add_parametric_input_R_gate(index, Axis::Y, initial, std::move(f));
  }
  std::size_t add_parametric_input_RZ_gate(std::size_t index, double initial, InputFuncWithParam f = default_param_input) {
    return add_parametric_input_R_gate(index, Axis::Z, initial, std::move(f));
  }

  // Input rotation at a new position whose transform reads and overwrites
  // the learning parameter `companion_theta_index`.
  void add_companion_input_R_gate(std::size_t index, Axis axis, std::size_t companion_theta_index, InputFuncWithParam f);

  static double default_input(std::span<const double> x);
  static double default_param_input(double theta, std::span<const double> x);
};

} // namespace qcl
