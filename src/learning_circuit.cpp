// SPDX-License-Identifier: MIT

#include "qcl/learning_circuit.hpp"
#include "qcl/errors.hpp"

namespace qcl {

// Validated before touching the registry so a rejected gate leaves no slot behind.
static void check_target(const ParametricCircuit& c, std::size_t index){
  if (index >= c.num_qubits())
    throw InvalidReference("qubit " + std::to_string(index) + " out of range for " + std::to_string(c.num_qubits()) + "-qubit circuit");
}

double LearningCircuit::default_input(std::span<const double> x){
  if (x.empty()) throw DimensionMismatch("input transform reads x[0] but x is empty");
  return x[0];
}

double LearningCircuit::default_param_input(double, std::span<const double> x){
  return default_input(x);
}

void LearningCircuit::commit(const std::vector<ParameterAssignment>& assignments){
  for (const auto& a : assignments) circuit_.set_parameter(a.position, a.angle);
}

void LearningCircuit::update_parameters(std::span<const double> theta){
  commit(registry_.apply_theta(theta));
}

StateVector LearningCircuit::run(std::span<const double> x){
  StateVector state(circuit_.num_qubits());
  commit(registry_.bind_inputs(x));
  circuit_.apply_to(state);
  return state;
}

StateVector LearningCircuit::run_x_no_change() const {
  StateVector state(circuit_.num_qubits());
  circuit_.apply_to(state);
  return state;
}

std::vector<double> LearningCircuit::backprop(std::span<const double> x, const Observable& obs){
  commit(registry_.bind_inputs(x));
  auto per_position = circuit_.backprop(obs);
  return registry_.route_gradient(per_position);
}

std::vector<double> LearningCircuit::backprop_from(const StateVector& initial, const Observable& obs) const {
  auto per_position = circuit_.backprop(initial, obs);
  return registry_.route_gradient(per_position);
}

void LearningCircuit::add_input_R_gate(std::size_t index, Axis axis, InputFunc f){
  // Input gates are parametric so that each run can rewrite the angle.
  check_target(circuit_, index);
  std::size_t pos = circuit_.parameter_count();
  registry_.add_input_slot(pos, std::move(f));
  circuit_.add_parametric_rotation_gate(index, axis, 0.0);
}

std::size_t LearningCircuit::add_parametric_R_gate(std::size_t index, Axis axis, double initial){
  check_target(circuit_, index);
  std::size_t pos = circuit_.parameter_count();
  std::size_t theta = registry_.add_learning_slot(pos, initial);
  circuit_.add_parametric_rotation_gate(index, axis, initial);
  return theta;
}

std::size_t LearningCircuit::add_parametric_input_R_gate(std::size_t index, Axis axis, double initial, InputFuncWithParam f){
  check_target(circuit_, index);
  std::size_t pos = circuit_.parameter_count();
  std::size_t theta = registry_.add_learning_input_slot(pos, initial, std::move(f));
  circuit_.add_parametric_rotation_gate(index, axis, initial);
  return theta;
}

void LearningCircuit::add_companion_input_R_gate(std::size_t index, Axis axis, std::size_t companion_theta_index, InputFuncWithParam f){
  check_target(circuit_, index);
  std::size_t pos = circuit_.parameter_count();
  registry_.add_input_slot(pos, std::move(f), companion_theta_index);
  circuit_.add_parametric_rotation_gate(index, axis, 0.0);
}

} // namespace qcl
