// SPDX-License-Identifier: MIT

#include "qcl/circuit.hpp"
#include "qcl/errors.hpp"
#include <cmath>

namespace qcl {

void ParametricCircuit::check_qubit_(std::size_t q) const {
  if (q >= n_) throw InvalidReference("qubit " + std::to_string(q) + " out of range for " + std::to_string(n_) + "-qubit circuit");
}

void ParametricCircuit::add_H_gate(std::size_t q){ check_qubit_(q); ops_.push_back({OpType::H, {q}}); }
void ParametricCircuit::add_X_gate(std::size_t q){ check_qubit_(q); ops_.push_back({OpType::X, {q}}); }
void ParametricCircuit::add_Y_gate(std::size_t q){ check_qubit_(q); ops_.push_back({OpType::Y, {q}}); }
void ParametricCircuit::add_Z_gate(std::size_t q){ check_qubit_(q); ops_.push_back({OpType::Z, {q}}); }
void ParametricCircuit::add_S_gate(std::size_t q){ check_qubit_(q); ops_.push_back({OpType::S, {q}}); }

void ParametricCircuit::add_CNOT_gate(std::size_t control, std::size_t target){
  check_qubit_(control); check_qubit_(target);
  ops_.push_back({OpType::CNOT, {control, target}});
}

void ParametricCircuit::add_rotation_gate(std::size_t q, Axis axis, double angle){
  check_qubit_(q);
  ops_.push_back({OpType::ROT, {q}, axis, angle});
}

std::size_t ParametricCircuit::add_parametric_rotation_gate(std::size_t q, Axis axis, double angle){
  check_qubit_(q);
  std::size_t pos = params_.size();
  params_.push_back(angle);
  ops_.push_back({OpType::PARAM_ROT, {q}, axis, 0.0, pos});
  return pos;
}

void ParametricCircuit::add_dense_gate(std::vector<std::size_t> targets, Matrix m){
  std::size_t seen = 0;
  for (auto t : targets){
    check_qubit_(t);
    if (seen & (std::size_t(1) << t)) throw InvalidReference("dense gate target " + std::to_string(t) + " repeated");
    seen |= std::size_t(1) << t;
  }
  const std::size_t d = std::size_t(1) << targets.size();
  if ((std::size_t)m.rows() != d || (std::size_t)m.cols() != d)
    throw DimensionMismatch("dense gate matrix must be " + std::to_string(d) + "x" + std::to_string(d));
  std::size_t slot = matrices_.size();
  matrices_.push_back(std::move(m));
  ops_.push_back({OpType::DENSE, std::move(targets), Axis::Z, 0.0, slot});
}

double ParametricCircuit::get_parameter(std::size_t pos) const {
  if (pos >= params_.size()) throw InvalidReference("parameter position " + std::to_string(pos) + " out of range");
  return params_[pos];
}

void ParametricCircuit::set_parameter(std::size_t pos, double angle){
  if (pos >= params_.size()) throw InvalidReference("parameter position " + std::to_string(pos) + " out of range");
  params_[pos] = angle;
}

void ParametricCircuit::apply_op_(StateVector& sv, const Op& op, bool adjoint) const {
  using namespace qcl::gates;
  c64 u00,u01,u10,u11;
  switch (op.type) {
    case OpType::H:
      H_coeffs(u00,u01,u10,u11); sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11); break;
    case OpType::X:
      X_coeffs(u00,u01,u10,u11); sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11); break;
    case OpType::Y:
      Y_coeffs(u00,u01,u10,u11); sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11); break;
    case OpType::Z:
      Z_coeffs(u00,u01,u10,u11); sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11); break;
    case OpType::S:
      S_coeffs(u00,u01,u10,u11);
      if (adjoint) u11 = std::conj(u11);
      sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11);
      break;
    case OpType::CNOT:
      sv.apply_cx(op.qubits[0], op.qubits[1]);
      break;
    case OpType::ROT:
      rotation_coeffs(op.axis, adjoint ? -op.angle : op.angle, u00,u01,u10,u11);
      sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11);
      break;
    case OpType::PARAM_ROT: {
      double a = params_[op.index];
      rotation_coeffs(op.axis, adjoint ? -a : a, u00,u01,u10,u11);
      sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11);
      break;
    }
    case OpType::DENSE:
      if (adjoint) sv.apply_matrix(op.qubits, matrices_[op.index].adjoint());
      else sv.apply_matrix(op.qubits, matrices_[op.index]);
      break;
  }
}

void ParametricCircuit::apply_to(StateVector& sv) const {
  if (sv.num_qubits() != n_) throw DimensionMismatch("state has " + std::to_string(sv.num_qubits()) + " qubits, circuit has " + std::to_string(n_));
  for (const auto& op : ops_) apply_op_(sv, op, false);
}

std::vector<double> ParametricCircuit::backprop(const Observable& obs) const {
  return backprop(StateVector(n_), obs);
}

std::vector<double> ParametricCircuit::backprop(const StateVector& initial, const Observable& obs) const {
  // psi = U|initial>, lambda = O psi; walk the ops backwards keeping
  // psi = state after op k and lambda = U_{k+1}^† ... U_n^† O psi.
  // For R(θ) = exp(-iθP/2): d<O>/dθ = 2 Re <lambda| (-i/2) P |psi> = Im <lambda|P|psi>.
  StateVector psi = initial.copy();
  apply_to(psi);
  StateVector lambda = obs.apply_to(psi);

  std::vector<double> grad(params_.size(), 0.0);
  c64 u00,u01,u10,u11;
  for (auto it = ops_.rbegin(); it != ops_.rend(); ++it){
    const Op& op = *it;
    if (op.type == OpType::PARAM_ROT){
      StateVector mu = psi.copy();
      gates::pauli_coeffs(op.axis, u00,u01,u10,u11);
      mu.apply_gate_1q(op.qubits[0], u00,u01,u10,u11);
      grad[op.index] = std::imag(lambda.inner_product(mu));
    }
    apply_op_(psi, op, true);
    apply_op_(lambda, op, true);
  }
  return grad;
}

} // namespace qcl
