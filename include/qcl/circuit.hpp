// SPDX-License-Identifier: MIT

#pragma once
#include "state_vector.hpp"
#include "observable.hpp"
#include "gates.hpp"
#include <vector>

namespace qcl {

enum class OpType { H, X, Y, Z, S, CNOT, ROT, PARAM_ROT, DENSE };

struct Op {
  OpType type;
  std::vector<std::size_t> qubits;
  Axis axis = Axis::Z;     // ROT, PARAM_ROT
  double angle = 0.0;      // ROT
  std::size_t index = 0;   // PARAM_ROT: parameter position; DENSE: matrix slot
};

// Ordered gate list whose parametric rotations are addressed by position
// (0 .. parameter_count()-1, in insertion order).
class ParametricCircuit {
  std::size_t n_;
  std::vector<Op> ops_;
  std::vector<double> params_;
  std::vector<Matrix> matrices_;

  void check_qubit_(std::size_t q) const;
  void apply_op_(StateVector& sv, const Op& op, bool adjoint) const;

public:
  explicit ParametricCircuit(std::size_t n) : n_(n) {}
  std::size_t num_qubits() const { return n_; }

  void add_H_gate(std::size_t q);
  void add_X_gate(std::size_t q);
  void add_Y_gate(std::size_t q);
  void add_Z_gate(std::size_t q);
  void add_S_gate(std::size_t q);
  void add_CNOT_gate(std::size_t control, std::size_t target);
  void add_rotation_gate(std::size_t q, Axis axis, double angle);
  // Returns the new parameter position.
  std::size_t add_parametric_rotation_gate(std::size_t q, Axis axis, double angle);
  // targets[0] is the least significant bit of the matrix index.
  void add_dense_gate(std::vector<std::size_t> targets, Matrix m);

  std::size_t parameter_count() const { return params_.size(); }
  double get_parameter(std::size_t pos) const;
  void set_parameter(std::size_t pos, double angle);

  // Applies every op in order, in place.
  void apply_to(StateVector& sv) const;

  // d<obs>/d(param) for every parameter position, by the adjoint method,
  // starting from |0...0> or from `initial`.
  std::vector<double> backprop(const Observable& obs) const;
  std::vector<double> backprop(const StateVector& initial, const Observable& obs) const;
};

} // namespace qcl
