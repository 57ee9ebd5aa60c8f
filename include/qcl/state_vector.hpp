// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <span>

namespace qcl {

// Copyable 2^n amplitude vector. Copies are independent (deep) copies.
class StateVector {
  std::size_t n_;
  vec_c64 amp_;

public:
  // |0...0>
  explicit StateVector(std::size_t n);
  std::size_t num_qubits() const { return n_; }
  std::size_t dimension() const { return amp_.size(); }
  const vec_c64& amplitudes() const { return amp_; }
  vec_c64& amplitudes_mut() { return amp_; }

  StateVector copy() const { return *this; }

  // Single-qubit 2x2 gate on target qubit (0-indexed, LSB = qubit 0)
  void apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11);

  void apply_cx(std::size_t control, std::size_t target); // CNOT

  // Dense 2^k x 2^k matrix on `targets`; targets[0] is the least significant bit of the matrix index.
  // Targets must be distinct.
  void apply_matrix(std::span<const std::size_t> targets, const Matrix& m);

  // <this|other>
  c64 inner_product(const StateVector& other) const;
  double probability_of_basis(std::size_t basis_index) const;
  double norm_squared() const;
};

} // namespace qcl
