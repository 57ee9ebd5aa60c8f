// SPDX-License-Identifier: MIT

#pragma once
#include "state_vector.hpp"
#include "gates.hpp"
#include <utility>
#include <vector>

namespace qcl {

// coefficient * P_{q0} P_{q1} ...
struct PauliTerm {
  double coefficient = 1.0;
  std::vector<std::pair<std::size_t, Axis>> ops;
};

// Hermitian operator written as a real-weighted sum of Pauli strings.
class Observable {
  std::size_t n_;
  std::vector<PauliTerm> terms_;
public:
  explicit Observable(std::size_t n) : n_(n) {}
  std::size_t num_qubits() const { return n_; }
  const std::vector<PauliTerm>& terms() const { return terms_; }

  // Throws InvalidReference if a qubit index is >= num_qubits().
  void add_term(PauliTerm term);
  void add_operator(double coefficient, std::size_t qubit, Axis pauli);

  double expectation_value(const StateVector& state) const;
  // O|state>
  StateVector apply_to(const StateVector& state) const;

  static Observable z(std::size_t n, std::size_t qubit);
};

// Z on qubit i for every class i < num_class. Throws DimensionMismatch if num_class > n.
std::vector<Observable> make_class_observables(std::size_t n, std::size_t num_class);

} // namespace qcl
