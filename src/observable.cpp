// SPDX-License-Identifier: MIT

#include "qcl/observable.hpp"
#include "qcl/errors.hpp"
#include <algorithm>

namespace qcl {

static void apply_pauli_string(StateVector& sv, const PauliTerm& term){
  c64 u00,u01,u10,u11;
  for (const auto& [q, p] : term.ops){
    gates::pauli_coeffs(p, u00,u01,u10,u11);
    sv.apply_gate_1q(q, u00,u01,u10,u11);
  }
}

void Observable::add_term(PauliTerm term){
  for (const auto& op : term.ops){
    if (op.first >= n_) throw InvalidReference("observable qubit " + std::to_string(op.first) + " out of range");
  }
  terms_.push_back(std::move(term));
}

void Observable::add_operator(double coefficient, std::size_t qubit, Axis pauli){
  add_term(PauliTerm{coefficient, {{qubit, pauli}}});
}

double Observable::expectation_value(const StateVector& state) const {
  if (state.num_qubits() != n_) throw DimensionMismatch("observable and state have different qubit counts");
  double acc = 0.0;
  for (const auto& term : terms_){
    StateVector tmp = state.copy();
    apply_pauli_string(tmp, term);
    acc += term.coefficient * std::real(state.inner_product(tmp));
  }
  return acc;
}

StateVector Observable::apply_to(const StateVector& state) const {
  if (state.num_qubits() != n_) throw DimensionMismatch("observable and state have different qubit counts");
  StateVector out(n_);
  auto& acc = out.amplitudes_mut();
  std::fill(acc.begin(), acc.end(), c64{0.0, 0.0});
  for (const auto& term : terms_){
    StateVector tmp = state.copy();
    apply_pauli_string(tmp, term);
    const auto& a = tmp.amplitudes();
    for (std::size_t i=0;i<acc.size();++i) acc[i] += term.coefficient * a[i];
  }
  return out;
}

Observable Observable::z(std::size_t n, std::size_t qubit){
  Observable o(n);
  o.add_operator(1.0, qubit, Axis::Z);
  return o;
}

std::vector<Observable> make_class_observables(std::size_t n, std::size_t num_class){
  if (num_class > n)
    throw DimensionMismatch("need at least one qubit per class: " + std::to_string(num_class) +
                            " classes, " + std::to_string(n) + " qubits");
  std::vector<Observable> obs;
  obs.reserve(num_class);
  for (std::size_t i=0;i<num_class;++i) obs.push_back(Observable::z(n, i));
  return obs;
}

} // namespace qcl
