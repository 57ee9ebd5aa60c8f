// SPDX-License-Identifier: MIT

#include "qcl/state_vector.hpp"
#include "qcl/errors.hpp"
#include <algorithm>
#include <cmath>
#ifdef QCL_OPENMP
#include <omp.h>
#endif

namespace qcl {

StateVector::StateVector(std::size_t n) : n_(n), amp_(std::size_t(1) << n, c64{0.0, 0.0}) {
  amp_[0] = {1.0, 0.0};
}

void StateVector::apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11) {
  if (target >= n_) throw InvalidReference("target qubit " + std::to_string(target) + " out of range");
  const std::size_t N = amp_.size();
  const std::size_t mask = std::size_t(1) << target;
#ifdef QCL_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & mask) == 0) {
      const std::size_t j = i | mask;
      c64 a0 = amp_[i];
      c64 a1 = amp_[j];
      amp_[i] = u00 * a0 + u01 * a1;
      amp_[j] = u10 * a0 + u11 * a1;
    }
  }
}

void StateVector::apply_cx(std::size_t control, std::size_t target) {
  if (control >= n_ || target >= n_) throw InvalidReference("CNOT qubit out of range");
  if (control == target) return;
  const std::size_t N = amp_.size();
  const std::size_t cm = std::size_t(1) << control;
  const std::size_t tm = std::size_t(1) << target;
#ifdef QCL_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & cm) && !(i & tm)) {
      std::size_t j = i | tm;
      std::swap(amp_[i], amp_[j]);
    }
  }
}

void StateVector::apply_matrix(std::span<const std::size_t> targets, const Matrix& m) {
  const std::size_t k = targets.size();
  const std::size_t sub = std::size_t(1) << k;
  if ((std::size_t)m.rows() != sub || (std::size_t)m.cols() != sub)
    throw DimensionMismatch("dense gate is " + std::to_string(m.rows()) + "x" + std::to_string(m.cols()) +
                            " but acts on " + std::to_string(k) + " qubits");
  std::size_t tmask = 0;
  for (auto t : targets) {
    if (t >= n_) throw InvalidReference("target qubit " + std::to_string(t) + " out of range");
    if (tmask & (std::size_t(1) << t)) throw InvalidReference("target qubit " + std::to_string(t) + " repeated");
    tmask |= std::size_t(1) << t;
  }
  // offset[s] = bit pattern of sub-index s scattered onto the target qubits
  std::vector<std::size_t> offset(sub, 0);
  for (std::size_t s = 0; s < sub; ++s)
    for (std::size_t b = 0; b < k; ++b)
      if ((s >> b) & 1) offset[s] |= std::size_t(1) << targets[b];

  const std::size_t N = amp_.size();
#ifdef QCL_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t base = 0; base < N; ++base) {
    if (base & tmask) continue;
    vec_c64 in(sub), out(sub, c64{0.0, 0.0});
    for (std::size_t s = 0; s < sub; ++s) in[s] = amp_[base | offset[s]];
    for (std::size_t r = 0; r < sub; ++r)
      for (std::size_t c = 0; c < sub; ++c)
        out[r] += m(r, c) * in[c];
    for (std::size_t s = 0; s < sub; ++s) amp_[base | offset[s]] = out[s];
  }
}

c64 StateVector::inner_product(const StateVector& other) const {
  if (other.amp_.size() != amp_.size()) throw DimensionMismatch("inner product of states with different qubit counts");
  c64 acc{0.0, 0.0};
  for (std::size_t i = 0; i < amp_.size(); ++i) acc += std::conj(amp_[i]) * other.amp_[i];
  return acc;
}

double StateVector::probability_of_basis(std::size_t basis_index) const {
  return std::norm(amp_.at(basis_index));
}

double StateVector::norm_squared() const {
  double s = 0.0;
  for (auto& a : amp_) s += std::norm(a);
  return s;
}

} // namespace qcl
