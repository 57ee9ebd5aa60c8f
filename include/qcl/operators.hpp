// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "rng.hpp"
#include <utility>
#include <vector>

namespace qcl {

// 2x2 single-site operators.
Matrix identity_2x2();
Matrix pauli_x();
Matrix pauli_z();

// Build the 2^n x 2^n operator O_{i_0} ⊗ O_{i_1} ⊗ ... with identity on every
// untouched site (qubit 0 = least significant index bit).
Matrix make_full_operator(const std::vector<std::pair<std::size_t, Matrix>>& site_ops, std::size_t n);

// Random transverse-field Ising Hamiltonian
//   H = sum_i Jx_i X_i + sum_{i<j} J_ij Z_i Z_j,   J ~ U[-1, 1)
Matrix random_ising_hamiltonian(std::size_t n, Pcg32& rng);

// e^{-iHt} for Hermitian H, via eigendecomposition.
Matrix time_evolution_operator(const Matrix& hamiltonian, double time_step);

bool is_unitary(const Matrix& u, double tol = 1e-10);

} // namespace qcl
