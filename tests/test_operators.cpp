// SPDX-License-Identifier: MIT

#include "qcl/operators.hpp"
#include "qcl/errors.hpp"
#include <cmath>
#include <iostream>

using namespace qcl;

static int fails=0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++fails; } }while(0)
#define CHECK_NEAR(a,b,e) do{ if (std::fabs((a)-(b))>(e)) { std::cerr << "Mismatch at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++fails; } }while(0)

int main(){
  // X on qubit 1 of 2 flips index bit 1
  {
    Matrix m = make_full_operator({{1, pauli_x()}}, 2);
    CHECK(m.rows() == 4 && m.cols() == 4);
    CHECK_NEAR(std::abs(m(2, 0) - c64(1, 0)), 0.0, 1e-15);
    CHECK_NEAR(std::abs(m(0, 0)), 0.0, 1e-15);
    CHECK_NEAR(std::abs(m(3, 1) - c64(1, 0)), 0.0, 1e-15);
  }

  // Z_0 Z_1 is diagonal (+1, -1, -1, +1)
  {
    Matrix zz = make_full_operator({{0, pauli_z()}, {1, pauli_z()}}, 2);
    const double d[] = {1, -1, -1, 1};
    for (int i=0;i<4;++i) CHECK_NEAR(zz(i, i).real(), d[i], 1e-15);
    CHECK(is_unitary(zz));
    bool threw = false;
    try { make_full_operator({{2, pauli_z()}}, 2); } catch (const InvalidReference&) { threw = true; }
    CHECK(threw);
  }

  // Random Ising Hamiltonian is Hermitian, its evolution unitary
  {
    Pcg32 rng(3);
    Matrix h = random_ising_hamiltonian(3, rng);
    CHECK(h.rows() == 8);
    CHECK((h - h.adjoint()).norm() < 1e-12);
    Matrix u = time_evolution_operator(h, 0.77);
    CHECK(is_unitary(u));
    Matrix id = time_evolution_operator(h, 0.0);
    CHECK((id - Matrix::Identity(8, 8)).norm() < 1e-10);

    // Same seed draws the same couplings
    Pcg32 again(3);
    CHECK((random_ising_hamiltonian(3, again) - h).norm() == 0.0);
  }

  // e^{-i t X} for H = X
  {
    double t = 0.4;
    Matrix u = time_evolution_operator(pauli_x(), t);
    CHECK_NEAR(std::abs(u(0, 0) - c64(std::cos(t), 0)), 0.0, 1e-12);
    CHECK_NEAR(std::abs(u(0, 1) - c64(0, -std::sin(t))), 0.0, 1e-12);
  }

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
