// SPDX-License-Identifier: MIT

#include "qcl/circuit.hpp"
#include "qcl/operators.hpp"
#include <iostream>
#include <cmath>

using namespace qcl;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)

int main(){
  // Bell state: H 0; CNOT 0 1;
  ParametricCircuit c(2);
  c.add_H_gate(0);
  c.add_CNOT_gate(0, 1);
  StateVector sv(2);
  c.apply_to(sv);
  EXPECT_NEAR(sv.probability_of_basis(0), 0.5, 1e-12);
  EXPECT_NEAR(sv.probability_of_basis(3), 0.5, 1e-12);
  EXPECT_NEAR(sv.probability_of_basis(1), 0.0, 1e-12);
  EXPECT_NEAR(sv.probability_of_basis(2), 0.0, 1e-12);

  // Copies are independent
  StateVector cp = sv.copy();
  c.apply_to(cp);
  EXPECT_NEAR(sv.probability_of_basis(3), 0.5, 1e-12);
  EXPECT_NEAR(cp.probability_of_basis(0), 1.0, 1e-12);

  // Dense X on qubit 1 equals the X gate
  {
    StateVector a(3), b(3);
    std::size_t t[] = {1};
    a.apply_matrix(t, pauli_x());
    ParametricCircuit x(3); x.add_X_gate(1); x.apply_to(b);
    EXPECT_NEAR(a.probability_of_basis(2), 1.0, 1e-12);
    EXPECT_NEAR(b.probability_of_basis(2), 1.0, 1e-12);
  }

  // Full operator Z_0 Z_2 on 3 qubits matches the dense path on (0,2)
  {
    StateVector a(3);
    ParametricCircuit h(3); h.add_H_gate(0); h.add_H_gate(1); h.add_H_gate(2); h.apply_to(a);
    StateVector b = a.copy();
    std::size_t all[] = {0, 1, 2};
    a.apply_matrix(all, make_full_operator({{0, pauli_z()}, {2, pauli_z()}}, 3));
    ParametricCircuit zz(3); zz.add_Z_gate(0); zz.add_Z_gate(2); zz.apply_to(b);
    EXPECT_NEAR(std::abs(a.inner_product(b)), 1.0, 1e-12);
    EXPECT_NEAR(std::real(a.inner_product(b)), 1.0, 1e-12);
  }

  // Parametric rotation angle can be read and set after construction
  {
    ParametricCircuit r(1);
    std::size_t p = r.add_parametric_rotation_gate(0, Axis::Y, 0.0);
    CHECK(p == 0 && r.parameter_count() == 1);
    r.set_parameter(p, M_PI);
    EXPECT_NEAR(r.get_parameter(p), M_PI, 0.0);
    StateVector s(1); r.apply_to(s);
    EXPECT_NEAR(s.probability_of_basis(1), 1.0, 1e-12);
    bool threw = false;
    try { r.set_parameter(5, 0.0); } catch (const InvalidReference&) { threw = true; }
    CHECK(threw);
  }

  // Repeated targets are rejected by the dense path
  {
    Matrix xx = make_full_operator({{0, pauli_x()}, {1, pauli_x()}}, 2);
    ParametricCircuit d(2);
    bool threw = false;
    try { d.add_dense_gate({0, 0}, xx); } catch (const InvalidReference&) { threw = true; }
    CHECK(threw);
    StateVector s(2);
    std::size_t dup[] = {1, 1};
    threw = false;
    try { s.apply_matrix(dup, xx); } catch (const InvalidReference&) { threw = true; }
    CHECK(threw);
    EXPECT_NEAR(s.probability_of_basis(0), 1.0, 0.0);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
