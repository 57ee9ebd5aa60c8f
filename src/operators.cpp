// SPDX-License-Identifier: MIT

#include "qcl/operators.hpp"
#include "qcl/errors.hpp"
#include <Eigen/Eigenvalues>
#include <cmath>

namespace qcl {

Matrix identity_2x2(){ return Matrix::Identity(2, 2); }

Matrix pauli_x(){
  Matrix m(2, 2);
  m << c64{0,0}, c64{1,0},
       c64{1,0}, c64{0,0};
  return m;
}

Matrix pauli_z(){
  Matrix m(2, 2);
  m << c64{1,0}, c64{0,0},
       c64{0,0}, c64{-1,0};
  return m;
}

static Matrix kron2(const Matrix& A, const Matrix& B){
  Matrix K(A.rows()*B.rows(), A.cols()*B.cols());
  for (Eigen::Index i=0;i<A.rows();i++)
    for (Eigen::Index j=0;j<A.cols();j++)
      K.block(i*B.rows(), j*B.cols(), B.rows(), B.cols()) = A(i,j) * B;
  return K;
}

Matrix make_full_operator(const std::vector<std::pair<std::size_t, Matrix>>& site_ops, std::size_t n){
  std::vector<const Matrix*> site(n, nullptr);
  for (const auto& [q, op] : site_ops){
    if (q >= n) throw InvalidReference("site " + std::to_string(q) + " out of range");
    if (op.rows() != 2 || op.cols() != 2) throw DimensionMismatch("site operators must be 2x2");
    site[q] = &op;
  }
  // Highest qubit is the leftmost Kronecker factor.
  Matrix M = Matrix::Identity(1, 1);
  const Matrix I = identity_2x2();
  for (std::size_t q = n; q-- > 0;){
    M = kron2(M, site[q] ? *site[q] : I);
  }
  return M;
}

Matrix random_ising_hamiltonian(std::size_t n, Pcg32& rng){
  const std::size_t d = std::size_t(1) << n;
  Matrix ham = Matrix::Zero(d, d);
  const Matrix X = pauli_x(), Z = pauli_z();
  for (std::size_t i=0;i<n;++i){
    double jx = rng.uniform(-1.0, 1.0);
    ham += jx * make_full_operator({{i, X}}, n);
    for (std::size_t j=i+1;j<n;++j){
      double jij = rng.uniform(-1.0, 1.0);
      ham += jij * make_full_operator({{i, Z}, {j, Z}}, n);
    }
  }
  return ham;
}

Matrix time_evolution_operator(const Matrix& hamiltonian, double time_step){
  if (hamiltonian.rows() != hamiltonian.cols()) throw DimensionMismatch("Hamiltonian must be square");
  // H = P D P^dagger  ->  e^{-iHt} = P e^{-iDt} P^dagger
  Eigen::SelfAdjointEigenSolver<Matrix> eig(hamiltonian);
  if (eig.info() != Eigen::Success) throw std::runtime_error("Hamiltonian diagonalisation failed");
  const auto& vals = eig.eigenvalues();
  Eigen::Matrix<c64, Eigen::Dynamic, 1> phases(vals.size());
  for (Eigen::Index k=0;k<vals.size();++k) phases(k) = std::exp(c64{0.0, -time_step * vals(k)});
  const Matrix& P = eig.eigenvectors();
  return P * phases.asDiagonal() * P.adjoint();
}

bool is_unitary(const Matrix& u, double tol){
  if (u.rows() != u.cols()) return false;
  return (u.adjoint() * u - Matrix::Identity(u.rows(), u.cols())).cwiseAbs().maxCoeff() <= tol;
}

} // namespace qcl
