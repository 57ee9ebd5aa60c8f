// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>
#include <Eigen/Dense>

namespace qcl {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  // Dense operators (row/col indices follow the LSB = qubit 0 convention).
  using Matrix = Eigen::Matrix<c64, Eigen::Dynamic, Eigen::Dynamic>;

  // Rows are samples, columns are features / classes.
  using Batch = std::vector<std::vector<double>>;
}
