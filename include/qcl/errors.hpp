// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace qcl {

// Vector or batch length does not match what the callee was built for.
struct DimensionMismatch : std::length_error {
  using std::length_error::length_error;
};

// Index names something that does not exist (theta index, qubit, parameter position).
struct InvalidReference : std::out_of_range {
  using std::out_of_range::out_of_range;
};

// Rotation axis text outside {X, Y, Z}.
struct UnsupportedAxis : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace qcl
