// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "errors.hpp"
#include <cmath>

namespace qcl {

enum class Axis { X, Y, Z };

// Converts external text ('X', 'y', ...) to an axis. Throws UnsupportedAxis otherwise.
inline Axis axis_from_char(char c){
  switch (c) {
    case 'X': case 'x': return Axis::X;
    case 'Y': case 'y': return Axis::Y;
    case 'Z': case 'z': return Axis::Z;
  }
  throw UnsupportedAxis(std::string("Unsupported rotation axis '") + c + "'");
}

} // namespace qcl

namespace qcl::gates {
  inline void X_coeffs(c64& u00, c64& u01, c64& u10, c64& u11) {
    u00 = {0,0}; u01 = {1,0}; u10 = {1,0}; u11 = {0,0};
  }
  inline void Y_coeffs(c64& u00, c64& u01, c64& u10, c64& u11) {
    // [[0, -i],[i,0]]
    u00 = {0,0}; u01 = {0,-1}; u10 = {0,1}; u11 = {0,0};
  }
  inline void Z_coeffs(c64& u00, c64& u01, c64& u10, c64& u11) {
    u00 = {1,0}; u01 = {0,0}; u10 = {0,0}; u11 = {-1,0};
  }
  inline void H_coeffs(c64& u00, c64& u01, c64& u10, c64& u11) {
    double s = 1.0/std::sqrt(2.0);
    u00 = {s,0}; u01 = {s,0}; u10 = {s,0}; u11 = {-s,0};
  }
  inline void S_coeffs(c64& u00, c64& u01, c64& u10, c64& u11){
    u00 = {1,0}; u01 = {0,0}; u10 = {0,0}; u11 = {0,1}; // diag(1, i)
  }
  inline void RX_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11){
    double c = std::cos(theta/2.0);
    double s = std::sin(theta/2.0);
    u00 = {c,0}; u01 = {0,-s}; u10 = {0,-s}; u11 = {c,0};
  }
  inline void RY_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11){
    double c = std::cos(theta/2.0);
    double s = std::sin(theta/2.0);
    u00 = {c,0}; u01 = {-s,0}; u10 = {s,0}; u11 = {c,0};
  }
  inline void RZ_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11) {
    // diag(e^{-iθ/2}, e^{iθ/2})
    double half = theta/2.0;
    u00 = { std::cos(-half), std::sin(-half) };
    u11 = { std::cos( half), std::sin( half) };
    u01 = {0,0}; u10 = {0,0};
  }

  // exp(-i θ/2 P) for P = the given axis.
  inline void rotation_coeffs(Axis axis, double theta, c64& u00, c64& u01, c64& u10, c64& u11){
    switch (axis) {
      case Axis::X: RX_coeffs(theta, u00,u01,u10,u11); return;
      case Axis::Y: RY_coeffs(theta, u00,u01,u10,u11); return;
      case Axis::Z: RZ_coeffs(theta, u00,u01,u10,u11); return;
    }
  }

  // Generator P of the rotation about `axis`.
  inline void pauli_coeffs(Axis axis, c64& u00, c64& u01, c64& u10, c64& u11){
    switch (axis) {
      case Axis::X: X_coeffs(u00,u01,u10,u11); return;
      case Axis::Y: Y_coeffs(u00,u01,u10,u11); return;
      case Axis::Z: Z_coeffs(u00,u01,u10,u11); return;
    }
  }
}
