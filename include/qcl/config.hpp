// SPDX-License-Identifier: MIT

#pragma once
#include "gates.hpp"
#include <cstdint>
#include <iosfwd>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace qcl {

enum class GradientMethod { ParameterShift, Adjoint };

struct ClassifierOptions {
  std::size_t nqubit = 4;      // must be >= num_class
  std::size_t c_depth = 4;
  std::size_t num_class = 3;   // one Z observable per class, on qubits 0..num_class-1
  double time_step = 0.77;     // evolution time of the random Ising layer
  uint64_t seed = 0;
  std::vector<Axis> layer_axes{Axis::X, Axis::Z, Axis::X};
  GradientMethod gradient = GradientMethod::ParameterShift;
  int report_interval = 0;     // 0: maxiter / 10
  double gtol = 1e-5;
  std::ostream* log = &std::cout; // nullptr silences progress output
};

// key=value lines, '#' starts a comment. Keys:
//   nqubit, c_depth, num_class, time_step, seed, layer_axes (e.g. XZX),
//   gradient (parameter_shift | adjoint), report_interval, gtol, verbose (true | false)
std::optional<ClassifierOptions> parse_options(std::istream& in, std::string& err);
std::optional<ClassifierOptions> load_options(const std::string& path, std::string& err);

} // namespace qcl
