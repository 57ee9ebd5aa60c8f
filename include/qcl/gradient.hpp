// SPDX-License-Identifier: MIT

#pragma once
#include "learning_circuit.hpp"
#include <numbers>
#include <vector>

namespace qcl {

// Shift for rotations exp(-iθP/2); exact, not a finite-difference step.
inline constexpr double kParameterShift = std::numbers::pi / 2.0;

// d<obs>/d(theta_k) = (<obs>(theta_k + π/2) - <obs>(theta_k - π/2)) / 2 for every
// learning parameter, after binding x. Two executions per parameter; input-driven
// learning parameters report 0, as in LearningCircuit::backprop.
// The circuit's learning parameters are restored before returning.
std::vector<double> parameter_shift_gradient(LearningCircuit& circuit, std::span<const double> x, const Observable& obs);

} // namespace qcl
