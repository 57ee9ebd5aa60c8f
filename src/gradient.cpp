// SPDX-License-Identifier: MIT

#include "qcl/gradient.hpp"

namespace qcl {

std::vector<double> parameter_shift_gradient(LearningCircuit& circuit, std::span<const double> x, const Observable& obs){
  // Bind once; the shifted executions below reuse the bound input angles.
  circuit.run(x);
  const std::vector<double> theta = circuit.get_parameters();
  const auto params = circuit.registry().learning_parameters();
  std::vector<double> grad(theta.size(), 0.0);

  auto expectation = [&](const std::vector<double>& t){
    circuit.update_parameters(t);
    return obs.expectation_value(circuit.run_x_no_change());
  };

  for (const auto& p : params){
    // input-driven angles are not trained through this path (same routing as backprop)
    if (p.is_also_input) continue;
    std::size_t k = p.theta_index;
    std::vector<double> plus = theta, minus = theta;
    plus[k]  += kParameterShift;
    minus[k] -= kParameterShift;
    grad[k] = 0.5 * (expectation(plus) - expectation(minus));
  }
  circuit.update_parameters(theta);
  return grad;
}

} // namespace qcl
