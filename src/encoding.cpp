// SPDX-License-Identifier: MIT

#include "qcl/encoding.hpp"
#include "qcl/errors.hpp"
#include "qcl/numeric.hpp"
#include <cmath>

namespace qcl {

static double feature(std::span<const double> x, std::size_t k){
  if (x.size() != kEncodedFeatures)
    throw DimensionMismatch("encoder expects " + std::to_string(kEncodedFeatures) +
                            " features, got " + std::to_string(x.size()));
  return x[k];
}

LearningCircuit make_encoder_circuit(std::size_t n_qubit){
  LearningCircuit u(n_qubit);
  for (std::size_t i=0;i<n_qubit;++i){
    std::size_t k = i % 2;
    u.add_input_RY_gate(i, [k](std::span<const double> x){ return std::asin(feature(x, k)); });
    u.add_input_RZ_gate(i, [k](std::span<const double> x){ double v = feature(x, k); return std::acos(v * v); });
  }
  return u;
}

std::vector<StateVector> encode_batch(const Batch& x_list, std::size_t n_qubit){
  Batch scaled = min_max_scaling(x_list);
  LearningCircuit encoder = make_encoder_circuit(n_qubit);
  std::vector<StateVector> states;
  states.reserve(scaled.size());
  for (const auto& x : scaled) states.push_back(encoder.run(x));
  return states;
}

} // namespace qcl
