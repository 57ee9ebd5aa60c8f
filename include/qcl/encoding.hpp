// SPDX-License-Identifier: MIT

#pragma once
#include "learning_circuit.hpp"
#include <vector>

namespace qcl {

// Number of features the encoder reads from each sample.
inline constexpr std::size_t kEncodedFeatures = 2;

// Input circuit for one scaled sample x in [-1, 1]^2: qubit i gets
// RY(arcsin x_k) then RZ(arccos x_k^2) with k = i mod 2.
// The angles are registry input slots, so the same circuit encodes any sample via run(x).
LearningCircuit make_encoder_circuit(std::size_t n_qubit);

// Scale the batch (min-max, per column) and run the encoder once per sample.
// Throws DimensionMismatch unless every sample has exactly kEncodedFeatures features.
std::vector<StateVector> encode_batch(const Batch& x_list, std::size_t n_qubit);

} // namespace qcl
