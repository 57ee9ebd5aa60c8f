// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <span>
#include <vector>

namespace qcl {

// Rescale every column independently to [-1, 1] over the whole batch.
// A constant column maps to 0. Throws DimensionMismatch on an empty or ragged batch.
Batch min_max_scaling(const Batch& x);

std::vector<double> softmax(std::span<const double> x);

// Mean multi-class cross-entropy. Probabilities are clipped to [eps, 1-eps]
// and each row renormalised before the log.
double log_loss(const Batch& y_true, const Batch& y_pred, double eps = 1e-15);

std::vector<std::size_t> argmax_rows(const Batch& m);

} // namespace qcl
