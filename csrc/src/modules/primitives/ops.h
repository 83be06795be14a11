// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_PRIMITIVES_OPS_H
#define NMTCORE_SRC_MODULES_PRIMITIVES_OPS_H

#include <cstddef>
#include <random>
#include <vector>

namespace modules {

//! Row-wise kernels shared by the layers. All operate on contiguous float rows.
namespace ops {

float dot(const float* a, const float* b, int n);
//! y += alpha * x
void axpy(float alpha, const float* x, float* y, int n);

void softmax(float* x, int n);
void log_softmax(float* x, int n);

//! Euclidean projection of @p z onto the probability simplex.
void sparsemax(const float* z, float* p, int n);

//! Sparsemax loss of the scores @p z for the gold index @p target:
//! 0.5 * sum_{j in support}(z_j^2 - tau^2) + 0.5 - z_target.
float sparsemax_loss(const float* z, int n, int target);

//! Backward of softmax given its output @p y: dx = y * (dy - sum(y * dy)).
void softmax_backward(const float* y, const float* dy, float* dx, int n);

float sigmoid(float x);

//! Inverted dropout mask of size @p n: 0 with probability @p p, 1/(1-p) otherwise.
void dropout_mask(std::vector<float>& mask, std::size_t n, float p, std::mt19937& rng);

} // namespace ops
} // namespace modules

#endif //NMTCORE_SRC_MODULES_PRIMITIVES_OPS_H
