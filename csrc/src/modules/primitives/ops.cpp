// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "ops.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

namespace modules::ops {

float dot(const float* a, const float* b, int n) {
    float s = 0.f;
    for (int i = 0; i < n; ++i) s += a[i] * b[i];
    return s;
}

void axpy(float alpha, const float* x, float* y, int n) {
    for (int i = 0; i < n; ++i) y[i] += alpha * x[i];
}

void softmax(float* x, int n) {
    float m = *std::max_element(x, x + n);
    if (m == -std::numeric_limits<float>::infinity()) {
        std::fill(x, x + n, 1.f / static_cast<float>(n));
        return;
    }
    float sum = 0.f;
    for (int i = 0; i < n; ++i) {
        x[i] = std::exp(x[i] - m);
        sum += x[i];
    }
    for (int i = 0; i < n; ++i) x[i] /= sum;
}

void log_softmax(float* x, int n) {
    float m = *std::max_element(x, x + n);
    float sum = 0.f;
    for (int i = 0; i < n; ++i) sum += std::exp(x[i] - m);
    float lse = m + std::log(sum);
    for (int i = 0; i < n; ++i) x[i] -= lse;
}

namespace {

//! Threshold tau with sparsemax(z) = max(z - tau, 0).
float sparsemax_threshold(const float* z, int n) {
    std::vector<float> sorted(z, z + n);
    std::sort(sorted.begin(), sorted.end(), std::greater<>());
    float cumsum = 0.f;
    float tau = sorted[0] - 1.f;
    for (int k = 0; k < n; ++k) {
        cumsum += sorted[k];
        float candidate = (cumsum - 1.f) / static_cast<float>(k + 1);
        if (sorted[k] > candidate) {
            tau = candidate;
        } else {
            break;
        }
    }
    return tau;
}

} // namespace

void sparsemax(const float* z, float* p, int n) {
    float tau = sparsemax_threshold(z, n);
    for (int i = 0; i < n; ++i) p[i] = std::max(z[i] - tau, 0.f);
}

float sparsemax_loss(const float* z, int n, int target) {
    float tau = sparsemax_threshold(z, n);
    float loss = 0.f;
    for (int i = 0; i < n; ++i) {
        if (z[i] > tau) loss += z[i] * z[i] - tau * tau;
    }
    return 0.5f * loss + 0.5f - z[target];
}

void softmax_backward(const float* y, const float* dy, float* dx, int n) {
    float s = dot(y, dy, n);
    for (int i = 0; i < n; ++i) dx[i] = y[i] * (dy[i] - s);
}

float sigmoid(float x) {
    return 1.f / (1.f + std::exp(-x));
}

void dropout_mask(std::vector<float>& mask, std::size_t n, float p, std::mt19937& rng) {
    if (p <= 0.f) {
        mask.assign(n, 1.f);
        return;
    }
    std::bernoulli_distribution keep(1.0 - p);
    const float scale = 1.f / (1.f - p);
    mask.resize(n);
    for (auto& m : mask) m = keep(rng) ? scale : 0.f;
}

} // namespace modules::ops
