// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "generators.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <fmt/core.h>

#include "modules/primitives/ops.h"
#include "training/vocab.h"

namespace modules {

SoftmaxGenerator::SoftmaxGenerator(ParameterStore& params, const std::string& name, int hidden_size, int vocab_size,
                                   bool bias)
    : mProj(params, name + ".proj", {hidden_size, vocab_size, bias}) {
}

Tensor SoftmaxGenerator::forward(const Tensor& hidden, const GeneratorContext& ctx) const {
    Tensor out = mProj.forward(hidden);
    const int V = output_size();
    for (long r = 0; r < out.rows(); ++r) ops::log_softmax(out.row(r), V);
    return out;
}

Tensor SoftmaxGenerator::backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                                  Tensor* d_attention) {
    Tensor log_probs = forward(hidden, ctx);
    const int V = output_size();
    Tensor d_scores = Tensor::zeros(log_probs.shape());
    for (long r = 0; r < log_probs.rows(); ++r) {
        const float* lp = log_probs.row(r);
        const float* g = d_output.row(r);
        float total = 0.f;
        for (int i = 0; i < V; ++i) total += g[i];
        float* dz = d_scores.row(r);
        for (int i = 0; i < V; ++i) dz[i] = g[i] - std::exp(lp[i]) * total;
    }
    return mProj.backward(hidden, d_scores);
}

SparsemaxGenerator::SparsemaxGenerator(ParameterStore& params, int hidden_size, int vocab_size, bool bias)
    : mProj(params, "generator.proj", {hidden_size, vocab_size, bias}) {
}

Tensor SparsemaxGenerator::forward(const Tensor& hidden, const GeneratorContext& ctx) const {
    return mProj.forward(hidden);
}

Tensor SparsemaxGenerator::backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                                    Tensor* d_attention) {
    return mProj.backward(hidden, d_output);
}

CopyGenerator::CopyGenerator(ParameterStore& params, int hidden_size, int vocab_size, bool bias)
    : mProj(params, "generator.proj", {hidden_size, vocab_size, bias}),
      mGate(params, "generator.copy_gate", {hidden_size, 1, true}) {
}

void CopyGenerator::check_context(const Tensor& hidden, const GeneratorContext& ctx) const {
    if (!ctx.Attention || !ctx.CopyTargets) {
        throw std::logic_error("Copy generator requires attention and source-to-target ids");
    }
    if (ctx.Attention->rows() != hidden.rows()) {
        throw std::logic_error(fmt::format("Copy generator got {} attention rows for {} states",
                                           ctx.Attention->rows(), hidden.rows()));
    }
}

Tensor CopyGenerator::forward(const Tensor& hidden, const GeneratorContext& ctx) const {
    check_context(hidden, ctx);
    const int V = output_size();
    const int S = static_cast<int>(ctx.Attention->row_size());
    Tensor out = mProj.forward(hidden);
    float gate_pre = 0.f;
    for (long r = 0; r < out.rows(); ++r) {
        float* p = out.row(r);
        p[PAD_INDEX] = -std::numeric_limits<float>::infinity();
        ops::softmax(p, V);
        mGate.forward_row(hidden.row(r), &gate_pre);
        const float g = ops::sigmoid(gate_pre);
        for (int i = 0; i < V; ++i) p[i] *= (1.f - g);

        const int b = static_cast<int>(r % ctx.Batch);
        const float* a = ctx.Attention->row(r);
        for (int s = 0; s < S; ++s) {
            p[(*ctx.CopyTargets)[static_cast<std::size_t>(s) * ctx.Batch + b]] += g * a[s];
        }
    }
    return out;
}

/**
 * @brief Backward of the copy mixture.
 *
 * With q = softmax(z) and g the gate: dq = (1 - g) dp, dg = sum_w dp_w (copy_w - q_w)
 * and da_s = g dp at the target id of source position s.
 */
Tensor CopyGenerator::backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                               Tensor* d_attention) {
    check_context(hidden, ctx);
    const int V = output_size();
    const int S = static_cast<int>(ctx.Attention->row_size());
    Tensor q = mProj.forward(hidden);
    Tensor d_hidden = Tensor::zeros(hidden.shape());
    std::vector<float> dq(V), dz(V), copy(V);
    float gate_pre = 0.f;

    for (long r = 0; r < q.rows(); ++r) {
        float* qr = q.row(r);
        qr[PAD_INDEX] = -std::numeric_limits<float>::infinity();
        ops::softmax(qr, V);
        mGate.forward_row(hidden.row(r), &gate_pre);
        const float g = ops::sigmoid(gate_pre);

        const int b = static_cast<int>(r % ctx.Batch);
        const float* a = ctx.Attention->row(r);
        const float* dp = d_output.row(r);
        std::fill(copy.begin(), copy.end(), 0.f);
        for (int s = 0; s < S; ++s) {
            int w = (*ctx.CopyTargets)[static_cast<std::size_t>(s) * ctx.Batch + b];
            copy[w] += a[s];
            if (d_attention) d_attention->row(r)[s] += g * dp[w];
        }

        float dg = 0.f;
        for (int i = 0; i < V; ++i) {
            dq[i] = (1.f - g) * dp[i];
            dg += dp[i] * (copy[i] - qr[i]);
        }
        ops::softmax_backward(qr, dq.data(), dz.data(), V);
        dz[PAD_INDEX] = 0.f;
        float dgate = dg * g * (1.f - g);

        float* dh = d_hidden.row(r);
        mProj.backward_row(hidden.row(r), dz.data(), dh);
        mGate.backward_row(hidden.row(r), &dgate, dh);
    }
    return d_hidden;
}

ContinuousGenerator::ContinuousGenerator(ParameterStore& params, int hidden_size, int output_size, bool nonlinear,
                                         bool layer_norm, bool bias)
    : mProj(params, "generator.proj", {hidden_size, output_size, bias}) {
    if (nonlinear) {
        mProj2.emplace(params, "generator.proj2", LinearModule::Config{output_size, output_size, bias});
    }
    if (layer_norm) {
        mNorm.emplace(params, "generator.layer_norm", output_size, 1e-6f);
    }
}

Tensor ContinuousGenerator::forward(const Tensor& hidden, const GeneratorContext& ctx) const {
    Tensor out = mProj.forward(hidden);
    if (mProj2) {
        for (auto& v : out.Data) v = std::max(v, 0.f);
        out = mProj2->forward(out);
    }
    if (mNorm) {
        out = mNorm->forward(out);
    }
    return out;
}

Tensor ContinuousGenerator::backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                                     Tensor* d_attention) {
    Tensor first = mProj.forward(hidden);
    Tensor grad = d_output;
    if (mProj2) {
        Tensor relu = first;
        for (auto& v : relu.Data) v = std::max(v, 0.f);
        Tensor second = mProj2->forward(relu);
        if (mNorm) grad = mNorm->backward(second, grad);
        grad = mProj2->backward(relu, grad);
        for (std::size_t i = 0; i < grad.nelem(); ++i) {
            if (first[i] <= 0.f) grad[i] = 0.f;
        }
    } else if (mNorm) {
        grad = mNorm->backward(first, grad);
    }
    return mProj.backward(hidden, grad);
}

} // namespace modules
