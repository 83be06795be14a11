// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "loss.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "models/nmt_model.h"
#include "modules/primitives/ops.h"
#include "training/vocab.h"
#include "utilities/utils.h"

namespace {

constexpr float COPY_EPS = 1e-20f;

struct TokenLoss {
    double Value;
    int Prediction;
};

int argmax(const float* x, int n) {
    return static_cast<int>(std::max_element(x, x + n) - x);
}

/**
 * @brief Loss of a single target token and its gradient w.r.t. the generator output row.
 *
 * @param kind What the generator row holds.
 * @param out Generator output row of size @p n.
 * @param table Frozen output embedding (V, n), only used for EGeneratorOutput::VECTORS.
 * @param d When not null, receives the gradient multiplied by @p scale.
 */
TokenLoss token_loss(modules::EGeneratorOutput kind, const float* out, int n, int target,
                     const Tensor* table, float* d, float scale) {
    using modules::EGeneratorOutput;
    switch (kind) {
        case EGeneratorOutput::LOG_PROBS: {
            if (d) d[target] = -scale;
            return {-static_cast<double>(out[target]), argmax(out, n)};
        }
        case EGeneratorOutput::SCORES: {
            double loss = modules::ops::sparsemax_loss(out, n, target);
            if (d) {
                modules::ops::sparsemax(out, d, n);
                d[target] -= 1.f;
                for (int i = 0; i < n; ++i) d[i] *= scale;
            }
            return {loss, argmax(out, n)};
        }
        case EGeneratorOutput::PROBS: {
            float p = out[target] + COPY_EPS;
            if (d) d[target] = -scale / p;
            return {-std::log(static_cast<double>(p)), argmax(out, n)};
        }
        case EGeneratorOutput::VECTORS: {
            const float* e = table->row(target);
            float norm = std::max(std::sqrt(modules::ops::dot(out, out, n)), 1e-8f);
            float cosine = modules::ops::dot(out, e, n) / norm;
            if (d) {
                for (int i = 0; i < n; ++i) {
                    d[i] = -scale * (e[i] - cosine * out[i] / norm) / norm;
                }
            }
            int best = 0;
            float best_score = -INFINITY;
            for (long v = 0; v < table->rows(); ++v) {
                float score = modules::ops::dot(table->row(v), out, n);
                if (score > best_score) {
                    best_score = score;
                    best = static_cast<int>(v);
                }
            }
            return {1.0 - cosine, best};
        }
    }
    throw std::logic_error(fmt::format("Unknown EGeneratorOutput {}. This is a programming error.", static_cast<int>(kind)));
}

//! Generator inputs and output gradients of one shard, kept for the backward closure.
struct Shard {
    long RowBegin = 0;
    Tensor Hidden;
    Tensor Attention;
    Tensor DOutput;
    Tensor DSecondary;
};

struct BackwardState {
    std::vector<Shard> Shards;
    std::vector<int> CopyTargets;
    int Batch = 1;
    long Rows = 0;
    long Hidden = 0;
    long SrcLen = 0;
    bool NeedsAttention = false;
};

void backpropagate(models::NMTModel& model, const BackwardState& state) {
    Tensor d_dec = Tensor::zeros({state.Rows, state.Hidden});
    Tensor d_attn;
    if (state.NeedsAttention) {
        d_attn = Tensor::zeros({state.Rows, state.SrcLen});
    }
    modules::IGenerator* secondary = model.secondary_generator();
    for (const Shard& shard : state.Shards) {
        modules::GeneratorContext ctx{&shard.Attention, &state.CopyTargets, state.Batch};
        Tensor d_attn_shard;
        if (state.NeedsAttention) {
            d_attn_shard = Tensor::zeros({shard.Hidden.rows(), state.SrcLen});
        }
        Tensor dh = model.generator().backward(shard.Hidden, shard.DOutput, ctx,
                                               state.NeedsAttention ? &d_attn_shard : nullptr);
        if (secondary && shard.DSecondary.has_value()) {
            Tensor dh2 = secondary->backward(shard.Hidden, shard.DSecondary, modules::GeneratorContext{}, nullptr);
            modules::ops::axpy(1.f, dh2.data(), dh.data(), static_cast<int>(dh.nelem()));
        }
        std::copy(dh.Data.begin(), dh.Data.end(), d_dec.row(shard.RowBegin));
        if (state.NeedsAttention) {
            std::copy(d_attn_shard.Data.begin(), d_attn_shard.Data.end(), d_attn.row(shard.RowBegin));
        }
    }
    model.backward(d_dec, state.NeedsAttention ? &d_attn : nullptr);
}

} // namespace

LossCompute::LossCompute(models::NMTModel& model, bool train) : mModel(&model), mTrain(train) {
}

/**
 * @brief Loss of the targets following decoder positions [trunc_start, trunc_start + trunc_size).
 *
 * The generator runs shard by shard over time steps. Padding targets contribute
 * neither loss nor gradient. In training mode the output gradients are computed
 * here, divided by @p normalization, and handed to the backward closure together
 * with the shard inputs; the closure pushes them through the generators and then
 * through the decoder and encoder.
 */
LossOutput LossCompute::compute(const Batch& batch, const Tensor& outputs, const Tensor& attentions,
                                float normalization, int shard_size, int trunc_start, int trunc_size) {
    const int B = batch.Tgt.Batch;
    if (trunc_start < 0 || trunc_size <= 0 || trunc_start + 1 + trunc_size > batch.Tgt.Len) {
        throw std::out_of_range(fmt::format("Loss window [{}, {}) outside target of length {}",
                                            trunc_start + 1, trunc_start + 1 + trunc_size, batch.Tgt.Len));
    }
    if (outputs.rows() != static_cast<long>(trunc_size) * B) {
        throw std::logic_error(fmt::format("Decoder output has {} rows, expected {}", outputs.rows(),
                                           static_cast<long>(trunc_size) * B));
    }
    if (normalization <= 0.f) {
        throw std::invalid_argument(fmt::format("Loss normalization must be positive, got {}", normalization));
    }

    modules::IGenerator& generator = mModel->generator();
    modules::IGenerator* secondary = mModel->secondary_generator();
    const bool use_secondary = secondary != nullptr && batch.Tgt.Feats > 1;
    const float secondary_weight = mModel->options().SecondaryTaskWeight;
    const auto kind = generator.output_kind();
    const Tensor* table = mModel->output_embeddings();
    if (kind == modules::EGeneratorOutput::VECTORS && !table) {
        throw std::logic_error("Continuous generator without output embeddings. This is a programming error.");
    }

    auto state = std::make_shared<BackwardState>();
    state->Batch = B;
    state->Rows = outputs.rows();
    state->Hidden = outputs.row_size();
    state->SrcLen = attentions.row_size();
    state->NeedsAttention = kind == modules::EGeneratorOutput::PROBS;
    if (state->NeedsAttention) {
        state->CopyTargets = mModel->copy_targets(batch);
    }

    const int step_shard = shard_size > 0 ? shard_size : trunc_size;
    const float scale = 1.f / normalization;
    LossOutput result;
    double total = 0.0;

    for (int t0 = 0; t0 < trunc_size; t0 += step_shard) {
        const int t1 = std::min(t0 + step_shard, trunc_size);
        Shard shard;
        shard.RowBegin = static_cast<long>(t0) * B;
        shard.Hidden = slice_rows(outputs, shard.RowBegin, static_cast<long>(t1) * B);
        shard.Attention = slice_rows(attentions, shard.RowBegin, static_cast<long>(t1) * B);

        modules::GeneratorContext ctx{&shard.Attention, &state->CopyTargets, B};
        Tensor out = generator.forward(shard.Hidden, ctx);
        const int n = static_cast<int>(out.row_size());
        if (mTrain) {
            shard.DOutput = Tensor::zeros(out.shape());
        }
        Tensor sec_out;
        if (use_secondary) {
            sec_out = secondary->forward(shard.Hidden, modules::GeneratorContext{});
            if (mTrain) shard.DSecondary = Tensor::zeros(sec_out.shape());
        }

        for (int t = t0; t < t1; ++t) {
            const int pos = trunc_start + 1 + t;
            for (int b = 0; b < B; ++b) {
                const int target = batch.Tgt.at(pos, b);
                if (target == PAD_INDEX) continue;
                const long r = static_cast<long>(t - t0) * B + b;
                TokenLoss tl = token_loss(kind, out.row(r), n, target, table,
                                          mTrain ? shard.DOutput.row(r) : nullptr, scale);
                result.Stats.Loss += tl.Value;
                result.Stats.NWords += 1;
                result.Stats.NCorrect += tl.Prediction == target ? 1 : 0;
                total += tl.Value;

                if (use_secondary) {
                    const int label = batch.Tgt.at(pos, b, 1);
                    if (mTrain) {
                        shard.DSecondary.row(r)[label] = -scale * secondary_weight;
                    }
                    total -= secondary_weight * static_cast<double>(sec_out.row(r)[label]);
                }
            }
        }
        state->Shards.push_back(std::move(shard));
    }

    if (!std::isfinite(total)) {
        throw numerical_error(fmt::format("Non-finite loss {} in window starting at {}", total, trunc_start));
    }

    if (mTrain) {
        Loss loss;
        loss.Value = static_cast<float>(total / normalization);
        loss.Backward = [model = mModel, state]() { backpropagate(*model, *state); };
        result.Result = std::move(loss);
    }
    return result;
}
