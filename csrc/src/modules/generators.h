// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_GENERATORS_H
#define NMTCORE_SRC_MODULES_GENERATORS_H

#include <optional>
#include <string>
#include <vector>

#include "modules/parameter_store.h"
#include "modules/primitives/layer_norm.h"
#include "modules/primitives/linear.h"
#include "utilities/tensor.h"

namespace modules {

//! What the rows returned by IGenerator::forward hold.
enum class EGeneratorOutput {
    LOG_PROBS,      ///< log-probabilities over the target vocabulary
    SCORES,         ///< unnormalised scores, normalised by sparsemax in the loss
    PROBS,          ///< probabilities (copy mixture)
    VECTORS,        ///< points in the target embedding space
};

//! Extra inputs of generators that look at the source side.
struct GeneratorContext {
    const Tensor* Attention = nullptr;              ///< (N, S) attention rows aligned with the hidden rows
    const std::vector<int>* CopyTargets = nullptr;  ///< (S * B) target vocabulary id of source token (s, b)
    int Batch = 1;                                  ///< hidden row n belongs to batch entry n % Batch
};

/**
 * @brief Output layer mapping decoder states to predictions.
 *
 * backward() recomputes intermediates from @p hidden, so forward and backward need not
 * be paired.
 */
class IGenerator {
public:
    virtual ~IGenerator() = default;

    //! (N, H) -> (N, output_size())
    [[nodiscard]] virtual Tensor forward(const Tensor& hidden, const GeneratorContext& ctx) const = 0;

    /**
     * @brief Backward pass.
     * @param hidden The input of the matching forward call.
     * @param d_output Gradient w.r.t. the forward output.
     * @param d_attention When not null, receives (adds) the gradient w.r.t. ctx.Attention.
     * @return Gradient w.r.t. @p hidden.
     */
    virtual Tensor backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                            Tensor* d_attention) = 0;

    [[nodiscard]] virtual int output_size() const = 0;
    [[nodiscard]] virtual EGeneratorOutput output_kind() const = 0;

    //! Slot of the (out, H) projection weight, shared with the decoder embeddings when tied.
    [[nodiscard]] virtual int proj_weight_slot() const = 0;
};

//! Linear + log_softmax.
class SoftmaxGenerator : public IGenerator {
public:
    SoftmaxGenerator(ParameterStore& params, const std::string& name, int hidden_size, int vocab_size, bool bias);

    [[nodiscard]] Tensor forward(const Tensor& hidden, const GeneratorContext& ctx) const override;
    Tensor backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                    Tensor* d_attention) override;

    [[nodiscard]] int output_size() const override { return mProj.config().out_features; }
    [[nodiscard]] EGeneratorOutput output_kind() const override { return EGeneratorOutput::LOG_PROBS; }
    [[nodiscard]] int proj_weight_slot() const override { return mProj.weight_slot(); }

private:
    LinearModule mProj;
};

//! Linear scores; the loss applies sparsemax.
class SparsemaxGenerator : public IGenerator {
public:
    SparsemaxGenerator(ParameterStore& params, int hidden_size, int vocab_size, bool bias);

    [[nodiscard]] Tensor forward(const Tensor& hidden, const GeneratorContext& ctx) const override;
    Tensor backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                    Tensor* d_attention) override;

    [[nodiscard]] int output_size() const override { return mProj.config().out_features; }
    [[nodiscard]] EGeneratorOutput output_kind() const override { return EGeneratorOutput::SCORES; }
    [[nodiscard]] int proj_weight_slot() const override { return mProj.weight_slot(); }

private:
    LinearModule mProj;
};

/**
 * @brief Pointer-generator output.
 *
 * p(w) = (1 - g) softmax(W h + b)_w + g * sum of the attention on source positions whose
 * token is w, with the copy gate g = sigmoid(w_g . h + b_g). The padding token gets no
 * generation mass.
 */
class CopyGenerator : public IGenerator {
public:
    CopyGenerator(ParameterStore& params, int hidden_size, int vocab_size, bool bias);

    [[nodiscard]] Tensor forward(const Tensor& hidden, const GeneratorContext& ctx) const override;
    Tensor backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                    Tensor* d_attention) override;

    [[nodiscard]] int output_size() const override { return mProj.config().out_features; }
    [[nodiscard]] EGeneratorOutput output_kind() const override { return EGeneratorOutput::PROBS; }
    [[nodiscard]] int proj_weight_slot() const override { return mProj.weight_slot(); }

private:
    void check_context(const Tensor& hidden, const GeneratorContext& ctx) const;

    LinearModule mProj;
    LinearModule mGate;
};

/**
 * @brief Regression into the target embedding space.
 *
 * Linear, or Linear-ReLU-Linear when nonlinear, optionally followed by LayerNorm.
 */
class ContinuousGenerator : public IGenerator {
public:
    ContinuousGenerator(ParameterStore& params, int hidden_size, int output_size, bool nonlinear,
                        bool layer_norm, bool bias);

    [[nodiscard]] Tensor forward(const Tensor& hidden, const GeneratorContext& ctx) const override;
    Tensor backward(const Tensor& hidden, const Tensor& d_output, const GeneratorContext& ctx,
                    Tensor* d_attention) override;

    [[nodiscard]] int output_size() const override { return mProj.config().out_features; }
    [[nodiscard]] EGeneratorOutput output_kind() const override { return EGeneratorOutput::VECTORS; }
    [[nodiscard]] int proj_weight_slot() const override { return mProj.weight_slot(); }

private:
    LinearModule mProj;
    std::optional<LinearModule> mProj2;
    std::optional<LayerNormModule> mNorm;
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_GENERATORS_H
