// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_LOSS_H
#define NMTCORE_SRC_TRAINING_LOSS_H

#include <functional>
#include <optional>

#include "training/batch.h"
#include "training/statistics.h"
#include "utilities/tensor.h"

namespace models {
class NMTModel;
}

//! Normalized scalar loss of one window and the closure that backpropagates it.
struct Loss {
    float Value = 0.f;
    std::function<void()> Backward;
};

struct LossOutput {
    std::optional<Loss> Result;     ///< empty for validation
    Statistics Stats;
};

/**
 * @brief Loss of one decoder window.
 */
class ILossCompute {
public:
    virtual ~ILossCompute() = default;

    /**
     * @brief Compute the loss of the window.
     *
     * @param outputs Decoder outputs (trunc_size * B, H).
     * @param attentions Attention rows (trunc_size * B, S) aligned with @p outputs.
     * @param normalization Divisor applied to the loss and its gradients.
     * @param shard_size Number of time steps run through the generator at once; 0 for all.
     * @param trunc_start First decoder input position of the window; targets start one later.
     * @param trunc_size Number of time steps in the window.
     * @throws numerical_error If the loss is not finite.
     */
    virtual LossOutput compute(const Batch& batch, const Tensor& outputs, const Tensor& attentions,
                               float normalization, int shard_size, int trunc_start, int trunc_size) = 0;
};

/**
 * @brief Loss matching the model's generator.
 *
 * NLL for softmax and copy generators, sparsemax loss for sparsemax, and cosine
 * distance to the frozen output embedding for continuous generators. A secondary
 * generator adds its NLL over the target feature labels, weighted by
 * secondary_task_weight.
 */
class LossCompute : public ILossCompute {
public:
    LossCompute(models::NMTModel& model, bool train);

    LossOutput compute(const Batch& batch, const Tensor& outputs, const Tensor& attentions,
                       float normalization, int shard_size, int trunc_start, int trunc_size) override;

private:
    models::NMTModel* mModel;
    bool mTrain;
};

#endif //NMTCORE_SRC_TRAINING_LOSS_H
