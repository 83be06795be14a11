// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_OPTIMIZER_H
#define NMTCORE_SRC_TRAINING_OPTIMIZER_H

#include <map>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "config/run_options.h"
#include "modules/parameter_store.h"
#include "training/schedule.h"
#include "utilities/safetensors.h"

struct Loss;

/**
 * @brief Serializable optimizer state.
 *
 * Buffers are keyed "<buffer>.<parameter name>" (exp_avg, exp_avg_sq); ParamSteps
 * holds the per-parameter update counts used for Adam bias correction.
 */
struct OptimizerState {
    std::string Method;
    int TrainingStep = 1;
    int DecayStep = 1;
    TensorMap Buffers;
    std::map<std::string, long> ParamSteps;
};

//! Scalar part of @p state; the buffers are stored as tensors.
nlohmann::json optimizer_state_to_json(const OptimizerState& state);
OptimizerState optimizer_state_from_json(const nlohmann::json& json, TensorMap buffers);

/**
 * @brief SGD or Adam over the trainable parameters of a ParameterStore.
 *
 * The training step starts at 1 and is incremented by every step(); the learning rate
 * is the schedule evaluated at the decay step.
 */
class Optimizer {
public:
    Optimizer(modules::ParameterStore& params, const TrainingOptions& options, std::unique_ptr<ISchedule> schedule);

    void zero_grad();

    //! Run the backward closure of @p loss.
    void backward(const Loss& loss);

    //! Clip the gradient norm, update the trainable parameters and advance the counters.
    void step();

    [[nodiscard]] float learning_rate() const;
    [[nodiscard]] int training_step() const { return mTrainingStep; }
    [[nodiscard]] float last_grad_norm() const { return mLastGradNorm; }

    [[nodiscard]] OptimizerState state_dict() const;
    void load_state_dict(const OptimizerState& state);

private:
    modules::ParameterStore* mParams;
    EOptimMethod mMethod;
    float mMaxGradNorm;
    float mBeta1;
    float mBeta2;
    float mEpsilon = 1e-9f;
    std::unique_ptr<ISchedule> mSchedule;

    int mTrainingStep = 1;
    int mDecayStep = 1;
    float mLastGradNorm = 0.f;

    // keyed by owning slot
    std::map<int, Tensor> mExpAvg;
    std::map<int, Tensor> mExpAvgSq;
    std::map<int, long> mSteps;
};

/**
 * @brief Learning rate schedule selected by decay_method.
 * @param model_size Hidden size used by the noam schedule.
 */
std::unique_ptr<ISchedule> make_lr_schedule(const TrainingOptions& options, int model_size);

#endif //NMTCORE_SRC_TRAINING_OPTIMIZER_H
