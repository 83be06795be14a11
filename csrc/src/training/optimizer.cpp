// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizer.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "training/loss.h"
#include "utilities/utils.h"

namespace {

void sgd_update(float* param, const float* grad, std::size_t n, float lr) {
    for (std::size_t i = 0; i < n; ++i) param[i] -= lr * grad[i];
}

void adam_update(float* param, const float* grad, float* m, float* v, std::size_t n,
                 float lr, float beta1, float beta2, float beta1_correction, float beta2_correction,
                 float epsilon) {
    for (std::size_t i = 0; i < n; ++i) {
        m[i] = beta1 * m[i] + (1.f - beta1) * grad[i];
        v[i] = beta2 * v[i] + (1.f - beta2) * grad[i] * grad[i];
        float m_hat = m[i] / beta1_correction;
        float v_hat = v[i] / beta2_correction;
        param[i] -= lr * m_hat / (std::sqrt(v_hat) + epsilon);
    }
}

} // namespace

nlohmann::json optimizer_state_to_json(const OptimizerState& state) {
    nlohmann::json json;
    json["method"] = state.Method;
    json["training_step"] = state.TrainingStep;
    json["decay_step"] = state.DecayStep;
    json["param_steps"] = nlohmann::json::object();
    for (const auto& [name, steps] : state.ParamSteps) json["param_steps"][name] = steps;
    return json;
}

OptimizerState optimizer_state_from_json(const nlohmann::json& json, TensorMap buffers) {
    OptimizerState state;
    state.Method = json.value("method", std::string{});
    state.TrainingStep = json.value("training_step", 1);
    state.DecayStep = json.value("decay_step", 1);
    if (auto it = json.find("param_steps"); it != json.end()) {
        for (const auto& [name, steps] : it->items()) state.ParamSteps[name] = steps.get<long>();
    }
    state.Buffers = std::move(buffers);
    return state;
}

Optimizer::Optimizer(modules::ParameterStore& params, const TrainingOptions& options, std::unique_ptr<ISchedule> schedule)
    : mParams(&params), mMethod(options.Optim), mMaxGradNorm(options.MaxGradNorm),
      mBeta1(options.AdamBeta1), mBeta2(options.AdamBeta2), mSchedule(std::move(schedule)) {
}

void Optimizer::zero_grad() {
    mParams->zero_grad();
}

void Optimizer::backward(const Loss& loss) {
    if (!loss.Backward) {
        throw std::logic_error("Loss has no backward function");
    }
    loss.Backward();
}

float Optimizer::learning_rate() const {
    return mSchedule->eval(mDecayStep);
}

/**
 * @brief Apply one update to all trainable parameters.
 *
 * The global L2 norm of the trainable gradients is clipped to max_grad_norm (when
 * positive) before the update. Frozen parameters are never modified.
 */
void Optimizer::step() {
    const auto slots = mParams->trainable_parameters();

    double sq = 0.0;
    for (int slot : slots) {
        for (float g : mParams->grad(slot).Data) sq += static_cast<double>(g) * g;
    }
    mLastGradNorm = static_cast<float>(std::sqrt(sq));
    float scale = 1.f;
    if (mMaxGradNorm > 0.f && mLastGradNorm > mMaxGradNorm) {
        scale = mMaxGradNorm / (mLastGradNorm + 1e-6f);
    }

    const float lr = learning_rate();
    for (int slot : slots) {
        auto& p = mParams->at(slot);
        if (scale != 1.f) {
            for (auto& g : p.Grad.Data) g *= scale;
        }
        const std::size_t n = p.Value.nelem();
        if (mMethod == EOptimMethod::SGD) {
            sgd_update(p.Value.data(), p.Grad.data(), n, lr);
            continue;
        }
        auto [m, inserted] = mExpAvg.try_emplace(slot, Tensor::zeros(p.Value.shape()));
        auto [v, _] = mExpAvgSq.try_emplace(slot, Tensor::zeros(p.Value.shape()));
        long t = ++mSteps[slot];
        float c1 = 1.f - std::pow(mBeta1, static_cast<float>(t));
        float c2 = 1.f - std::pow(mBeta2, static_cast<float>(t));
        adam_update(p.Value.data(), p.Grad.data(), m->second.data(), v->second.data(), n,
                    lr, mBeta1, mBeta2, c1, c2, mEpsilon);
    }

    ++mDecayStep;
    ++mTrainingStep;
}

OptimizerState Optimizer::state_dict() const {
    OptimizerState state;
    state.Method = std::string(to_string(mMethod));
    state.TrainingStep = mTrainingStep;
    state.DecayStep = mDecayStep;
    for (const auto& [slot, m] : mExpAvg) {
        state.Buffers.emplace("exp_avg." + mParams->name(slot), m);
    }
    for (const auto& [slot, v] : mExpAvgSq) {
        state.Buffers.emplace("exp_avg_sq." + mParams->name(slot), v);
    }
    for (const auto& [slot, steps] : mSteps) {
        state.ParamSteps.emplace(mParams->name(slot), steps);
    }
    return state;
}

/**
 * @brief Restore counters and, when present and matching, per-parameter buffers.
 *
 * Buffers of unknown parameters or with a different shape are dropped, so that
 * the optimizer of a migrated model restarts these moments from zero.
 */
void Optimizer::load_state_dict(const OptimizerState& state) {
    mTrainingStep = state.TrainingStep;
    mDecayStep = state.DecayStep;
    mExpAvg.clear();
    mExpAvgSq.clear();
    mSteps.clear();
    if (!state.Method.empty() && state.Method != to_string(mMethod)) {
        return;
    }
    for (int slot : mParams->parameters()) {
        const auto& p = mParams->at(slot);
        auto m = state.Buffers.find("exp_avg." + p.Name);
        auto v = state.Buffers.find("exp_avg_sq." + p.Name);
        if (m == state.Buffers.end() || v == state.Buffers.end()) continue;
        if (!m->second.same_shape(p.Value) || !v->second.same_shape(p.Value)) continue;
        mExpAvg.emplace(slot, m->second);
        mExpAvgSq.emplace(slot, v->second);
        if (auto s = state.ParamSteps.find(p.Name); s != state.ParamSteps.end()) {
            mSteps.emplace(slot, s->second);
        }
    }
}

std::unique_ptr<ISchedule> make_lr_schedule(const TrainingOptions& options, int model_size) {
    const float lr = options.LearningRate;
    const float final_lr = lr * options.FinalLrFraction;
    const int decay_steps = std::max(options.TrainSteps - options.WarmupSteps, 1);
    switch (options.DecayMethod) {
        case EDecayMethod::NONE:
            return std::make_unique<ConstantSchedule>(lr);
        case EDecayMethod::COSINE:
            return std::make_unique<CosineSchedule>(lr, decay_steps, options.WarmupSteps, final_lr);
        case EDecayMethod::LINEAR:
            return std::make_unique<LinearSchedule>(lr, final_lr, decay_steps, options.WarmupSteps);
        case EDecayMethod::NOAM:
            return std::make_unique<NoamSchedule>(lr, options.WarmupSteps, model_size);
    }
    throw std::logic_error(fmt::format("Unknown decay method {}", static_cast<int>(options.DecayMethod)));
}
