// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_SCHEDULE_H
#define NMTCORE_SRC_TRAINING_SCHEDULE_H

#include <cmath>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include <algorithm> // std::clamp

#include "utilities/utils.h"

/**
 * @brief Interface for scalar schedules evaluated per training step.
 *
 * A schedule maps an integer step index to a float value (the learning rate).
 * The optimizer evaluates it with its decay step, which starts at 1.
 */
class ISchedule {
public:
    /** @brief Virtual destructor. */
    virtual ~ISchedule() = default;

    /**
     * @brief Evaluate the schedule at a given step.
     * @param step Current step index (>= 0).
     * @return Scheduled value for the given step.
     */
    virtual float eval(int step) const = 0;
};

//! Same value at every step.
class ConstantSchedule : public ISchedule {
public:
    explicit ConstantSchedule(float rate) : mRate(rate) {}

    float eval(int /*step*/) const override { return mRate; }

private:
    float mRate;
};

/**
 * @brief Cosine decay schedule with optional warmup and base rate floor.
 *
 * Behavior:
 * - For steps in [0, warmup): linear warmup from 0 to peak rate.
 * - For steps >= warmup: cosine interpolation from peak rate down to base rate.
 */
class CosineSchedule : public ISchedule {
public:
    /**
     * @brief Construct a cosine schedule with warmup and decay.
     * @param peak_rate Value reached after warmup and used as the cosine start.
     * @param steps Number of decay steps (denominator for progress after warmup).
     * @param warmup Number of warmup steps (linear ramp from 0 to @p peak_rate).
     * @param base_rate Minimum value at the end of cosine decay (floor).
     */
    CosineSchedule(float peak_rate, int steps, int warmup, float base_rate)
        : mWarmupSteps(warmup), mDecaySteps(std::max(steps, 1)), mPeakRate(peak_rate), mBaseRate(base_rate) {}

    float eval(int step) const override {
        if(step < mWarmupSteps) {
            return mPeakRate * step / mWarmupSteps;
        }
        double pos = (double)(step - mWarmupSteps) / mDecaySteps;
        pos = std::clamp(pos, 0.0, 1.0);
        double frac = 0.5 * std::cos(pos * std::numbers::pi) + 0.5;
        return static_cast<float>(frac * (mPeakRate - mBaseRate) + mBaseRate);
    }

private:
    int mWarmupSteps = 0;
    int mDecaySteps = 1;
    float mPeakRate;
    float mBaseRate;
};

/**
 * @brief Linear interpolation schedule with optional warmup.
 *
 * Behavior:
 * - For steps in [0, warmup): linear warmup from 0 to @p start.
 * - For steps >= warmup: linearly interpolates from @p start to @p end over @p steps,
 *   clamped to [0, 1] progress.
 */
class LinearSchedule : public ISchedule {
public:
    LinearSchedule(float start, float end, int steps, int warmup)
        : mWarmupSteps(warmup), mStart(start), mEnd(end), mDecaySteps(std::max(steps, 1)) {  }

    float eval(int step) const override {
        if(step < mWarmupSteps) {
            return mStart * step / mWarmupSteps;
        }
        double pos = (double)(step - mWarmupSteps) / mDecaySteps;
        pos = std::clamp(pos, 0.0, 1.0);
        return static_cast<float>(mStart + (mEnd-mStart) * pos);
    }

private:
    int mWarmupSteps = 0;
    float mStart;
    float mEnd;
    int mDecaySteps;
};

/**
 * @brief Inverse square root schedule of "Attention is all you need".
 *
 * rate * model_size^-0.5 * min(step^-0.5, step * warmup^-1.5); step 0 is treated as step 1.
 */
class NoamSchedule : public ISchedule {
public:
    NoamSchedule(float rate, int warmup, int model_size)
        : mRate(rate), mWarmupSteps(std::max(warmup, 1)), mModelSize(std::max(model_size, 1)) {}

    float eval(int step) const override {
        double s = std::max(step, 1);
        double factor = std::pow(mModelSize, -0.5) *
                        std::min(std::pow(s, -0.5), s * std::pow(mWarmupSteps, -1.5));
        return static_cast<float>(mRate * factor);
    }

private:
    float mRate;
    int mWarmupSteps;
    int mModelSize;
};

/**
 * @brief Piecewise constant table indexed by step.
 *
 * Stage i is active once step > thresholds[i]; later stages win. Used for the
 * accumulation count and the dropout rate.
 */
template<class T>
class StepwiseSchedule {
public:
    StepwiseSchedule(std::vector<int> thresholds, std::vector<T> values)
        : mThresholds(std::move(thresholds)), mValues(std::move(values)) {
        if (mThresholds.empty() || mThresholds.size() != mValues.size()) {
            throw config_error("Stepwise schedule needs one value per threshold");
        }
    }

    [[nodiscard]] T eval(int step) const { return mValues[active_schedule_index(mThresholds, step)]; }

    //! Value of the stage that starts exactly at @p step (step == threshold + 1, step > 1).
    [[nodiscard]] std::optional<T> changed_at(int step) const {
        if (step <= 1) return std::nullopt;
        for (std::size_t i = 0; i < mThresholds.size(); ++i) {
            if (step == mThresholds[i] + 1) return mValues[i];
        }
        return std::nullopt;
    }

private:
    std::vector<int> mThresholds;
    std::vector<T> mValues;
};

#endif //NMTCORE_SRC_TRAINING_SCHEDULE_H
