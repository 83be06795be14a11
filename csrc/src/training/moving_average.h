// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_MOVING_AVERAGE_H
#define NMTCORE_SRC_TRAINING_MOVING_AVERAGE_H

#include <utility>
#include <vector>

#include "modules/parameter_store.h"
#include "utilities/dtype.h"
#include "utilities/tensor.h"

/**
 * @brief Exponential moving average of all owning parameters of a store.
 *
 * The first update copies the parameters. Later updates use
 * decay = max(average_decay, 1 - (step + 1) / (step + 10)) and
 * avg = (1 - decay) * avg + decay * param.
 */
class MovingAverage {
public:
    explicit MovingAverage(float average_decay);

    void update(const modules::ParameterStore& params, int step);

    [[nodiscard]] bool empty() const { return mAverages.empty(); }
    //! (owning slot, averaged value) in registration order.
    [[nodiscard]] const std::vector<std::pair<int, Tensor>>& averages() const { return mAverages; }

private:
    float mDecay;
    std::vector<std::pair<int, Tensor>> mAverages;
};

/**
 * @brief Swaps the averaged weights into the store for the lifetime of the guard.
 *
 * The averages are rounded to @p dtype before they are swapped in. The live weights
 * are restored bit-identically on destruction, also during stack unwinding. A null
 * or empty average makes the guard a no-op.
 */
class AverageSwapGuard {
public:
    AverageSwapGuard(modules::ParameterStore& params, const MovingAverage* average, ETensorDType dtype);
    ~AverageSwapGuard() noexcept;

    AverageSwapGuard(const AverageSwapGuard&) = delete;
    AverageSwapGuard& operator=(const AverageSwapGuard&) = delete;

    [[nodiscard]] bool active() const { return !mSwapped.empty(); }

private:
    modules::ParameterStore* mParams;
    // after construction: the live weights, keyed by owning slot
    std::vector<std::pair<int, std::vector<float>>> mSwapped;
};

#endif //NMTCORE_SRC_TRAINING_MOVING_AVERAGE_H
