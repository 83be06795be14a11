// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "moving_average.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

MovingAverage::MovingAverage(float average_decay) : mDecay(average_decay) {
}

void MovingAverage::update(const modules::ParameterStore& params, int step) {
    const auto slots = params.parameters();
    if (mAverages.empty()) {
        for (int slot : slots) {
            mAverages.emplace_back(slot, params.value(slot));
        }
        return;
    }
    if (mAverages.size() != slots.size()) {
        throw std::logic_error(fmt::format("Moving average tracks {} parameters, the model has {}",
                                           mAverages.size(), slots.size()));
    }

    const float decay = std::max(mDecay, 1.f - static_cast<float>(step + 1) / static_cast<float>(step + 10));
    for (auto& [slot, avg] : mAverages) {
        const Tensor& p = params.value(slot);
        for (std::size_t i = 0; i < avg.Data.size(); ++i) {
            avg.Data[i] = (1.f - decay) * avg.Data[i] + decay * p.Data[i];
        }
    }
}

AverageSwapGuard::AverageSwapGuard(modules::ParameterStore& params, const MovingAverage* average, ETensorDType dtype)
    : mParams(&params) {
    if (!average || average->empty()) {
        return;
    }
    // copy first, so that a failure leaves the live weights untouched
    std::vector<std::pair<int, std::vector<float>>> staged;
    staged.reserve(average->averages().size());
    for (const auto& [slot, avg] : average->averages()) {
        std::vector<float> values = avg.Data;
        round_to_dtype(values.data(), values.size(), dtype);
        staged.emplace_back(slot, std::move(values));
    }
    for (auto& [slot, values] : staged) {
        std::swap(params.value(slot).Data, values);
    }
    mSwapped = std::move(staged);
}

AverageSwapGuard::~AverageSwapGuard() noexcept {
    for (auto& [slot, values] : mSwapped) {
        std::swap(mParams->value(slot).Data, values);
    }
}
