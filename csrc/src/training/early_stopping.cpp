// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "early_stopping.h"

#include <limits>

#include <fmt/core.h>

#include "training/logging.h"

EarlyStopping::EarlyStopping(int patience, std::vector<EStoppingCriterion> criteria)
    : mPatience(patience), mCurrentTolerance(patience), mStalledTolerance(patience) {
    if (criteria.empty()) {
        criteria.push_back(EStoppingCriterion::PPL);
    }
    for (EStoppingCriterion c : criteria) {
        double init = c == EStoppingCriterion::PPL ? std::numeric_limits<double>::infinity()
                                                   : -std::numeric_limits<double>::infinity();
        mScorers.push_back({c, init});
    }
}

double EarlyStopping::score(EStoppingCriterion criterion, const Statistics& stats) {
    return criterion == EStoppingCriterion::PPL ? stats.ppl() : stats.accuracy();
}

bool EarlyStopping::is_improving(const Scorer& scorer, double value) {
    return scorer.Criterion == EStoppingCriterion::PPL ? value < scorer.Best : value > scorer.Best;
}

bool EarlyStopping::is_decreasing(const Scorer& scorer, double value) {
    return scorer.Criterion == EStoppingCriterion::PPL ? value > scorer.Best : value < scorer.Best;
}

void EarlyStopping::update(const Statistics& valid_stats, int step, TrainingRunLogger& logger) {
    if (has_stopped()) {
        return;
    }

    bool all_improving = true;
    bool all_decreasing = true;
    for (const Scorer& s : mScorers) {
        double value = score(s.Criterion, valid_stats);
        all_improving = all_improving && is_improving(s, value);
        all_decreasing = all_decreasing && is_decreasing(s, value);
    }

    if (all_improving) {
        mCurrentStepBest = step;
        for (Scorer& s : mScorers) {
            double value = score(s.Criterion, valid_stats);
            logger.log_message(step, fmt::format("Model is improving {}: {:.4f} --> {:.4f}.",
                                                 to_string(s.Criterion), s.Best, value));
            s.Best = value;
        }
        mCurrentTolerance = mPatience;
        mStalledTolerance = mPatience;
        mStatus = EStoppingStatus::IMPROVING;
        return;
    }

    if (all_decreasing) {
        --mCurrentTolerance;
        logger.log_message(step, fmt::format("Decreasing patience: {}/{}", mCurrentTolerance, mPatience));
        mStatus = EStoppingStatus::DECREASING;
        if (mCurrentTolerance <= 0) {
            mStatus = EStoppingStatus::STOPPED;
        }
        return;
    }

    --mStalledTolerance;
    logger.log_message(step, fmt::format("Stalled patience: {}/{}", mStalledTolerance, mPatience));
    if (mStalledTolerance <= 0) {
        mStatus = EStoppingStatus::STOPPED;
    }
}
