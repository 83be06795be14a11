// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_EARLY_STOPPING_H
#define NMTCORE_SRC_TRAINING_EARLY_STOPPING_H

#include <vector>

#include "config/run_options.h"
#include "training/statistics.h"

class TrainingRunLogger;

enum class EStoppingStatus {
    IMPROVING,
    DECREASING,
    STOPPED,
};

/**
 * @brief Patience-based early stopping over one or more validation scorers.
 *
 * Perplexity improves when it goes down, accuracy when it goes up. A validation on
 * which every scorer improves resets the patience; one on which every scorer got
 * worse uses up the decrease tolerance; anything in between uses up the stalled
 * tolerance. Either tolerance reaching zero stops training.
 */
class EarlyStopping {
public:
    //! No criteria means perplexity only.
    EarlyStopping(int patience, std::vector<EStoppingCriterion> criteria);

    //! Evaluate the validation statistics of @p step.
    void update(const Statistics& valid_stats, int step, TrainingRunLogger& logger);

    [[nodiscard]] bool has_stopped() const { return mStatus == EStoppingStatus::STOPPED; }
    [[nodiscard]] EStoppingStatus status() const { return mStatus; }
    [[nodiscard]] int current_tolerance() const { return mCurrentTolerance; }
    [[nodiscard]] int current_step_best() const { return mCurrentStepBest; }

private:
    struct Scorer {
        EStoppingCriterion Criterion;
        double Best;
    };

    [[nodiscard]] static double score(EStoppingCriterion criterion, const Statistics& stats);
    [[nodiscard]] static bool is_improving(const Scorer& scorer, double value);
    [[nodiscard]] static bool is_decreasing(const Scorer& scorer, double value);

    int mPatience;
    int mCurrentTolerance;
    int mStalledTolerance;
    int mCurrentStepBest = 0;
    std::vector<Scorer> mScorers;
    EStoppingStatus mStatus = EStoppingStatus::IMPROVING;
};

#endif //NMTCORE_SRC_TRAINING_EARLY_STOPPING_H
