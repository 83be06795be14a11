// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_STATISTICS_H
#define NMTCORE_SRC_TRAINING_STATISTICS_H

#include <chrono>

class Communicator;
class TrainingRunLogger;

/**
 * @brief Running loss and accuracy counters of a training or validation pass.
 */
struct Statistics {
    double Loss = 0.0;
    long NWords = 0;
    long NCorrect = 0;
    long NSrcWords = 0;
    std::chrono::steady_clock::time_point StartTime = std::chrono::steady_clock::now();

    //! Add the counters of @p other; source words only when @p update_n_src_words.
    void update(const Statistics& other, bool update_n_src_words = false);

    [[nodiscard]] double xent() const;
    [[nodiscard]] double ppl() const;
    //! Percentage of correctly predicted target tokens.
    [[nodiscard]] double accuracy() const;
    [[nodiscard]] int elapsed_ms() const;
};

//! Sum of @p stats over all ranks; every rank receives the same result.
Statistics all_gather_stats(const Statistics& stats, Communicator& comm);

/**
 * @brief Forwards training and validation statistics to the run logger.
 *
 * With a communicator, training statistics are summed over all ranks before they are
 * reported; all ranks must then call report_training() at the same steps.
 */
class ReportManager {
public:
    ReportManager(int report_every, TrainingRunLogger& logger, Communicator* comm = nullptr);

    /**
     * @brief Log @p stats when @p step is a multiple of report_every.
     * @return Fresh statistics after a report, @p stats unchanged otherwise.
     */
    Statistics report_training(int step, int num_steps, float learning_rate, const Statistics& stats);

    //! Log the training and/or validation statistics at the end of a step.
    void report_step(float learning_rate, int step, const Statistics* train_stats, const Statistics* valid_stats);

private:
    int mReportEvery;
    TrainingRunLogger* mLogger;
    Communicator* mComm;
};

#endif //NMTCORE_SRC_TRAINING_STATISTICS_H
