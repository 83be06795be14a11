// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "statistics.h"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "training/logging.h"
#include "utilities/comm.h"

void Statistics::update(const Statistics& other, bool update_n_src_words) {
    Loss += other.Loss;
    NWords += other.NWords;
    NCorrect += other.NCorrect;
    if (update_n_src_words) {
        NSrcWords += other.NSrcWords;
    }
}

double Statistics::xent() const {
    return NWords == 0 ? 0.0 : Loss / static_cast<double>(NWords);
}

double Statistics::ppl() const {
    return std::exp(std::min(xent(), 100.0));
}

double Statistics::accuracy() const {
    return NWords == 0 ? 0.0 : 100.0 * static_cast<double>(NCorrect) / static_cast<double>(NWords);
}

int Statistics::elapsed_ms() const {
    auto elapsed = std::chrono::steady_clock::now() - StartTime;
    return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

Statistics all_gather_stats(const Statistics& stats, Communicator& comm) {
    struct Counters {
        double Loss;
        long NWords;
        long NCorrect;
        long NSrcWords;
    };
    Counters local{stats.Loss, stats.NWords, stats.NCorrect, stats.NSrcWords};
    Statistics result;
    result.StartTime = stats.StartTime;
    for (const Counters& c : comm.host_all_gather(local)) {
        result.Loss += c.Loss;
        result.NWords += c.NWords;
        result.NCorrect += c.NCorrect;
        result.NSrcWords += c.NSrcWords;
    }
    return result;
}

ReportManager::ReportManager(int report_every, TrainingRunLogger& logger, Communicator* comm)
    : mReportEvery(std::max(report_every, 1)), mLogger(&logger), mComm(comm) {
}

Statistics ReportManager::report_training(int step, int num_steps, float learning_rate, const Statistics& stats) {
    if (step % mReportEvery != 0) {
        return stats;
    }
    const Statistics report = mComm && mComm->world_size() > 1 ? all_gather_stats(stats, *mComm) : stats;
    mLogger->log_step(step, num_steps, static_cast<float>(report.xent()), static_cast<float>(report.ppl()),
                      static_cast<float>(report.accuracy()), learning_rate, report.NSrcWords, report.NWords,
                      report.elapsed_ms());
    return Statistics{};
}

void ReportManager::report_step(float learning_rate, int step, const Statistics* train_stats, const Statistics* valid_stats) {
    if (train_stats) {
        mLogger->log_message(step, fmt::format("Train perplexity: {:.4f}, accuracy: {:.2f}, lr: {:.3e}",
                                               train_stats->ppl(), train_stats->accuracy(), learning_rate));
    }
    if (valid_stats) {
        mLogger->log_eval(step, static_cast<float>(valid_stats->xent()), static_cast<float>(valid_stats->ppl()),
                          static_cast<float>(valid_stats->accuracy()), valid_stats->elapsed_ms());
    }
}
