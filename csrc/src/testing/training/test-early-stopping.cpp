// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for training statistics, reporting and early stopping.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include "training/early_stopping.h"
#include "training/logging.h"
#include "training/statistics.h"

using Catch::Approx;

namespace {

//! Statistics over ten target words whose perplexity is exp(@p xent).
Statistics stats_with(double xent, long correct = 5) {
    Statistics stats;
    stats.NWords = 10;
    stats.Loss = xent * 10.0;
    stats.NCorrect = correct;
    return stats;
}

} // namespace

TEST_CASE("statistics derive xent, perplexity and accuracy", "[statistics]") {
    Statistics stats;
    stats.Loss = 20.0;
    stats.NWords = 10;
    stats.NCorrect = 7;
    stats.NSrcWords = 12;
    REQUIRE(stats.xent() == Approx(2.0));
    REQUIRE(stats.ppl() == Approx(std::exp(2.0)));
    REQUIRE(stats.accuracy() == Approx(70.0));

    Statistics empty;
    REQUIRE(empty.xent() == 0.0);
    REQUIRE(empty.ppl() == Approx(1.0));
    REQUIRE(empty.accuracy() == 0.0);

    Statistics huge;
    huge.Loss = 1e6;
    huge.NWords = 1;
    REQUIRE(huge.ppl() == Approx(std::exp(100.0)));

    Statistics total;
    total.update(stats);
    REQUIRE(total.NWords == 10);
    REQUIRE(total.NSrcWords == 0);
    total.update(stats, true);
    REQUIRE(total.NWords == 20);
    REQUIRE(total.NCorrect == 14);
    REQUIRE(total.NSrcWords == 12);
}

TEST_CASE("report manager logs every report_every steps", "[statistics]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    std::vector<std::string> lines;
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });
    ReportManager reports(2, logger);

    Statistics kept = reports.report_training(1, 10, 0.1f, stats_with(1.0));
    REQUIRE(lines.empty());
    REQUIRE(kept.NWords == 10);

    Statistics fresh = reports.report_training(2, 10, 0.1f, kept);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find(R"("log": "step")") != std::string::npos);
    REQUIRE(fresh.NWords == 0);
    REQUIRE(fresh.Loss == 0.0);
}

TEST_CASE("early stopping resets patience on improvement", "[early-stopping]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    EarlyStopping stopper(2, {});

    stopper.update(stats_with(2.0), 1, logger);
    REQUIRE(stopper.status() == EStoppingStatus::IMPROVING);
    REQUIRE(stopper.current_step_best() == 1);

    stopper.update(stats_with(3.0), 2, logger);
    REQUIRE(stopper.status() == EStoppingStatus::DECREASING);
    REQUIRE(stopper.current_tolerance() == 1);

    stopper.update(stats_with(1.0), 3, logger);
    REQUIRE(stopper.status() == EStoppingStatus::IMPROVING);
    REQUIRE(stopper.current_tolerance() == 2);
    REQUIRE(stopper.current_step_best() == 3);

    stopper.update(stats_with(4.0), 4, logger);
    REQUIRE_FALSE(stopper.has_stopped());
    stopper.update(stats_with(5.0), 5, logger);
    REQUIRE(stopper.has_stopped());
    REQUIRE(stopper.current_step_best() == 3);

    // a stopped stopper ignores further results
    stopper.update(stats_with(0.5), 6, logger);
    REQUIRE(stopper.has_stopped());
    REQUIRE(stopper.current_step_best() == 3);
}

TEST_CASE("early stopping on a plateau uses the stalled tolerance", "[early-stopping]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    EarlyStopping stopper(2, {EStoppingCriterion::PPL});
    stopper.update(stats_with(2.0), 1, logger);
    stopper.update(stats_with(2.0), 2, logger);
    REQUIRE_FALSE(stopper.has_stopped());
    REQUIRE(stopper.current_tolerance() == 2);
    stopper.update(stats_with(2.0), 3, logger);
    REQUIRE(stopper.has_stopped());
}

TEST_CASE("early stopping with several criteria", "[early-stopping]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    EarlyStopping stopper(1, {EStoppingCriterion::PPL, EStoppingCriterion::ACCURACY});
    stopper.update(stats_with(2.0, 5), 1, logger);
    REQUIRE(stopper.status() == EStoppingStatus::IMPROVING);

    SECTION("both improve") {
        stopper.update(stats_with(1.5, 6), 2, logger);
        REQUIRE(stopper.status() == EStoppingStatus::IMPROVING);
        REQUIRE(stopper.current_step_best() == 2);
    }
    SECTION("mixed results stall") {
        stopper.update(stats_with(1.5, 4), 2, logger);
        REQUIRE(stopper.has_stopped());
        REQUIRE(stopper.current_step_best() == 1);
    }
    SECTION("both get worse") {
        stopper.update(stats_with(2.5, 4), 2, logger);
        REQUIRE(stopper.has_stopped());
    }
}
