// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the JSON-lines run log.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "training/logging.h"
#include "../utilities/test_utils.h"

using namespace testing_utils;

TEST_CASE("free-form text is escaped into valid JSON lines", "[logging]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    std::vector<nlohmann::json> lines;
    logger.set_callback([&](std::string_view line) { lines.push_back(nlohmann::json::parse(line)); });

    const std::string text = R"(token "quoted" and a \ backslash)";
    logger.log_message(3, text);
    logger.log_warning(4, std::string("tab\there"));
    logger.log_checkpoint(5, "/tmp/run \"a\"/model_step_5.pt", "save");
    const char* argv[] = {"nmt-train", "--config", "run \"x\".json"};
    logger.log_cmd(3, argv);
    logger.log_options({{"save_model", std::string("out/\"model\"")}, {"train_steps", std::int64_t{10}}});

    REQUIRE(lines.size() == 6);
    REQUIRE(lines[0]["log"] == "info");
    REQUIRE(lines[0]["step"] == 3);
    REQUIRE(lines[0]["message"] == text);
    REQUIRE(lines[1]["log"] == "warning");
    REQUIRE(lines[1]["message"] == "tab\there");
    REQUIRE(lines[2]["path"] == "/tmp/run \"a\"/model_step_5.pt");
    REQUIRE(lines[3]["cmd"] == nlohmann::json::array({"nmt-train", "--config", "run \"x\".json"}));
    REQUIRE(lines[4]["value"] == "out/\"model\"");
    REQUIRE(lines[5]["value"] == 10);
}

TEST_CASE("the log file stays a JSON array", "[logging]") {
    ScratchDir dir("logging");
    const std::string file = dir.file("logs/run.json");
    {
        TrainingRunLogger logger(file, 0, TrainingRunLogger::SILENT);
        logger.log_message(1, "first");
        {
            auto section = logger.log_section_start(2, "Saving \"model\"");
        }
        logger.log_message(3, "last");
    }

    std::ifstream in(file);
    nlohmann::json log = nlohmann::json::parse(in);
    REQUIRE(log.is_array());
    REQUIRE(log.size() == 3);
    REQUIRE(log[1]["message"] == "Saving \"model\"");
    REQUIRE(log[1].contains("duration_ms"));
    REQUIRE(log[2]["message"] == "last");
}

TEST_CASE("other ranks do not log", "[logging]") {
    TrainingRunLogger logger("", 1, TrainingRunLogger::SILENT);
    int calls = 0;
    logger.set_callback([&](std::string_view) { ++calls; });
    logger.log_message(1, "hidden");
    logger.log_warning(1, "hidden");
    {
        auto section = logger.log_section_start(1, "hidden");
    }
    REQUIRE(calls == 0);
}
