// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for reading and validating run configurations.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "config/run_options.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using Catch::Approx;
using namespace testing_utils;

namespace {

void write_text(const std::string& file_name, const std::string& text) {
    std::ofstream out(file_name);
    out << text;
}

} // namespace

TEST_CASE("run config is read from the model and training sections", "[config]") {
    ScratchDir dir("config");
    const std::string file = dir.file("run.json");
    write_text(file, R"({
        "model": {
            "word_vec_size": 16,
            "tgt_word_vec_size": 24,
            "rnn_size": 32,
            "generator_function": "continuous-linear",
            "dropout": [0.3, 0.1],
            "dropout_steps": [0, 1000]
        },
        "training": {
            "train_steps": 200,
            "accum_count": 4,
            "accum_steps": 0,
            "bias_policy": "drop",
            "reset_optim": "states",
            "early_stopping_criteria": ["ppl", "accuracy"],
            "learning_rate": 0.5
        }
    })");

    RunOptions options = load_run_config(file);
    REQUIRE(options.Model.SrcWordVecSize == 16);
    REQUIRE(options.Model.TgtWordVecSize == 24);
    REQUIRE(options.Model.EncRnnSize == 32);
    REQUIRE(options.Model.DecRnnSize == 32);
    REQUIRE(options.Model.Generator == EGeneratorFunction::CONTINUOUS_LINEAR);
    REQUIRE(options.Model.DropoutSteps == std::vector<int>{0, 1000});
    REQUIRE(options.Training.TrainSteps == 200);
    REQUIRE(options.Training.AccumCount == std::vector<int>{4});
    REQUIRE(options.Training.AccumSteps == std::vector<int>{0});
    REQUIRE(options.Training.BiasPolicy == EBiasPolicy::DROP);
    REQUIRE(options.Training.ResetOptim == EResetOptim::STATES);
    REQUIRE(options.Training.EarlyStoppingCriteria ==
            std::vector<EStoppingCriterion>{EStoppingCriterion::PPL, EStoppingCriterion::ACCURACY});
    REQUIRE(options.Training.LearningRate == Approx(0.5f));
    // untouched options keep their defaults
    REQUIRE(options.Training.BatchSize == TrainingOptions{}.BatchSize);
}

TEST_CASE("run config rejects bad files and values", "[config]") {
    ScratchDir dir("bad-config");
    REQUIRE_THROWS_AS(load_run_config(dir.file("missing.json")), std::runtime_error);

    write_text(dir.file("broken.json"), "{ \"model\": ");
    REQUIRE_THROWS_AS(load_run_config(dir.file("broken.json")), std::runtime_error);

    write_text(dir.file("policy.json"), R"({"training": {"bias_policy": "keep-everything"}})");
    REQUIRE_THROWS_AS(load_run_config(dir.file("policy.json")), config_error);

    write_text(dir.file("type.json"), R"({"training": {"train_steps": [1, 2]}})");
    REQUIRE_THROWS_AS(load_run_config(dir.file("type.json")), config_error);

    REQUIRE_THROWS_AS(bias_policy_from_str("unknown"), config_error);
    REQUIRE(bias_policy_from_str("Lang-Filter") == EBiasPolicy::LANGUAGE_FILTERED);
}

TEST_CASE("enumerated option names read back", "[config]") {
    REQUIRE(to_string(EOptimMethod::ADAM) == "adam");
    REQUIRE(to_string(EOptimMethod::SGD) == "sgd");
    REQUIRE(optim_method_from_str(to_string(EOptimMethod::ADAM)) == EOptimMethod::ADAM);
    for (EDecayMethod method : {EDecayMethod::NONE, EDecayMethod::COSINE, EDecayMethod::LINEAR, EDecayMethod::NOAM}) {
        REQUIRE(decay_method_from_str(to_string(method)) == method);
    }
    REQUIRE(feat_merge_from_str(to_string(EFeatMerge::SUM)) == EFeatMerge::SUM);
    REQUIRE(norm_method_from_str(to_string(ENormMethod::TOKENS)) == ENormMethod::TOKENS);
    REQUIRE_THROWS_AS(optim_method_from_str("lion"), config_error);
}

TEST_CASE("validate_options", "[config]") {
    RunOptions options;
    REQUIRE_NOTHROW(validate_options(options));

    SECTION("accumulation and truncation exclude each other") {
        options.Training.AccumCount = {1, 2};
        options.Training.AccumSteps = {0, 100};
        options.Training.TruncatedDecoder = 10;
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("accumulation lists must line up") {
        options.Training.AccumCount = {1, 2};
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("the first accumulation stage starts at 0") {
        options.Training.AccumSteps = {5};
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("dropout lists must line up") {
        options.Model.Dropout = {0.3f, 0.1f};
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("shared embeddings need equal sizes") {
        options.Model.ShareEmbeddings = true;
        options.Model.TgtWordVecSize = options.Model.SrcWordVecSize + 1;
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("shared decoder embeddings need the decoder width") {
        options.Model.ShareDecoderEmbeddings = true;
        options.Model.DecRnnSize = options.Model.TgtWordVecSize * 2;
        options.Model.EncRnnSize = options.Model.DecRnnSize;
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("copy attention needs a softmax generator") {
        options.Model.CopyAttn = true;
        options.Model.Generator = EGeneratorFunction::CONTINUOUS_NONLINEAR;
        REQUIRE_THROWS_AS(validate_options(options), config_error);
    }
    SECTION("use_lang needs a checkpoint") {
        options.Training.UseLang = "en";
        REQUIRE_THROWS_AS(validate_options(options), config_error);
        options.Training.TrainFrom = "model_step_10.pt";
        REQUIRE_NOTHROW(validate_options(options));
    }
    SECTION("single pass removes the step budget") {
        options.Training.SinglePass = true;
        validate_options(options);
        REQUIRE(options.Training.TrainSteps == 0);
    }
}

TEST_CASE("saved run config reads back", "[config]") {
    ScratchDir dir("saved-config");
    RunOptions options;
    options.Model = small_model_options();
    options.Training = small_training_options();
    options.Training.AccumCount = {1, 3};
    options.Training.AccumSteps = {0, 50};
    options.Training.BiasPolicy = EBiasPolicy::ZERO_EXCEPT_SPECIALS;
    save_run_config(options, dir.file("run.json"));

    RunOptions loaded = load_run_config(dir.file("run.json"));
    REQUIRE(loaded.Model.DecRnnSize == options.Model.DecRnnSize);
    REQUIRE(loaded.Model.Dropout == options.Model.Dropout);
    REQUIRE(loaded.Training.AccumCount == options.Training.AccumCount);
    REQUIRE(loaded.Training.AccumSteps == options.Training.AccumSteps);
    REQUIRE(loaded.Training.BiasPolicy == EBiasPolicy::ZERO_EXCEPT_SPECIALS);
    REQUIRE(loaded.Training.Seed == options.Training.Seed);
}
