// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for checkpoint writing, loading and retention.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/model_builder.h"
#include "models/nmt_model.h"
#include "training/checkpoint.h"
#include "training/logging.h"
#include "training/optimizer.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using Catch::Approx;
namespace fs = std::filesystem;
using namespace testing_utils;

namespace {

//! Overwrite every parameter with seeded noise so that loaded values are distinguishable from init.
void scramble(models::NMTModel& model, unsigned seed) {
    modules::ParameterStore& params = model.params();
    for (int slot : params.parameters()) {
        Tensor& t = params.value(slot);
        t.Data = random_tensor(t.shape(), seed + slot).Data;
    }
}

void require_same_state(const TensorMap& a, const TensorMap& b) {
    REQUIRE(a.size() == b.size());
    for (const auto& [name, tensor] : a) {
        INFO("parameter " << name);
        auto it = b.find(name);
        REQUIRE(it != b.end());
        REQUIRE(tensor.same_shape(it->second));
        REQUIRE(tensor.Data == it->second.Data);
    }
}

struct SaverFixture {
    ScratchDir Dir{"checkpoint"};
    TrainingRunLogger Logger{"", 0, TrainingRunLogger::SILENT};
    VocabularySet Vocab = make_vocab(testing_config::get_test_config().Words);
    ModelOptions Options = small_model_options();
    TrainingOptions Training = small_training_options();
    std::unique_ptr<models::NMTModel> Model;
    std::unique_ptr<Optimizer> Optim;

    void build() {
        Model = models::build_model(Options, Vocab, nullptr, Logger, 42);
        Optim = std::make_unique<Optimizer>(Model->params(), Training, make_lr_schedule(Training, Options.DecRnnSize));
    }

    ModelSaver saver() {
        return ModelSaver(Dir.file("model"), *Model, Vocab, Training, *Optim, Logger);
    }
};

} // namespace

TEST_CASE("checkpoint path naming", "[checkpoint]") {
    REQUIRE(get_checkpoint_path("run/model", 10) == "run/model_step_10.pt");
    REQUIRE(get_checkpoint_path("run/model", 3, true) == "run/model_sec_step_3.pt");
}

TEST_CASE("checkpoint round-trip restores parameters", "[checkpoint]") {
    SaverFixture f;
    f.build();
    scramble(*f.Model, 3);

    ModelSaver saver = f.saver();
    auto path = saver.save(7);
    REQUIRE(path.has_value());
    REQUIRE(fs::exists(*path));

    Checkpoint loaded = load_checkpoint(*path);
    REQUIRE(loaded.Step == 7);
    REQUIRE(loaded.Model.DecRnnSize == f.Options.DecRnnSize);
    REQUIRE(loaded.Training.TrainSteps == f.Training.TrainSteps);
    REQUIRE(loaded.Vocab.Tgt.Words.Itos == f.Vocab.Tgt.Words.Itos);
    REQUIRE(loaded.Optim.has_value());
    require_same_state(loaded.ModelState, f.Model->model_state_dict());
    require_same_state(loaded.Generator, f.Model->generator_state_dict());

    VocabularySet vocab = loaded.Vocab;
    auto restored = models::build_model(loaded.Model, vocab, &loaded, f.Logger, 99);
    require_same_state(restored->model_state_dict(), f.Model->model_state_dict());
    require_same_state(restored->generator_state_dict(), f.Model->generator_state_dict());
}

TEST_CASE("detached checkpoints keep only the leading rows", "[checkpoint]") {
    const auto& cfg = testing_config::get_test_config();
    SaverFixture f;
    f.Vocab = make_vocab(cfg.Words, cfg.H);
    const VocabularySet full_vocab = f.Vocab;
    f.Options.DetachedEmbeddings = true;
    f.Options.DetachedEmbeddingRows = 6;
    f.Options.PreWordVecsEnc = true;
    f.Options.PreWordVecsDec = true;
    f.build();
    REQUIRE_FALSE(f.Vocab.Tgt.Words.has_vectors());
    scramble(*f.Model, 5);

    ModelSaver saver = f.saver();
    Checkpoint loaded = load_checkpoint(*saver.save(1));
    const Tensor& src_lut = loaded.ModelState.at("encoder.embeddings.word_lut.weight");
    REQUIRE(src_lut.rows() == 6);
    REQUIRE(loaded.Generator.at("proj.weight").rows() == 6);
    REQUIRE(loaded.ModelState.at("decoder.embeddings.word_lut.weight").rows() == 6);

    // rows beyond the stored ones come from the vocabulary vectors
    VocabularySet vocab = full_vocab;
    auto restored = models::build_model(loaded.Model, vocab, &loaded, f.Logger, 1);
    const Tensor& table = restored->params().value(restored->src_word_slot());
    const Tensor& live = f.Model->params().value(f.Model->src_word_slot());
    for (long r = 0; r < table.rows(); ++r) {
        for (long c = 0; c < table.row_size(); ++c) {
            if (r < 6) {
                REQUIRE(table.row(r)[c] == live.row(r)[c]);
            } else {
                REQUIRE(table.row(r)[c] == full_vocab.Src.Words.Vectors.row(r)[c]);
            }
        }
    }
}

TEST_CASE("saving the same step twice is a no-op", "[checkpoint]") {
    SaverFixture f;
    f.build();
    ModelSaver saver = f.saver();

    auto first = saver.save(5);
    REQUIRE(first.has_value());
    auto written = fs::last_write_time(*first);

    REQUIRE_FALSE(saver.save(5).has_value());
    REQUIRE(fs::last_write_time(*first) == written);
    REQUIRE(saver.checkpoint_queue().size() == 1);
    REQUIRE(saver.last_saved_step() == 5);
}

TEST_CASE("retention removes the oldest checkpoint first", "[checkpoint]") {
    SaverFixture f;
    f.Training.KeepCheckpoint = 2;
    f.build();
    ModelSaver saver = f.saver();

    auto p1 = saver.save(1);
    auto p2 = saver.save(2);
    auto p3 = saver.save(3);
    REQUIRE_FALSE(fs::exists(*p1));
    REQUIRE(fs::exists(*p2));
    REQUIRE(fs::exists(*p3));
    REQUIRE(saver.checkpoint_queue() == std::deque<std::string>{*p2, *p3});
    REQUIRE(get_all_checkpoints(f.Dir.file("model")).size() == 2);
    REQUIRE(find_latest_checkpoint(f.Dir.file("model")) == *p3);
}

TEST_CASE("keep_checkpoint 0 disables saving", "[checkpoint]") {
    SaverFixture f;
    f.Training.KeepCheckpoint = 0;
    f.build();
    ModelSaver saver = f.saver();
    REQUIRE_FALSE(saver.save(1).has_value());
    REQUIRE(get_all_checkpoints(f.Dir.file("model")).empty());
    REQUIRE_FALSE(find_latest_checkpoint(f.Dir.file("model")).has_value());
}

TEST_CASE("reset_optim controls the stored optimizer state", "[checkpoint]") {
    SaverFixture f;
    f.Training.Optim = EOptimMethod::ADAM;
    f.build();

    // give the optimizer some moments
    for (int slot : f.Model->params().trainable_parameters()) {
        Tensor& g = f.Model->params().grad(slot);
        g.Data = random_tensor(g.shape(), 17 + slot, 0.01f).Data;
    }
    f.Optim->step();
    REQUIRE(f.Optim->training_step() == 2);

    SECTION("none keeps everything") {
        Checkpoint ckpt = f.saver().make_checkpoint(1);
        REQUIRE(ckpt.Optim.has_value());
        REQUIRE(ckpt.Optim->TrainingStep == 2);
        REQUIRE_FALSE(ckpt.Optim->Buffers.empty());
    }
    SECTION("states keeps the counters only") {
        f.Training.ResetOptim = EResetOptim::STATES;
        Checkpoint ckpt = f.saver().make_checkpoint(1);
        REQUIRE(ckpt.Optim.has_value());
        REQUIRE(ckpt.Optim->TrainingStep == 2);
        REQUIRE(ckpt.Optim->Buffers.empty());
        REQUIRE(ckpt.Optim->ParamSteps.empty());
    }
    SECTION("all drops the state") {
        f.Training.ResetOptim = EResetOptim::ALL;
        Checkpoint ckpt = f.saver().make_checkpoint(1);
        REQUIRE_FALSE(ckpt.Optim.has_value());
    }
}

TEST_CASE("optimizer state survives a checkpoint", "[checkpoint]") {
    SaverFixture f;
    f.Training.Optim = EOptimMethod::ADAM;
    f.build();
    for (int slot : f.Model->params().trainable_parameters()) {
        Tensor& g = f.Model->params().grad(slot);
        g.Data = random_tensor(g.shape(), 3 + slot, 0.01f).Data;
    }
    f.Optim->step();
    f.Optim->step();

    ModelSaver saver = f.saver();
    Checkpoint loaded = load_checkpoint(*saver.save(2));
    REQUIRE(loaded.Optim.has_value());

    Optimizer other(f.Model->params(), f.Training, make_lr_schedule(f.Training, f.Options.DecRnnSize));
    other.load_state_dict(*loaded.Optim);
    REQUIRE(other.training_step() == 3);
    REQUIRE(other.learning_rate() == Approx(f.Optim->learning_rate()));
    OptimizerState a = f.Optim->state_dict();
    OptimizerState b = other.state_dict();
    REQUIRE(a.ParamSteps == b.ParamSteps);
    require_same_state(a.Buffers, b.Buffers);
}

TEST_CASE("loading rejects missing and foreign files", "[checkpoint]") {
    ScratchDir dir("bad-checkpoint");
    REQUIRE_THROWS_AS(load_checkpoint(dir.file("missing.pt")), checkpoint_error);

    TensorMap tensors;
    tensors.emplace("x", Tensor::zeros({2}));
    write_safetensors(dir.file("foreign.pt"), tensors, nlohmann::json{{"format", "something-else"}});
    REQUIRE_THROWS_AS(load_checkpoint(dir.file("foreign.pt")), checkpoint_error);

    write_safetensors(dir.file("future.pt"), tensors, nlohmann::json{{"format", CHECKPOINT_FORMAT}, {"version", 99}});
    REQUIRE_THROWS_AS(load_checkpoint(dir.file("future.pt")), checkpoint_error);
}
