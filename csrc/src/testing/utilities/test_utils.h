// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "config/run_options.h"
#include "training/batch.h"
#include "training/vocab.h"
#include "utilities/tensor.h"
#include "test_config.h"

namespace testing_utils {

inline Tensor random_tensor(const std::vector<long>& shape, unsigned seed, float scale = 1.f) {
    Tensor t = Tensor::zeros(shape);
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-scale, scale);
    for (auto& v : t.Data) v = dist(rng);
    return t;
}

//! Vocabulary of the specials followed by w0 ... w{words-1}, by descending frequency.
inline Vocab make_words(int words, const std::string& prefix = "w") {
    std::map<std::string, long> counter;
    for (int i = 0; i < words; ++i) {
        counter.emplace(fmt::format("{}{}", prefix, i), words - i);
    }
    return build_vocab(counter, default_specials());
}

/**
 * @brief Source and target vocabularies of @p words tokens each.
 * @param vec_dim Width of random pretrained vectors for both sides; 0 for none.
 */
inline VocabularySet make_vocab(int words, int vec_dim = 0, unsigned seed = 7) {
    VocabularySet vocab;
    vocab.Src.Words = make_words(words);
    vocab.Tgt.Words = make_words(words);
    if (vec_dim > 0) {
        vocab.Src.Words.Vectors = random_tensor({vocab.Src.Words.size(), vec_dim}, seed);
        vocab.Tgt.Words.Vectors = random_tensor({vocab.Tgt.Words.size(), vec_dim}, seed + 1);
    }
    return vocab;
}

inline ModelOptions small_model_options() {
    const auto& cfg = testing_config::get_test_config();
    ModelOptions options;
    options.Encoder = EEncoderType::RNN;
    options.Decoder = EDecoderType::RNN;
    options.InputFeed = true;
    options.SrcWordVecSize = cfg.H;
    options.TgtWordVecSize = cfg.H;
    options.EncRnnSize = cfg.H;
    options.DecRnnSize = cfg.H;
    options.Dropout = {0.f};
    options.DropoutSteps = {0};
    return options;
}

inline TrainingOptions small_training_options() {
    TrainingOptions options;
    options.TrainSteps = 10;
    options.BatchSize = testing_config::get_test_config().B;
    options.SaveCheckpointSteps = 0;
    options.KeepCheckpoint = -1;
    options.ValidSteps = 0;
    options.ReportEvery = 1;
    options.Optim = EOptimMethod::SGD;
    options.LearningRate = 0.1f;
    options.MaxGradNorm = 5.f;
    options.Seed = 1234;
    return options;
}

/**
 * @brief Random batches over token ids [NUM_SPECIALS, NUM_SPECIALS + words).
 *
 * Source sentences have between 2 and cfg.SrcLen tokens; target sentences are framed
 * with <s> ... </s> and have between 3 and cfg.TgtLen positions.
 */
inline std::vector<Batch> make_batches(int count, int words, unsigned seed = 11) {
    const auto& cfg = testing_config::get_test_config();
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> token(NUM_SPECIALS, NUM_SPECIALS + words - 1);
    std::uniform_int_distribution<int> src_len(2, cfg.SrcLen);
    std::uniform_int_distribution<int> tgt_len(1, cfg.TgtLen - 2);

    std::vector<Batch> batches;
    for (int n = 0; n < count; ++n) {
        std::vector<std::vector<int>> src(cfg.B);
        std::vector<std::vector<int>> tgt(cfg.B);
        for (int b = 0; b < cfg.B; ++b) {
            int ls = src_len(rng);
            for (int i = 0; i < ls; ++i) src[b].push_back(token(rng));
            int lt = tgt_len(rng);
            tgt[b].push_back(BOS_INDEX);
            for (int i = 0; i < lt; ++i) tgt[b].push_back(token(rng));
            tgt[b].push_back(EOS_INDEX);
        }
        batches.push_back(make_batch(src, tgt));
    }
    return batches;
}

//! Fresh directory below the system temp directory, removed with its contents on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        static std::atomic<int> counter{0};
        mPath = std::filesystem::temp_directory_path() /
                fmt::format("nmtcore-{}-{}-{}", name, std::random_device{}(), counter++);
        std::filesystem::create_directories(mPath);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(mPath, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return mPath; }
    [[nodiscard]] std::string file(const std::string& name) const { return (mPath / name).string(); }

private:
    std::filesystem::path mPath;
};

} // namespace testing_utils
