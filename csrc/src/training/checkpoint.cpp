// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "models/nmt_model.h"
#include "training/logging.h"
#include "training/moving_average.h"
#include "utilities/utils.h"

namespace {

constexpr const char* MODEL_PREFIX = "model.";
constexpr const char* GENERATOR_PREFIX = "generator.";
constexpr const char* SECONDARY_PREFIX = "secondary_generator.";
constexpr const char* OPTIM_PREFIX = "optim.";
constexpr const char* VOCAB_PREFIX = "vocab";

void add_prefixed(TensorMap& dst, const TensorMap& src, const std::string& prefix) {
    for (const auto& [name, tensor] : src) {
        dst.emplace(prefix + name, tensor);
    }
}

TensorMap take_prefixed(const TensorMap& src, const std::string& prefix) {
    TensorMap result;
    for (const auto& [name, tensor] : src) {
        if (name.starts_with(prefix)) {
            result.emplace(name.substr(prefix.size()), tensor);
        }
    }
    return result;
}

void keep_leading_rows(TensorMap& state, const std::string& name, long rows) {
    auto it = state.find(name);
    if (it == state.end() || it->second.rows() <= rows) return;
    it->second = slice_rows(it->second, 0, rows);
}

} // namespace

std::string get_checkpoint_path(const std::string& base_path, int step, bool only_sec) {
    return fmt::format("{}_{}step_{}.pt", base_path, only_sec ? "sec_" : "", step);
}

/**
 * @brief Serialize a checkpoint into a single tensor container file.
 *
 * Tensors are stored under "model.", "generator.", "secondary_generator." and "optim."
 * prefixes, vocabulary vectors under "vocab."; everything else goes into the metadata.
 *
 * @throws checkpoint_error If the directory cannot be created or the file cannot be written.
 */
void write_checkpoint(const Checkpoint& checkpoint, const std::string& file_name) {
    std::filesystem::path parent = std::filesystem::path(file_name).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw checkpoint_error(fmt::format("Could not create checkpoint directory {}: {}", parent.string(), ec.message()));
        }
    }

    TensorMap tensors;
    add_prefixed(tensors, checkpoint.ModelState, MODEL_PREFIX);
    add_prefixed(tensors, checkpoint.Generator, GENERATOR_PREFIX);
    if (checkpoint.SecondaryGenerator) {
        add_prefixed(tensors, *checkpoint.SecondaryGenerator, SECONDARY_PREFIX);
    }

    nlohmann::json meta;
    meta["format"] = CHECKPOINT_FORMAT;
    meta["version"] = CHECKPOINT_VERSION;
    meta["step"] = checkpoint.Step;
    meta["options"] = {{"model", model_options_to_json(checkpoint.Model)},
                       {"training", training_options_to_json(checkpoint.Training)}};
    meta["vocab"] = vocabulary_set_to_json(checkpoint.Vocab, tensors, VOCAB_PREFIX);
    meta["secondary_generator"] = checkpoint.SecondaryGenerator.has_value();
    if (checkpoint.Optim) {
        meta["optim"] = optimizer_state_to_json(*checkpoint.Optim);
        add_prefixed(tensors, checkpoint.Optim->Buffers, OPTIM_PREFIX);
    } else {
        meta["optim"] = nullptr;
    }

    write_safetensors(file_name, tensors, meta);
}

Checkpoint load_checkpoint(const std::string& file_name) {
    if (!std::filesystem::exists(file_name)) {
        throw checkpoint_error("Checkpoint not found: " + file_name);
    }
    SafeTensorsContents contents = read_safetensors(file_name);
    const nlohmann::json& meta = contents.MetaData;

    try {
        if (meta.value("format", std::string{}) != CHECKPOINT_FORMAT) {
            throw checkpoint_error(fmt::format("{} is not an nmtcore checkpoint", file_name));
        }
        if (int version = meta.at("version").get<int>(); version != CHECKPOINT_VERSION) {
            throw checkpoint_error(fmt::format("Unsupported checkpoint version {} in {}, expected {}",
                                               version, file_name, CHECKPOINT_VERSION));
        }

        Checkpoint checkpoint;
        checkpoint.Step = meta.at("step").get<int>();
        checkpoint.Model = model_options_from_json(meta.at("options").at("model"));
        checkpoint.Training = training_options_from_json(meta.at("options").at("training"));
        checkpoint.Vocab = vocabulary_set_from_json(meta.at("vocab"), contents.Tensors, VOCAB_PREFIX);
        checkpoint.ModelState = take_prefixed(contents.Tensors, MODEL_PREFIX);
        checkpoint.Generator = take_prefixed(contents.Tensors, GENERATOR_PREFIX);
        if (meta.value("secondary_generator", false)) {
            checkpoint.SecondaryGenerator = take_prefixed(contents.Tensors, SECONDARY_PREFIX);
        }
        if (auto it = meta.find("optim"); it != meta.end() && !it->is_null()) {
            checkpoint.Optim = optimizer_state_from_json(*it, take_prefixed(contents.Tensors, OPTIM_PREFIX));
        }
        return checkpoint;
    } catch (const nlohmann::json::exception& e) {
        throw checkpoint_error(fmt::format("Invalid checkpoint metadata in {}: {}", file_name, e.what()));
    } catch (const config_error& e) {
        throw checkpoint_error(fmt::format("Invalid options stored in {}: {}", file_name, e.what()));
    }
}

std::vector<int> get_all_checkpoints(const std::string& base_path) {
    std::filesystem::path base(base_path);
    std::filesystem::path dir = base.parent_path().empty() ? std::filesystem::path(".") : base.parent_path();
    const std::string prefix = base.filename().string() + "_step_";
    if (!std::filesystem::exists(dir)) {
        return {};
    }
    std::vector<int> steps;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (!name.starts_with(prefix) || !name.ends_with(".pt")) continue;
        std::string number = name.substr(prefix.size(), name.size() - prefix.size() - 3);
        if (number.empty() || !std::all_of(number.begin(), number.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            continue;
        }
        steps.push_back(std::stoi(number));
    }
    return steps;
}

std::optional<std::string> find_latest_checkpoint(const std::string& base_path) {
    auto steps = get_all_checkpoints(base_path);
    if (steps.empty()) {
        return std::nullopt;
    }
    return get_checkpoint_path(base_path, *std::max_element(steps.begin(), steps.end()));
}

ModelSaver::ModelSaver(std::string base_path, models::NMTModel& model, const VocabularySet& vocab,
                       const TrainingOptions& training, const Optimizer& optim, TrainingRunLogger& logger)
    : mBasePath(std::move(base_path)), mModel(&model), mVocab(&vocab), mTraining(&training), mOptim(&optim),
      mLogger(&logger), mKeepCheckpoint(training.KeepCheckpoint) {
}

/**
 * @brief Build the checkpoint record from the current model and optimizer state.
 *
 * Applies the optimizer retention policy, truncates the vocabulary-indexed tables
 * to their first detached_embedding_rows rows in detached mode and prunes unknown
 * aliases from the persisted vocabulary.
 */
Checkpoint ModelSaver::make_checkpoint(int step) const {
    const ModelOptions& options = mModel->options();
    Checkpoint checkpoint;
    checkpoint.Step = step;
    checkpoint.Model = options;
    checkpoint.Training = *mTraining;
    checkpoint.ModelState = mModel->model_state_dict();
    checkpoint.Generator = mModel->generator_state_dict();
    if (mModel->secondary_generator()) {
        checkpoint.SecondaryGenerator = mModel->secondary_generator_state_dict();
    }

    if (options.DetachedEmbeddings) {
        const long rows = options.DetachedEmbeddingRows;
        keep_leading_rows(checkpoint.ModelState, "encoder.embeddings.word_lut.weight", rows);
        keep_leading_rows(checkpoint.ModelState, "decoder.embeddings.word_lut.weight", rows);
        keep_leading_rows(checkpoint.ModelState, models::OUTPUT_EMBEDDING_NAME, rows);
        if (!is_continuous(options.Generator)) {
            keep_leading_rows(checkpoint.Generator, "proj.weight", rows);
        }
    }

    switch (mTraining->ResetOptim) {
        case EResetOptim::NONE:
            checkpoint.Optim = mOptim->state_dict();
            break;
        case EResetOptim::STATES: {
            OptimizerState state = mOptim->state_dict();
            state.Buffers.clear();
            state.ParamSteps.clear();
            checkpoint.Optim = std::move(state);
            break;
        }
        case EResetOptim::ALL:
            break;
    }

    checkpoint.Vocab = *mVocab;
    checkpoint.Vocab.Src.Words.prune_unknown_aliases();
    checkpoint.Vocab.Tgt.Words.prune_unknown_aliases();
    return checkpoint;
}

std::optional<std::string> ModelSaver::save(int step, const MovingAverage* moving_average) {
    if (mKeepCheckpoint == 0 || mLastSavedStep == step) {
        return std::nullopt;
    }

    Checkpoint checkpoint;
    {
        AverageSwapGuard swap(mModel->params(), moving_average, ETensorDType::FP32);
        checkpoint = make_checkpoint(step);
    }

    const std::string path = get_checkpoint_path(mBasePath, step, mTraining->TrainOnlySecTask);
    mLogger->log_checkpoint(step, path, "saving");
    write_checkpoint(checkpoint, path);
    mLastSavedStep = step;

    if (mKeepCheckpoint > 0) {
        if (static_cast<int>(mQueue.size()) == mKeepCheckpoint) {
            std::string oldest = std::move(mQueue.front());
            mQueue.pop_front();
            std::error_code ec;
            std::filesystem::remove(oldest, ec);
            if (ec) {
                throw checkpoint_error(fmt::format("Could not remove old checkpoint {}: {}", oldest, ec.message()));
            }
            mLogger->log_checkpoint(step, oldest, "removed");
        }
        mQueue.push_back(path);
    }
    return path;
}
