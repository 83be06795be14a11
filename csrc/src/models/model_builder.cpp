// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "model_builder.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>

#include <fmt/core.h>

#include "models/weight_mapping.h"
#include "training/checkpoint.h"
#include "training/logging.h"
#include "utilities/utils.h"

namespace models {

namespace {

const std::string SRC_WORD_LUT = "encoder.embeddings.word_lut.weight";
const std::string TGT_WORD_LUT = "decoder.embeddings.word_lut.weight";
const std::string GENERATOR_PROJ = "generator.proj.weight";

int output_vector_size(const ModelOptions& options, const VocabularySet& vocab, const Checkpoint* checkpoint) {
    if (!is_continuous(options.Generator)) {
        return -1;
    }
    if (vocab.Tgt.Words.has_vectors()) {
        return static_cast<int>(vocab.Tgt.Words.Vectors.row_size());
    }
    if (checkpoint) {
        if (auto it = checkpoint->ModelState.find(OUTPUT_EMBEDDING_NAME); it != checkpoint->ModelState.end()) {
            return static_cast<int>(it->second.row_size());
        }
    }
    throw config_error(fmt::format("generator_function '{}' requires target vocabulary vectors",
                                   to_string(options.Generator)));
}

int secondary_vocab_size(const ModelOptions& options, const VocabularySet& vocab, TrainingRunLogger& logger) {
    if (!options.MultiTask) {
        return 0;
    }
    if (vocab.Tgt.Features.empty()) {
        logger.log_warning(0, "multi_task is set but the target side has no feature labels; ignoring");
        return 0;
    }
    return vocab.Tgt.Features.front().size();
}

//! Copy the vocabulary vectors of one side into its word table, rows [first_row, V).
void copy_vectors(Tensor& table, const Vocab& words, long first_row, const char* side) {
    const Tensor& vectors = words.Vectors;
    if (vectors.rows() != table.rows() || vectors.row_size() != table.row_size()) {
        throw config_error(fmt::format("{} vectors have shape {}, the word table has {}",
                                       side, shape_to_str(vectors), shape_to_str(table)));
    }
    for (long r = first_row; r < table.rows(); ++r) {
        std::copy_n(vectors.row(r), table.row_size(), table.row(r));
    }
}

//! Centered (optional) and L2-normalized copy of @p vectors.
Tensor unit_norm_table(const Tensor& vectors, bool center) {
    Tensor table = vectors;
    const long rows = table.rows();
    const long dim = table.row_size();
    if (center && rows > 0) {
        std::vector<double> mean(dim, 0.0);
        for (long r = 0; r < rows; ++r) {
            for (long c = 0; c < dim; ++c) mean[c] += table.row(r)[c];
        }
        for (long r = 0; r < rows; ++r) {
            for (long c = 0; c < dim; ++c) table.row(r)[c] -= static_cast<float>(mean[c] / static_cast<double>(rows));
        }
    }
    for (long r = 0; r < rows; ++r) {
        float* row = table.row(r);
        double sq = 0.0;
        for (long c = 0; c < dim; ++c) sq += static_cast<double>(row[c]) * row[c];
        const float norm = std::max(static_cast<float>(std::sqrt(sq)), 1e-12f);
        for (long c = 0; c < dim; ++c) row[c] /= norm;
    }
    return table;
}

void log_missing(TrainingRunLogger& logger, const std::vector<std::string>& missing, std::string_view section) {
    if (missing.empty()) return;
    std::vector<std::string_view> names(missing.begin(), missing.end());
    logger.log_message(0, fmt::format("Checkpoint has no {} entry for {}; keeping initialization", section, join_names(names)));
}

void restore_from_checkpoint(NMTModel& model, const Checkpoint& checkpoint, const VocabularySet& vocab,
                             TrainingRunLogger& logger) {
    const ModelOptions& options = model.options();

    std::set<std::string> leading_rows;
    if (options.DetachedEmbeddings) {
        leading_rows = {SRC_WORD_LUT, TGT_WORD_LUT, OUTPUT_EMBEDDING_NAME, GENERATOR_PROJ};
    }
    // the continuous output table is rebuilt from the vocabulary below
    std::set<std::string> skip;
    if (is_continuous(options.Generator) && vocab.Tgt.Words.has_vectors()) {
        skip.insert(OUTPUT_EMBEDDING_NAME);
        if (options.ShareDecoderEmbeddings) skip.insert(TGT_WORD_LUT);
    }

    TensorMap state = checkpoint.ModelState;
    TensorMap generator = checkpoint.Generator;
    int renamed = fix_state_dict_keys(state) + fix_state_dict_keys(generator);
    if (renamed > 0) {
        logger.log_message(0, fmt::format("Renamed {} legacy checkpoint keys", renamed));
    }

    log_missing(logger, model.load_state(state, "", leading_rows, skip), "model");
    log_missing(logger, model.load_state(generator, GENERATOR_PREFIX, leading_rows, skip), "generator");

    if (model.secondary_generator()) {
        if (checkpoint.SecondaryGenerator) {
            TensorMap secondary = *checkpoint.SecondaryGenerator;
            fix_state_dict_keys(secondary);
            log_missing(logger, model.load_state(secondary, SECONDARY_GENERATOR_PREFIX), "secondary generator");
        } else {
            logger.log_message(0, "Checkpoint has no secondary generator; it is freshly initialized");
        }
    }

    // detached checkpoints only carry the leading rows, the rest comes from the vocabulary
    if (options.DetachedEmbeddings) {
        const long rows = options.DetachedEmbeddingRows;
        if (vocab.Src.Words.has_vectors()) {
            copy_vectors(model.params().value(model.src_word_slot()), vocab.Src.Words, rows, "Source");
        }
        if (vocab.Tgt.Words.has_vectors() && model.params().resolve(model.tgt_word_slot()) != model.params().resolve(model.src_word_slot())) {
            copy_vectors(model.params().value(model.tgt_word_slot()), vocab.Tgt.Words, rows, "Target");
        }
    }
}

} // namespace

void initialize_parameters(modules::ParameterStore& params, const std::vector<int>& slots,
                           const ModelOptions& options, std::mt19937& rng) {
    if (options.ParamInit != 0.f) {
        std::uniform_real_distribution<float> uniform(-options.ParamInit, options.ParamInit);
        for (int slot : slots) {
            for (auto& v : params.value(slot).Data) v = uniform(rng);
        }
    }
    if (options.ParamInitGlorot) {
        for (int slot : slots) {
            Tensor& w = params.value(slot);
            if (w.Rank < 2) continue;
            const float bound = std::sqrt(6.f / static_cast<float>(w.rows() + w.row_size()));
            std::uniform_real_distribution<float> uniform(-bound, bound);
            for (auto& v : w.Data) v = uniform(rng);
        }
    }
}

std::unique_ptr<NMTModel> build_model(const ModelOptions& options, VocabularySet& vocab, const Checkpoint* checkpoint,
                                      TrainingRunLogger& logger, unsigned seed) {
    auto section = logger.log_section_start(0, "Building model");

    const int output_size = output_vector_size(options, vocab, checkpoint);
    const int secondary_size = secondary_vocab_size(options, vocab, logger);
    auto model = std::make_unique<NMTModel>(options, vocab, output_size, secondary_size, seed);
    modules::ParameterStore& params = model->params();

    std::vector<int> slots = params.parameters();
    const int out_emb = model->output_embedding_slot();
    std::erase_if(slots, [&](int slot) { return out_emb >= 0 && slot == params.resolve(out_emb); });
    std::mt19937 rng(seed);
    initialize_parameters(params, slots, options, rng);

    if (checkpoint) {
        restore_from_checkpoint(*model, *checkpoint, vocab, logger);
    } else {
        if (options.PreWordVecsEnc) {
            if (!vocab.Src.Words.has_vectors()) {
                throw config_error("pre_word_vecs_enc is set but the source vocabulary has no vectors");
            }
            copy_vectors(params.value(model->src_word_slot()), vocab.Src.Words, 0, "Source");
        }
        if (options.PreWordVecsDec) {
            if (!vocab.Tgt.Words.has_vectors()) {
                throw config_error("pre_word_vecs_dec is set but the target vocabulary has no vectors");
            }
            copy_vectors(params.value(model->tgt_word_slot()), vocab.Tgt.Words, 0, "Target");
        }
    }

    if (out_emb >= 0 && vocab.Tgt.Words.has_vectors()) {
        Tensor& table = params.value(out_emb);
        Tensor unit = unit_norm_table(vocab.Tgt.Words.Vectors, options.Center);
        if (!unit.same_shape(table)) {
            throw config_error(fmt::format("Target vectors have shape {}, the output embedding expects {}",
                                           shape_to_str(unit), shape_to_str(table)));
        }
        table.Data = std::move(unit.Data);
    }

    if (options.FixWordVecsEnc) {
        params.set_trainable(model->src_word_slot(), false);
    }
    if (options.FixWordVecsDec) {
        params.set_trainable(model->tgt_word_slot(), false);
    }

    if (options.DetachedEmbeddings) {
        vocab.Src.Words.Vectors = Tensor{};
        vocab.Tgt.Words.Vectors = Tensor{};
    }
    return model;
}

void apply_freezing(NMTModel& model, const TrainingOptions& training, TrainingRunLogger& logger) {
    modules::ParameterStore& params = model.params();
    if (training.TrainOnlySecTask) {
        if (!model.secondary_generator()) {
            throw config_error("train_only_sec_task requires a secondary generator (multi_task with target features)");
        }
        logger.log_message(0, "Training only the secondary task; all other parameters are frozen");
        auto keep = model.section_parameters(SECONDARY_GENERATOR_PREFIX);
        for (int slot : params.parameters()) {
            if (std::find(keep.begin(), keep.end(), slot) == keep.end()) params.set_trainable(slot, false);
        }
    }
    if (training.FreezeEncoder) {
        for (int slot : model.section_parameters("encoder.")) params.set_trainable(slot, false);
    }
    if (training.FreezeDecoder) {
        for (int slot : model.section_parameters("decoder.")) params.set_trainable(slot, false);
    }
}

void log_parameter_tally(const NMTModel& model, TrainingRunLogger& logger) {
    ParameterTally tally = model.tally_parameters();
    logger.log_message(0, fmt::format("encoder: {}", tally.Encoder));
    logger.log_message(0, fmt::format("decoder: {}", tally.Decoder));
    logger.log_message(0, fmt::format("generator: {}", tally.Generator));
    logger.log_message(0, fmt::format("non-trainable parameters: {}", tally.NonTrainable));
    logger.log_message(0, fmt::format("* number of parameters: {}", tally.Total));
}

} // namespace models
