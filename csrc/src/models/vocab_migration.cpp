// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "vocab_migration.h"

#include <algorithm>
#include <map>

#include <fmt/core.h>

#include "models/nmt_model.h"
#include "models/weight_mapping.h"
#include "training/logging.h"
#include "utilities/utils.h"

namespace models {

namespace {

const std::string SRC_WORD_LUT = "encoder.embeddings.word_lut.weight";
const std::string TGT_WORD_LUT = "decoder.embeddings.word_lut.weight";

bool keeps_language(const std::string& token, const std::string& lang_prefix) {
    return token.starts_with(lang_prefix) || token.find('@') == std::string::npos;
}

} // namespace

Tensor migrate_bias(const Tensor& old_bias, const Vocab& new_vocab, const Vocab* old_vocab,
                    EBiasPolicy policy, const std::string& langcode) {
    const long n = new_vocab.size();
    switch (policy) {
        case EBiasPolicy::DROP:
            return Tensor{};
        case EBiasPolicy::ZERO_EXCEPT_SPECIALS: {
            Tensor bias = Tensor::zeros({n});
            const long k = std::min<long>({NUM_SPECIALS, n, static_cast<long>(old_bias.nelem())});
            std::copy_n(old_bias.data(), k, bias.data());
            return bias;
        }
        case EBiasPolicy::LANGUAGE_FILTERED: {
            if (!old_vocab) {
                throw migration_error("bias_policy 'lang-filter' requires the vocabulary of the checkpoint");
            }
            const std::string prefix = langcode + "@";
            Tensor bias = Tensor::zeros({n});
            for (long i = 0; i < n; ++i) {
                const std::string& token = new_vocab.Itos[i];
                if (!keeps_language(token, prefix)) continue;
                auto it = old_vocab->Stoi.find(token);
                if (it == old_vocab->Stoi.end() || it->second >= static_cast<long>(old_bias.nelem())) continue;
                // an unknown alias does not carry the bias of <unk>
                if (it->second == UNK_INDEX && token != old_vocab->Itos[UNK_INDEX]) continue;
                bias[i] = old_bias[it->second];
            }
            return bias;
        }
    }
    throw std::logic_error(fmt::format("Unknown EBiasPolicy {}. This is a programming error.", static_cast<int>(policy)));
}

/**
 * @brief Vocabulary migration of a checkpoint.
 *
 * Steps, in order: new word tables, new generator projection (non-continuous only),
 * bias migration, share_embeddings off, removal of the stored continuous output table.
 * Optimizer moments of resized parameters no longer match and are discarded when the
 * optimizer state is loaded.
 */
Checkpoint migrate_vocabulary(VocabularySet new_vocab, Checkpoint checkpoint, const TrainingOptions& training,
                              const VocabularySet* old_vocab, TrainingRunLogger& logger) {
    auto section = logger.log_section_start(checkpoint.Step, "Migrating vocabulary");
    if (int renamed = fix_checkpoint_keys(checkpoint); renamed > 0) {
        logger.log_message(checkpoint.Step, fmt::format("Renamed {} legacy checkpoint keys", renamed));
    }
    const ModelOptions& options = checkpoint.Model;
    const Vocab& tgt = new_vocab.Tgt.Words;
    if (!tgt.has_vectors()) {
        throw migration_error("The new target vocabulary has no vectors");
    }

    auto check_dim = [&](const std::string& key, const TensorMap& state, const Tensor& vectors) {
        auto it = state.find(key);
        if (it != state.end() && it->second.row_size() != vectors.row_size()) {
            throw migration_error(fmt::format("Vectors of dimension {} do not fit '{}' of shape {}",
                                              vectors.row_size(), key, shape_to_str(it->second)));
        }
    };

    check_dim(TGT_WORD_LUT, checkpoint.ModelState, tgt.Vectors);
    checkpoint.ModelState[TGT_WORD_LUT] = tgt.Vectors;
    if (new_vocab.Src.Words.has_vectors()) {
        check_dim(SRC_WORD_LUT, checkpoint.ModelState, new_vocab.Src.Words.Vectors);
        checkpoint.ModelState[SRC_WORD_LUT] = new_vocab.Src.Words.Vectors;
    }

    if (!is_continuous(options.Generator)) {
        check_dim("proj.weight", checkpoint.Generator, tgt.Vectors);
        checkpoint.Generator["proj.weight"] = tgt.Vectors;

        if (auto it = checkpoint.Generator.find("proj.bias"); it != checkpoint.Generator.end()) {
            const Vocab* old_words = old_vocab ? &old_vocab->Tgt.Words : nullptr;
            Tensor bias = migrate_bias(it->second, tgt, old_words, training.BiasPolicy, training.Langcode);
            if (bias.has_value()) {
                it->second = std::move(bias);
            } else {
                checkpoint.Generator.erase(it);
            }
            logger.log_message(checkpoint.Step, fmt::format("Generator bias migrated with policy '{}'",
                                                            to_string(training.BiasPolicy)));
        }
    }

    checkpoint.Model.ShareEmbeddings = false;
    checkpoint.ModelState.erase(OUTPUT_EMBEDDING_NAME);
    checkpoint.Vocab = std::move(new_vocab);
    logger.log_message(checkpoint.Step, fmt::format("Migrated to vocabularies of {} source and {} target tokens",
                                                    checkpoint.Vocab.Src.Words.size(), checkpoint.Vocab.Tgt.Words.size()));
    return checkpoint;
}

VocabularySet subset_target_language(const VocabularySet& vocab, const std::string& lang,
                                     const TensorMap& model_state) {
    const Vocab& tgt = vocab.Tgt.Words;
    const std::string prefix = lang + "@";
    std::map<std::string, long> counter;
    for (const auto& [token, freq] : tgt.Freqs) {
        if (keeps_language(token, prefix)) counter.emplace(token, freq);
    }
    std::vector<std::string> specials(tgt.Itos.begin(), tgt.Itos.begin() + std::min<int>(NUM_SPECIALS, tgt.size()));

    // rows of the trained decoder table, indexed like the old target vocabulary; a
    // detached table only holds the leading rows
    const Tensor* table = nullptr;
    for (const auto& [key, tensor] : model_state) {
        if (fix_key(key) == TGT_WORD_LUT && tensor.rows() >= tgt.size()) {
            table = &tensor;
            break;
        }
    }
    if (!table && tgt.has_vectors()) table = &tgt.Vectors;
    if (!table) {
        throw migration_error(fmt::format("Cannot subset to language '{}': no complete '{}' and no target vectors",
                                          lang, TGT_WORD_LUT));
    }

    VocabularySet result = vocab;
    Vocab subset = build_vocab(counter, specials);
    const long dim = table->row_size();
    subset.Vectors = Tensor::zeros({static_cast<long>(subset.size()), dim});
    for (int i = 0; i < subset.size(); ++i) {
        auto it = tgt.Stoi.find(subset.Itos[i]);
        if (it == tgt.Stoi.end()) continue;
        std::copy_n(table->row(it->second), dim, subset.Vectors.row(i));
    }
    result.Tgt.Words = std::move(subset);
    return result;
}

void set_vocab_from_embeddings(VocabularySet& vocab, std::string_view side, const std::string& file_name,
                               const TensorMap& model_state) {
    SideVocab& target = side_vocab(vocab, side);
    const std::string& key = side == "src" ? SRC_WORD_LUT : TGT_WORD_LUT;

    Vocab specials = target.Words;
    if (auto it = model_state.find(key); it != model_state.end()) {
        specials.Vectors = it->second;
    }
    target.Words = vocab_from_embeddings(load_word2vec_text(file_name), specials);
}

} // namespace models
