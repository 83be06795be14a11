// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODELS_VOCAB_MIGRATION_H
#define NMTCORE_SRC_MODELS_VOCAB_MIGRATION_H

#include <string>
#include <string_view>

#include "config/run_options.h"
#include "training/checkpoint.h"
#include "training/vocab.h"

class TrainingRunLogger;

namespace models {

/**
 * @brief Rewrite @p checkpoint for a new vocabulary.
 *
 * The new vectors replace the word tables (the source side only when it has vectors)
 * and, for non-continuous generators, the generator projection. The generator bias is
 * migrated according to training.BiasPolicy, share_embeddings is switched off in the
 * stored options, and the stored continuous output table is removed so that it is
 * rebuilt from the new vectors. This is the only place where the generator bias is
 * changed. Legacy parameter names are renamed before anything is replaced.
 *
 * @param old_vocab Vocabulary the checkpoint was trained with, required by the
 *        language-filtered bias policy; nullptr when unknown.
 * @throws migration_error If the new target vocabulary has no vectors, the old
 *         vocabulary is required but absent, or the vectors do not fit the model.
 */
Checkpoint migrate_vocabulary(VocabularySet new_vocab, Checkpoint checkpoint, const TrainingOptions& training,
                              const VocabularySet* old_vocab, TrainingRunLogger& logger);

/**
 * @brief New generator bias in the order of @p new_vocab.
 *
 * @return A tensor of exactly |new_vocab| entries; a tensor without value for EBiasPolicy::DROP.
 */
Tensor migrate_bias(const Tensor& old_bias, const Vocab& new_vocab, const Vocab* old_vocab,
                    EBiasPolicy policy, const std::string& langcode);

/**
 * @brief Reduce the target vocabulary to one language.
 *
 * Keeps the counter entries tagged "<lang>@" plus every token without '@' and the
 * reserved specials, with their frequencies, and rebuilds the vocabulary. The vectors
 * of the subset are the matching rows of the decoder word table in @p model_state,
 * or of the target vectors when the state has no such table.
 *
 * @throws migration_error If neither a decoder word table nor target vectors exist.
 */
VocabularySet subset_target_language(const VocabularySet& vocab, const std::string& lang,
                                     const TensorMap& model_state);

/**
 * @brief Replace the word vocabulary of @p side ("src" or "tgt") by the tokens of a word2vec file.
 *
 * The vectors of the reserved specials are taken from the first rows of the side's word
 * table in @p model_state.
 *
 * @throws migration_error If @p side is unknown or the file cannot be read.
 */
void set_vocab_from_embeddings(VocabularySet& vocab, std::string_view side, const std::string& file_name,
                               const TensorMap& model_state);

} // namespace models

#endif //NMTCORE_SRC_MODELS_VOCAB_MIGRATION_H
