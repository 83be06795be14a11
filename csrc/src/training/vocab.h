// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_VOCAB_H
#define NMTCORE_SRC_TRAINING_VOCAB_H

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "utilities/safetensors.h"
#include "utilities/tensor.h"

inline constexpr const char* UNK_WORD = "<unk>";
inline constexpr const char* PAD_WORD = "<blank>";
inline constexpr const char* BOS_WORD = "<s>";
inline constexpr const char* EOS_WORD = "</s>";

//! Reserved indices; identical in every vocabulary and never moved by a vocabulary swap.
inline constexpr int UNK_INDEX = 0;
inline constexpr int PAD_INDEX = 1;
inline constexpr int BOS_INDEX = 2;
inline constexpr int EOS_INDEX = 3;
inline constexpr int NUM_SPECIALS = 4;

std::vector<std::string> default_specials();

/**
 * @brief Ordered token <-> index mapping of one token stream.
 *
 * Stoi may hold extra spellings that map to UNK_INDEX (left behind by older
 * vocabulary files); Itos is authoritative for the index order.
 */
struct Vocab {
    std::vector<std::string> Itos;
    std::unordered_map<std::string, int> Stoi;
    std::map<std::string, long> Freqs;
    //! Pretrained vectors aligned with Itos; Rank 0 when absent.
    Tensor Vectors;

    [[nodiscard]] int size() const { return static_cast<int>(Itos.size()); }
    [[nodiscard]] bool has_vectors() const { return Vectors.has_value(); }
    [[nodiscard]] bool contains(const std::string& token) const;

    //! Index of @p token, UNK_INDEX when unknown. Never inserts.
    [[nodiscard]] int lookup(const std::string& token) const;

    //! Drop Stoi entries mapping to UNK_INDEX under a spelling other than Itos[UNK_INDEX].
    //! @return Number of removed entries.
    int prune_unknown_aliases();
};

/**
 * @brief Build a vocabulary: @p specials first, then counter tokens by descending
 * frequency (ties alphabetical) with at least @p min_freq occurrences.
 * @param max_size Maximum number of non-special tokens, 0 for unlimited.
 */
Vocab build_vocab(const std::map<std::string, long>& counter, const std::vector<std::string>& specials,
                  int max_size = 0, long min_freq = 1);

//! Word vocabulary plus one vocabulary per token feature stream.
struct SideVocab {
    Vocab Words;
    std::vector<Vocab> Features;
};

//! Source and target vocabularies. Target feature 0 is the second label stream.
struct VocabularySet {
    SideVocab Src;
    SideVocab Tgt;
};

SideVocab& side_vocab(VocabularySet& vocab, std::string_view side);
const SideVocab& side_vocab(const VocabularySet& vocab, std::string_view side);

//! JSON form of the token tables; vectors are moved to @p tensors under "<prefix>.<side>...vectors".
nlohmann::json vocabulary_set_to_json(const VocabularySet& vocab, TensorMap& tensors, const std::string& prefix);
VocabularySet vocabulary_set_from_json(const nlohmann::json& json, const TensorMap& tensors, const std::string& prefix);

void save_vocab_file(const VocabularySet& vocab, const std::string& file_name);
VocabularySet load_vocab_file(const std::string& file_name);

//! External embedding table in word2vec text format.
struct EmbeddingTable {
    std::vector<std::string> Tokens;
    Tensor Vectors;
};

/**
 * @brief Read "token v1 ... vd" lines; a leading "count dim" header line is skipped.
 * @throws migration_error If the file is missing or rows disagree on the dimension.
 */
EmbeddingTable load_word2vec_text(const std::string& file_name);

/**
 * @brief Vocabulary made of the reserved specials of @p specials_source followed by
 * the tokens of @p table, with vectors. Special vectors are taken from
 * @p specials_source when it has them, zero otherwise.
 */
Vocab vocab_from_embeddings(const EmbeddingTable& table, const Vocab& specials_source);

#endif //NMTCORE_SRC_TRAINING_VOCAB_H
