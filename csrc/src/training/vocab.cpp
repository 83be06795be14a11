// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "vocab.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

std::vector<std::string> default_specials() {
    return {UNK_WORD, PAD_WORD, BOS_WORD, EOS_WORD};
}

bool Vocab::contains(const std::string& token) const {
    return Stoi.find(token) != Stoi.end();
}

int Vocab::lookup(const std::string& token) const {
    auto it = Stoi.find(token);
    return it == Stoi.end() ? UNK_INDEX : it->second;
}

int Vocab::prune_unknown_aliases() {
    const std::string& unk = Itos.empty() ? std::string(UNK_WORD) : Itos[UNK_INDEX];
    auto removed = std::erase_if(Stoi, [&](const auto& entry) {
        return entry.second == UNK_INDEX && entry.first != unk;
    });
    return static_cast<int>(removed);
}

Vocab build_vocab(const std::map<std::string, long>& counter, const std::vector<std::string>& specials,
                  int max_size, long min_freq) {
    Vocab vocab;
    vocab.Freqs = counter;
    for (const auto& s : specials) {
        if (vocab.Stoi.emplace(s, vocab.size()).second) {
            vocab.Itos.push_back(s);
        }
    }

    std::vector<std::pair<std::string, long>> entries(counter.begin(), counter.end());
    // counter is ordered by token, so a stable sort keeps ties alphabetical
    std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    int added = 0;
    for (const auto& [token, freq] : entries) {
        if (freq < min_freq) break;
        if (max_size > 0 && added >= max_size) break;
        if (vocab.Stoi.emplace(token, vocab.size()).second) {
            vocab.Itos.push_back(token);
            ++added;
        }
    }
    return vocab;
}

SideVocab& side_vocab(VocabularySet& vocab, std::string_view side) {
    if (side == "src") return vocab.Src;
    if (side == "tgt") return vocab.Tgt;
    throw migration_error(fmt::format("Unknown vocabulary side '{}'", side));
}

const SideVocab& side_vocab(const VocabularySet& vocab, std::string_view side) {
    return side_vocab(const_cast<VocabularySet&>(vocab), side);
}

namespace {

nlohmann::json vocab_to_json(const Vocab& vocab, TensorMap& tensors, const std::string& name) {
    nlohmann::json json;
    json["itos"] = vocab.Itos;
    json["stoi"] = nlohmann::json::object();
    for (const auto& [token, index] : vocab.Stoi) json["stoi"][token] = index;
    json["freqs"] = nlohmann::json::object();
    for (const auto& [token, freq] : vocab.Freqs) json["freqs"][token] = freq;
    if (vocab.has_vectors()) {
        tensors[name + ".vectors"] = vocab.Vectors;
    }
    return json;
}

Vocab vocab_from_json(const nlohmann::json& json, const TensorMap& tensors, const std::string& name) {
    Vocab vocab;
    vocab.Itos = json.at("itos").get<std::vector<std::string>>();
    if (auto it = json.find("stoi"); it != json.end()) {
        for (const auto& [token, index] : it->items()) vocab.Stoi[token] = index.get<int>();
    }
    for (int i = 0; i < vocab.size(); ++i) {
        vocab.Stoi.try_emplace(vocab.Itos[i], i);
    }
    if (auto it = json.find("freqs"); it != json.end()) {
        for (const auto& [token, freq] : it->items()) vocab.Freqs[token] = freq.get<long>();
    }
    if (auto it = tensors.find(name + ".vectors"); it != tensors.end()) {
        if (it->second.rows() != vocab.size()) {
            throw checkpoint_error(fmt::format("Vectors of vocabulary '{}' have {} rows for {} tokens",
                                               name, it->second.rows(), vocab.size()));
        }
        vocab.Vectors = it->second;
    }
    return vocab;
}

nlohmann::json side_to_json(const SideVocab& side, TensorMap& tensors, const std::string& name) {
    nlohmann::json json;
    json["words"] = vocab_to_json(side.Words, tensors, name + ".words");
    json["features"] = nlohmann::json::array();
    for (std::size_t i = 0; i < side.Features.size(); ++i) {
        json["features"].push_back(vocab_to_json(side.Features[i], tensors, fmt::format("{}.features.{}", name, i)));
    }
    return json;
}

SideVocab side_from_json(const nlohmann::json& json, const TensorMap& tensors, const std::string& name) {
    SideVocab side;
    side.Words = vocab_from_json(json.at("words"), tensors, name + ".words");
    if (auto it = json.find("features"); it != json.end()) {
        for (std::size_t i = 0; i < it->size(); ++i) {
            side.Features.push_back(vocab_from_json((*it)[i], tensors, fmt::format("{}.features.{}", name, i)));
        }
    }
    return side;
}

} // namespace

nlohmann::json vocabulary_set_to_json(const VocabularySet& vocab, TensorMap& tensors, const std::string& prefix) {
    nlohmann::json json;
    json["src"] = side_to_json(vocab.Src, tensors, prefix + ".src");
    json["tgt"] = side_to_json(vocab.Tgt, tensors, prefix + ".tgt");
    return json;
}

VocabularySet vocabulary_set_from_json(const nlohmann::json& json, const TensorMap& tensors, const std::string& prefix) {
    VocabularySet vocab;
    vocab.Src = side_from_json(json.at("src"), tensors, prefix + ".src");
    vocab.Tgt = side_from_json(json.at("tgt"), tensors, prefix + ".tgt");
    return vocab;
}

void save_vocab_file(const VocabularySet& vocab, const std::string& file_name) {
    TensorMap tensors;
    nlohmann::json meta;
    meta["format"] = "nmtcore-vocab";
    meta["version"] = 1;
    meta["vocab"] = vocabulary_set_to_json(vocab, tensors, "vocab");
    write_safetensors(file_name, tensors, meta);
}

/**
 * @brief Load a vocabulary file written by save_vocab_file.
 *
 * @param file_name Path to the vocabulary file.
 * @return Source and target vocabularies, including vectors when present.
 *
 * @throws checkpoint_error If the file cannot be read or is not a vocabulary file.
 */
VocabularySet load_vocab_file(const std::string& file_name) {
    auto contents = read_safetensors(file_name);
    if (contents.MetaData.value("format", std::string{}) != "nmtcore-vocab") {
        throw checkpoint_error(fmt::format("'{}' is not a vocabulary file", file_name));
    }
    try {
        return vocabulary_set_from_json(contents.MetaData.at("vocab"), contents.Tensors, "vocab");
    } catch (const nlohmann::json::exception& e) {
        throw checkpoint_error(fmt::format("Malformed vocabulary in '{}': {}", file_name, e.what()));
    }
}

EmbeddingTable load_word2vec_text(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw migration_error(fmt::format("Could not open embedding file '{}'", file_name));
    }

    EmbeddingTable table;
    std::vector<float> values;
    long dim = -1;
    std::string line;
    bool first = true;
    while (std::getline(file, line)) {
        std::istringstream fields(line);
        std::string token;
        if (!(fields >> token)) continue;
        std::vector<float> row;
        float v;
        while (fields >> v) row.push_back(v);

        // "count dim" header
        if (first && row.size() == 1 && token.find_first_not_of("0123456789") == std::string::npos) {
            first = false;
            continue;
        }
        first = false;
        if (dim < 0) dim = static_cast<long>(row.size());
        if (static_cast<long>(row.size()) != dim || dim == 0) {
            throw migration_error(fmt::format("Embedding for '{}' in '{}' has dimension {}, expected {}",
                                              token, file_name, row.size(), dim));
        }
        table.Tokens.push_back(token);
        values.insert(values.end(), row.begin(), row.end());
    }
    if (table.Tokens.empty()) {
        throw migration_error(fmt::format("Embedding file '{}' contains no vectors", file_name));
    }
    table.Vectors = Tensor::from_values({static_cast<long>(table.Tokens.size()), dim}, std::move(values));
    return table;
}

Vocab vocab_from_embeddings(const EmbeddingTable& table, const Vocab& specials_source) {
    if (specials_source.size() < NUM_SPECIALS) {
        throw migration_error("Specials vocabulary is missing reserved tokens");
    }
    std::vector<std::string> specials(specials_source.Itos.begin(), specials_source.Itos.begin() + NUM_SPECIALS);

    Vocab vocab;
    for (const auto& s : specials) {
        vocab.Stoi.emplace(s, vocab.size());
        vocab.Itos.push_back(s);
    }
    std::vector<long> table_rows;
    for (std::size_t i = 0; i < table.Tokens.size(); ++i) {
        const auto& token = table.Tokens[i];
        if (!vocab.Stoi.emplace(token, vocab.size()).second) continue;
        vocab.Itos.push_back(token);
        table_rows.push_back(static_cast<long>(i));
        auto freq = specials_source.Freqs.find(token);
        vocab.Freqs[token] = freq == specials_source.Freqs.end() ? 1 : freq->second;
    }

    const long dim = table.Vectors.row_size();
    vocab.Vectors = Tensor::zeros({static_cast<long>(vocab.size()), dim});
    if (specials_source.has_vectors()) {
        if (specials_source.Vectors.row_size() != dim) {
            throw migration_error(fmt::format("Special vectors have dimension {}, embedding table has {}",
                                              specials_source.Vectors.row_size(), dim));
        }
        for (int i = 0; i < NUM_SPECIALS; ++i) {
            std::copy_n(specials_source.Vectors.row(i), dim, vocab.Vectors.row(i));
        }
    }
    for (std::size_t i = 0; i < table_rows.size(); ++i) {
        std::copy_n(table.Vectors.row(table_rows[i]), dim, vocab.Vectors.row(NUM_SPECIALS + static_cast<long>(i)));
    }
    return vocab;
}
