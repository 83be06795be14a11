// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/weight_mapping.h"

#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace models {

namespace {

struct KeyPattern {
    std::regex Pattern;
    const char* Replacement;
};

const std::vector<KeyPattern>& key_patterns() {
    static const std::vector<KeyPattern> kPatterns = {
        {std::regex(R"((.*)\.layer_norm((_\d+)?)\.b_2)"), "$1.layer_norm$2.bias"},
        {std::regex(R"((.*)\.layer_norm((_\d+)?)\.a_2)"), "$1.layer_norm$2.weight"},
        {std::regex(R"((.*)\.make_embedding\.emb_luts\.0\.0\.weight)"), "$1.word_lut.weight"},
    };
    return kPatterns;
}

const std::regex& feature_lut_pattern() {
    static const std::regex kPattern(R"((.*)\.make_embedding\.emb_luts\.0\.(\d+)\.weight)");
    return kPattern;
}

} // namespace

std::string fix_key(const std::string& key) {
    std::string s = key;
    for (const auto& p : key_patterns()) {
        s = std::regex_replace(s, p.Pattern, p.Replacement);
    }
    std::smatch match;
    if (std::regex_match(s, match, feature_lut_pattern())) {
        int index = std::stoi(match[2].str());
        s = fmt::format("{}.feat_luts.{}.weight", match[1].str(), index - 1);
    }
    return s;
}

int fix_state_dict_keys(TensorMap& state) {
    TensorMap fixed;
    int renamed = 0;
    for (auto& [key, tensor] : state) {
        std::string name = fix_key(key);
        if (name != key) ++renamed;
        if (!fixed.emplace(name, std::move(tensor)).second) {
            throw checkpoint_error(fmt::format("Checkpoint key '{}' collides with '{}' after renaming", key, name));
        }
    }
    state = std::move(fixed);
    return renamed;
}

int fix_checkpoint_keys(Checkpoint& checkpoint) {
    int renamed = fix_state_dict_keys(checkpoint.ModelState) + fix_state_dict_keys(checkpoint.Generator);
    if (checkpoint.SecondaryGenerator) {
        renamed += fix_state_dict_keys(*checkpoint.SecondaryGenerator);
    }
    return renamed;
}

} // namespace models
