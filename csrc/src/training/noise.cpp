// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "noise.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "training/vocab.h"

NoiseGenerator::NoiseGenerator(unsigned seed) : mRng(seed) {
}

void NoiseGenerator::word_shuffle(Batch& batch, float k) {
    if (k == 0.f) {
        return;
    }
    if (k < 0.f) {
        throw std::invalid_argument(fmt::format("word_shuffle distance must not be negative, got {}", k));
    }
    TokenTensor& src = batch.Src;
    std::uniform_real_distribution<float> uniform(0.f, k);
    std::vector<float> scores;
    std::vector<int> order;
    std::vector<int> tokens;
    for (int b = 0; b < src.Batch; ++b) {
        const int n = batch.SrcLengths[b] - 1;
        if (n <= 1) continue;
        scores.resize(n);
        for (int i = 0; i < n; ++i) {
            scores[i] = static_cast<float>(i) + (i == 0 ? -1.f : uniform(mRng));
        }
        order.resize(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int a, int c) { return scores[a] < scores[c]; });

        tokens.resize(static_cast<std::size_t>(n) * src.Feats);
        for (int i = 0; i < n; ++i) {
            for (int f = 0; f < src.Feats; ++f) tokens[static_cast<std::size_t>(i) * src.Feats + f] = src.at(order[i], b, f);
        }
        for (int i = 0; i < n; ++i) {
            for (int f = 0; f < src.Feats; ++f) src.at(i, b, f) = tokens[static_cast<std::size_t>(i) * src.Feats + f];
        }
    }
}

void NoiseGenerator::word_dropout(Batch& batch, float p) {
    if (p == 0.f) {
        return;
    }
    if (p < 0.f || p >= 1.f) {
        throw std::invalid_argument(fmt::format("word_dropout probability must be in [0, 1), got {}", p));
    }
    const TokenTensor& src = batch.Src;
    std::bernoulli_distribution drop(p);

    // positions kept per sentence
    std::vector<std::vector<int>> kept(src.Batch);
    for (int b = 0; b < src.Batch; ++b) {
        const int len = batch.SrcLengths[b];
        auto& positions = kept[b];
        for (int t = 0; t < len; ++t) {
            if (t == 0 || !drop(mRng)) positions.push_back(t);
        }
        if (positions.size() == 1 && len > 1) {
            std::uniform_int_distribution<int> pick(1, len - 1);
            positions.push_back(pick(mRng));
        }
    }

    int max_len = 0;
    for (const auto& positions : kept) max_len = std::max(max_len, static_cast<int>(positions.size()));
    TokenTensor result = TokenTensor::filled(max_len, src.Batch, src.Feats, PAD_INDEX);
    for (int b = 0; b < src.Batch; ++b) {
        const auto& positions = kept[b];
        for (std::size_t i = 0; i < positions.size(); ++i) {
            for (int f = 0; f < src.Feats; ++f) result.at(static_cast<int>(i), b, f) = src.at(positions[i], b, f);
        }
        batch.SrcLengths[b] = static_cast<int>(positions.size());
    }
    batch.Src = std::move(result);
}

void NoiseGenerator::word_blank(Batch& batch, float p, int mask_index) {
    if (p == 0.f) {
        return;
    }
    if (p < 0.f || p >= 1.f) {
        throw std::invalid_argument(fmt::format("word_blank probability must be in [0, 1), got {}", p));
    }
    std::bernoulli_distribution blank(p);
    for (int b = 0; b < batch.Src.Batch; ++b) {
        for (int t = 1; t < batch.SrcLengths[b] - 1; ++t) {
            if (blank(mRng)) batch.Src.at(t, b) = mask_index;
        }
    }
}

void NoiseGenerator::add_noise(Batch& batch, float shuffle_k, float dropout_p) {
    word_shuffle(batch, shuffle_k);
    word_dropout(batch, dropout_p);
}
