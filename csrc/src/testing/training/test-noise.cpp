// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for source-side denoising.

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "training/batch.h"
#include "training/noise.h"
#include "training/vocab.h"

namespace {

//! Source sentences 10, 11, ... of the given lengths with a trivial target.
Batch numbered_batch(const std::vector<int>& lengths) {
    std::vector<std::vector<int>> src;
    std::vector<std::vector<int>> tgt;
    for (int len : lengths) {
        std::vector<int> sentence;
        for (int i = 0; i < len; ++i) sentence.push_back(10 + i);
        src.push_back(sentence);
        tgt.push_back({BOS_INDEX, 5, EOS_INDEX});
    }
    return make_batch(src, tgt);
}

std::vector<int> sentence(const Batch& batch, int b) {
    std::vector<int> out;
    for (int t = 0; t < batch.SrcLengths[b]; ++t) out.push_back(batch.Src.at(t, b));
    return out;
}

} // namespace

TEST_CASE("word_shuffle with k = 0 is the identity", "[noise]") {
    Batch batch = numbered_batch({6, 4, 1});
    const std::vector<int> before = batch.Src.Ids;
    NoiseGenerator noise(3);
    noise.word_shuffle(batch, 0.f);
    REQUIRE(batch.Src.Ids == before);
}

TEST_CASE("word_shuffle keeps the leading token and bounds displacement", "[noise]") {
    NoiseGenerator noise(5);
    const float k = 3.f;
    for (int trial = 0; trial < 50; ++trial) {
        Batch batch = numbered_batch({8, 5, 2});
        noise.word_shuffle(batch, k);
        for (int b = 0; b < batch.Src.Batch; ++b) {
            const std::vector<int> words = sentence(batch, b);
            REQUIRE(words.front() == 10);
            // the last token is outside the shuffled range
            REQUIRE(words.back() == 10 + static_cast<int>(words.size()) - 1);

            std::vector<int> sorted = words;
            std::sort(sorted.begin(), sorted.end());
            for (std::size_t i = 0; i < sorted.size(); ++i) REQUIRE(sorted[i] == 10 + static_cast<int>(i));

            for (std::size_t pos = 0; pos < words.size(); ++pos) {
                const int origin = words[pos] - 10;
                REQUIRE(std::abs(origin - static_cast<int>(pos)) < k);
            }
        }
    }
}

TEST_CASE("word_shuffle rejects a negative distance", "[noise]") {
    Batch batch = numbered_batch({4});
    NoiseGenerator noise(1);
    REQUIRE_THROWS_AS(noise.word_shuffle(batch, -1.f), std::invalid_argument);
}

TEST_CASE("word_dropout keeps the leading token and re-pads", "[noise]") {
    NoiseGenerator noise(9);
    for (int trial = 0; trial < 50; ++trial) {
        Batch batch = numbered_batch({7, 3, 2, 1});
        const std::vector<int> lengths_before = batch.SrcLengths;
        noise.word_dropout(batch, 0.9f);

        int max_len = 0;
        for (int b = 0; b < batch.Src.Batch; ++b) {
            const std::vector<int> words = sentence(batch, b);
            REQUIRE(words.front() == 10);
            if (lengths_before[b] >= 2) {
                REQUIRE(words.size() >= 2);
            } else {
                REQUIRE(words.size() == 1);
            }
            REQUIRE(static_cast<int>(words.size()) <= lengths_before[b] + 1);
            max_len = std::max(max_len, batch.SrcLengths[b]);

            for (int t = batch.SrcLengths[b]; t < batch.Src.Len; ++t) {
                REQUIRE(batch.Src.at(t, b) == PAD_INDEX);
            }
        }
        REQUIRE(batch.Src.Len == max_len);
        REQUIRE(batch.Src.Ids.size() == static_cast<std::size_t>(batch.Src.Len) * batch.Src.Batch);
    }
}

TEST_CASE("word_dropout with p = 0 leaves the batch alone", "[noise]") {
    Batch batch = numbered_batch({5, 3});
    const std::vector<int> before = batch.Src.Ids;
    NoiseGenerator noise(2);
    noise.word_dropout(batch, 0.f);
    REQUIRE(batch.Src.Ids == before);
    REQUIRE(batch.SrcLengths == std::vector<int>{5, 3});

    REQUIRE_THROWS_AS(noise.word_dropout(batch, 1.f), std::invalid_argument);
    REQUIRE_THROWS_AS(noise.word_dropout(batch, -0.5f), std::invalid_argument);
}

TEST_CASE("word_blank leaves the first and last token", "[noise]") {
    const int mask = 4;
    NoiseGenerator noise(13);
    Batch batch = numbered_batch({6, 2});
    noise.word_blank(batch, 0.99f, mask);

    const std::vector<int> first = sentence(batch, 0);
    REQUIRE(first.front() == 10);
    REQUIRE(first.back() == 15);
    for (std::size_t i = 1; i + 1 < first.size(); ++i) {
        REQUIRE((first[i] == mask || first[i] == 10 + static_cast<int>(i)));
    }
    REQUIRE(sentence(batch, 1) == std::vector<int>{10, 11});
    REQUIRE(batch.SrcLengths == std::vector<int>{6, 2});
}

TEST_CASE("add_noise changes only the source side", "[noise]") {
    Batch batch = numbered_batch({6, 5});
    const std::vector<int> tgt = batch.Tgt.Ids;
    NoiseGenerator noise(17);
    noise.add_noise(batch, 3.f, 0.1f);
    REQUIRE(batch.Tgt.Ids == tgt);
    for (int b = 0; b < batch.Src.Batch; ++b) {
        REQUIRE(batch.Src.at(0, b) == 10);
    }
}
