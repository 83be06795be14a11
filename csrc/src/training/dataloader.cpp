// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "dataloader.h"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

InMemoryBatchSource::InMemoryBatchSource(std::vector<Batch> batches, bool repeat)
    : mBatches(std::move(batches)), mRepeat(repeat) {
}

std::optional<Batch> InMemoryBatchSource::next() {
    if (mBatches.empty()) {
        return std::nullopt;
    }
    if (mIndex >= mBatches.size()) {
        if (!mRepeat) return std::nullopt;
        mIndex = 0;
    }
    return mBatches[mIndex++];
}

namespace {

std::vector<std::string> split_features(const std::string& token) {
    std::vector<std::string> parts;
    const std::string sep = FEATURE_SEPARATOR;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = token.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(token.substr(start));
            return parts;
        }
        parts.push_back(token.substr(start, pos - start));
        start = pos + sep.size();
    }
}

/**
 * @brief Encode one line into ids, word-major: [w0 f0_0 f0_1 ... w1 f1_0 ...].
 *
 * Missing features are encoded as UNK_INDEX.
 */
std::vector<int> encode_line(const std::string& line, const SideVocab& side, bool frame, const std::string& file_name,
                             std::size_t line_no) {
    const int feats = 1 + static_cast<int>(side.Features.size());
    std::vector<int> ids;
    auto append = [&](const std::vector<std::string>& parts) {
        ids.push_back(side.Words.lookup(parts[0]));
        for (int f = 1; f < feats; ++f) {
            ids.push_back(f < static_cast<int>(parts.size()) ? side.Features[f - 1].lookup(parts[f]) : UNK_INDEX);
        }
    };
    auto special = [&](const char* word) {
        std::vector<std::string> parts(feats, word);
        append(parts);
    };

    if (frame) special(BOS_WORD);
    std::istringstream in(line);
    std::string token;
    bool any = false;
    while (in >> token) {
        auto parts = split_features(token);
        if (static_cast<int>(parts.size()) > feats) {
            throw std::runtime_error(fmt::format("{}:{}: token '{}' has {} features, the vocabulary has {}",
                                                 file_name, line_no, token, parts.size() - 1, feats - 1));
        }
        append(parts);
        any = true;
    }
    if (!any) return {};
    if (frame) special(EOS_WORD);
    return ids;
}

std::vector<std::string> read_lines(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Could not open text file {}", file_name));
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace

/**
 * @brief Read and encode both files, then shuffle epoch 0.
 *
 * @throws std::runtime_error If a file cannot be read, the line counts differ or a token
 *         carries more features than the vocabulary knows.
 * @throws std::invalid_argument On invalid batch size or rank.
 */
ParallelTextLoader::ParallelTextLoader(const std::string& src_file, const std::string& tgt_file, const VocabularySet& vocab,
                                       int batch_size, int rank, int world_size, bool repeat, unsigned long seed)
    : mBatchSize(batch_size), mRank(rank), mWorldSize(world_size), mRepeat(repeat), mSeed(seed) {
    if (batch_size <= 0) {
        throw std::invalid_argument(fmt::format("batch size must be positive, got {}", batch_size));
    }
    if (rank < 0 || rank >= world_size) {
        throw std::invalid_argument(fmt::format("rank {} outside world of size {}", rank, world_size));
    }

    auto src_lines = read_lines(src_file);
    auto tgt_lines = read_lines(tgt_file);
    if (src_lines.size() != tgt_lines.size()) {
        throw std::runtime_error(fmt::format("Parallel corpus mismatch: {} has {} lines, {} has {}",
                                             src_file, src_lines.size(), tgt_file, tgt_lines.size()));
    }

    mSrcFeats = 1 + static_cast<int>(vocab.Src.Features.size());
    mTgtFeats = 1 + static_cast<int>(vocab.Tgt.Features.size());
    for (std::size_t i = 0; i < src_lines.size(); ++i) {
        auto src = encode_line(src_lines[i], vocab.Src, false, src_file, i + 1);
        auto tgt = encode_line(tgt_lines[i], vocab.Tgt, true, tgt_file, i + 1);
        if (src.empty() || tgt.empty()) continue;
        mSrc.push_back(std::move(src));
        mTgt.push_back(std::move(tgt));
    }
    shuffle();
}

std::size_t ParallelTextLoader::batches_per_epoch() const {
    std::size_t total = div_ceil(mSrc.size(), static_cast<std::size_t>(mBatchSize));
    return total / mWorldSize;
}

void ParallelTextLoader::shuffle() {
    mOrder.resize(mSrc.size());
    std::iota(mOrder.begin(), mOrder.end(), std::size_t{0});
    std::mt19937_64 rng(mSeed + static_cast<unsigned long>(mEpoch));
    std::shuffle(mOrder.begin(), mOrder.end(), rng);
    mBatchIndex = 0;
}

void ParallelTextLoader::advance_epoch() {
    ++mEpoch;
    shuffle();
}

void ParallelTextLoader::reset() {
    mBatchIndex = 0;
}

std::optional<Batch> ParallelTextLoader::next() {
    if (batches_per_epoch() == 0) {
        return std::nullopt;
    }
    if (mBatchIndex >= batches_per_epoch()) {
        if (!mRepeat) return std::nullopt;
        advance_epoch();
    }

    const std::size_t global = mBatchIndex * mWorldSize + mRank;
    const std::size_t begin = global * mBatchSize;
    const std::size_t end = std::min(begin + mBatchSize, mOrder.size());
    ++mBatchIndex;

    std::vector<std::vector<int>> src;
    std::vector<std::vector<int>> tgt;
    for (std::size_t i = begin; i < end; ++i) {
        src.push_back(mSrc[mOrder[i]]);
        tgt.push_back(mTgt[mOrder[i]]);
    }
    return make_batch(src, tgt, mSrcFeats, mTgtFeats);
}
