// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_DATALOADER_H
#define NMTCORE_SRC_TRAINING_DATALOADER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "training/batch.h"
#include "training/vocab.h"

//! Separator between a word and its features inside one whitespace-delimited token.
inline constexpr const char* FEATURE_SEPARATOR = "\xef\xbf\xa8";

/**
 * @brief Sequence of training or validation batches.
 */
class IBatchSource {
public:
    virtual ~IBatchSource() = default;

    //! Next batch, std::nullopt once the source is exhausted.
    virtual std::optional<Batch> next() = 0;

    //! Restart from the first batch.
    virtual void reset() = 0;
};

/**
 * @brief Batches held in memory, optionally repeated forever.
 */
class InMemoryBatchSource : public IBatchSource {
public:
    InMemoryBatchSource(std::vector<Batch> batches, bool repeat);

    std::optional<Batch> next() override;
    void reset() override { mIndex = 0; }

    [[nodiscard]] std::size_t size() const { return mBatches.size(); }

private:
    std::vector<Batch> mBatches;
    bool mRepeat;
    std::size_t mIndex = 0;
};

/*!
 * \brief Loads a parallel corpus of two whitespace-tokenized text files.
 * \details Line i of the source file is paired with line i of the target file. Tokens are
 * encoded with the vocabulary (features split off at FEATURE_SEPARATOR) and the target is framed
 * with <s> ... </s>. Pairs with an empty side are dropped.
 *
 * Examples are grouped into batches of `batch_size` sentences after a shuffle generated from
 * `seed` and the epoch counter. In a distributed setting, rank r takes batches r, r + W, r + 2W, ...
 * of each epoch and trailing batches that not every rank can take are dropped, so that all ranks
 * see the same number of batches and reach their collectives in lock-step.
 */
class ParallelTextLoader : public IBatchSource {
public:
    ParallelTextLoader(const std::string& src_file, const std::string& tgt_file, const VocabularySet& vocab,
                       int batch_size, int rank, int world_size, bool repeat, unsigned long seed = 42);

    std::optional<Batch> next() override;
    //! Restart the current epoch order from its first batch.
    void reset() override;

    //! Increment the epoch counter and reshuffle.
    void advance_epoch();

    [[nodiscard]] std::size_t num_examples() const { return mSrc.size(); }
    [[nodiscard]] std::size_t batches_per_epoch() const;
    [[nodiscard]] std::int32_t epoch() const { return mEpoch; }

private:
    void shuffle();

    std::vector<std::vector<int>> mSrc;
    std::vector<std::vector<int>> mTgt;
    int mSrcFeats = 1;
    int mTgtFeats = 1;
    int mBatchSize;
    int mRank;
    int mWorldSize;
    bool mRepeat;
    unsigned long mSeed;

    // state
    std::vector<std::size_t> mOrder;
    std::size_t mBatchIndex = 0;
    std::int32_t mEpoch = 0;
};

#endif //NMTCORE_SRC_TRAINING_DATALOADER_H
