// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_BATCH_H
#define NMTCORE_SRC_TRAINING_BATCH_H

#include <cstddef>
#include <vector>

//! Time-major token ids [Len][Batch][Feats]; feature 0 is the word stream.
struct TokenTensor {
    int Len = 0;
    int Batch = 0;
    int Feats = 1;
    std::vector<int> Ids;

    static TokenTensor filled(int len, int batch, int feats, int value);

    int& at(int t, int b, int f = 0) { return Ids[(static_cast<std::size_t>(t) * Batch + b) * Feats + f]; }
    [[nodiscard]] int at(int t, int b, int f = 0) const { return Ids[(static_cast<std::size_t>(t) * Batch + b) * Feats + f]; }

    //! Copy keeping only the first @p feats streams.
    [[nodiscard]] TokenTensor first_features(int feats) const;
};

/**
 * @brief One padded training example group.
 *
 * Target rows are framed as BOS w1 ... wn EOS and padded with PAD_INDEX; source rows
 * are padded after their length.
 */
struct Batch {
    TokenTensor Src;
    std::vector<int> SrcLengths;
    TokenTensor Tgt;
    int BatchSize = 0;

    //! Non-padding target tokens, the first (BOS) row excluded.
    [[nodiscard]] long num_tgt_tokens() const;
    [[nodiscard]] long num_src_tokens() const;
};

/**
 * @brief Pad id sequences into a batch.
 *
 * @param src Source token ids per example, each [len][feats] flattened word-major.
 * @param tgt Target token ids per example, already framed with BOS/EOS.
 * @param src_feats Number of streams per source token.
 * @param tgt_feats Number of streams per target token.
 */
Batch make_batch(const std::vector<std::vector<int>>& src, const std::vector<std::vector<int>>& tgt,
                 int src_feats = 1, int tgt_feats = 1);

#endif //NMTCORE_SRC_TRAINING_BATCH_H
