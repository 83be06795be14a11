// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_NOISE_H
#define NMTCORE_SRC_TRAINING_NOISE_H

#include <random>

#include "training/batch.h"

/**
 * @brief Source-side denoising applied to training and validation batches.
 *
 * All operations work on Batch::Src and Batch::SrcLengths and move whole tokens,
 * feature streams included. The leading token of every sentence never moves and is
 * never dropped or blanked.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(unsigned seed);

    /**
     * @brief Locally shuffle the first length - 1 tokens of every sentence.
     *
     * Token i is sorted by i + u with u uniform in [0, k), except token 0 whose
     * noise is -1. Tokens therefore move at most k - 1 positions; k == 0 is the identity.
     */
    void word_shuffle(Batch& batch, float k);

    /**
     * @brief Drop each token with probability @p p.
     *
     * Token 0 is always kept. When only it survives, one random other token of the
     * sentence is appended again, so that sentences of length >= 2 keep at least two
     * tokens. The source is re-padded to the new maximum length.
     */
    void word_dropout(Batch& batch, float p);

    //! Replace each token except the first and the last with @p mask_index with probability @p p.
    void word_blank(Batch& batch, float p, int mask_index);

    //! word_shuffle followed by word_dropout.
    void add_noise(Batch& batch, float shuffle_k, float dropout_p);

private:
    std::mt19937 mRng;
};

#endif //NMTCORE_SRC_TRAINING_NOISE_H
