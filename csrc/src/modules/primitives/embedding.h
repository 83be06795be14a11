// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_PRIMITIVES_EMBEDDING_H
#define NMTCORE_SRC_MODULES_PRIMITIVES_EMBEDDING_H

#include <random>
#include <string>
#include <vector>

#include "config/run_options.h"
#include "modules/parameter_store.h"
#include "training/batch.h"
#include "utilities/tensor.h"

namespace modules {

/**
 * @brief Token embedding module
 *
 * Looks up the word stream in "<name>.word_lut.weight" and, when feature vocabularies
 * are given, every feature stream in "<name>.feat_luts.<i>.weight". Feature vectors are
 * concatenated to or summed with the word vector, then dropout is applied.
 * Rows of PAD_INDEX never receive gradient.
 *
 * Input: (T, B, F) token ids
 * Output: (T * B, output_size()) embeddings, row t * B + b
 */
class EmbeddingModule {
public:
    struct Config {
        int vocab_size;                     ///< Number of word tokens
        int word_vec_size;                  ///< Word embedding dimension
        std::vector<int> feat_vocab_sizes;  ///< One entry per embedded feature stream
        EFeatMerge feat_merge = EFeatMerge::CONCAT;
        int feat_vec_size = -1;             ///< Fixed feature dimension for CONCAT, -1 to derive it
        float feat_vec_exponent = 0.7f;     ///< dim = vocab_size ^ exponent when derived
        float dropout = 0.f;
    };

    EmbeddingModule(ParameterStore& params, const std::string& name, Config config);

    [[nodiscard]] int output_size() const { return mOutputSize; }
    [[nodiscard]] int word_vec_size() const { return mConfig.word_vec_size; }
    [[nodiscard]] int vocab_size() const { return mConfig.vocab_size; }

    //! Embed time steps [t_begin, t_end) of @p tokens.
    Tensor forward(const TokenTensor& tokens, int t_begin, int t_end, bool training, std::mt19937& rng);

    //! Accumulate lookup-table gradients of the last forward call over the same tokens.
    void backward(const TokenTensor& tokens, int t_begin, int t_end, const Tensor& d_output);

    void update_dropout(float p) { mConfig.dropout = p; }

    //! Make the word table an alias of the parameter at @p slot; the table is no longer trained.
    void tie_embeddings(int slot);

    [[nodiscard]] int word_slot() const { return mWordLut; }
    [[nodiscard]] const std::vector<int>& feature_slots() const { return mFeatLuts; }

private:
    ParameterStore* mParams;
    Config mConfig;
    int mWordLut;
    std::vector<int> mFeatLuts;
    std::vector<int> mFeatDims;
    int mOutputSize;
    std::vector<float> mDropoutMask;
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_PRIMITIVES_EMBEDDING_H
