// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "embedding.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "modules/primitives/ops.h"
#include "training/vocab.h"

namespace modules {

EmbeddingModule::EmbeddingModule(ParameterStore& params, const std::string& name, Config config)
    : mParams(&params), mConfig(std::move(config)) {
    mWordLut = params.add(name + ".word_lut.weight", {mConfig.vocab_size, mConfig.word_vec_size});
    mOutputSize = mConfig.word_vec_size;
    for (std::size_t i = 0; i < mConfig.feat_vocab_sizes.size(); ++i) {
        int vocab = mConfig.feat_vocab_sizes[i];
        int dim = mConfig.word_vec_size;
        if (mConfig.feat_merge == EFeatMerge::CONCAT) {
            dim = mConfig.feat_vec_size > 0
                ? mConfig.feat_vec_size
                : static_cast<int>(std::pow(static_cast<double>(vocab), mConfig.feat_vec_exponent));
            dim = std::max(dim, 1);
            mOutputSize += dim;
        }
        mFeatDims.push_back(dim);
        mFeatLuts.push_back(params.add(fmt::format("{}.feat_luts.{}.weight", name, i), {vocab, dim}));
    }
}

void EmbeddingModule::tie_embeddings(int slot) {
    mParams->tie(mWordLut, slot);
    mParams->set_trainable(mWordLut, false);
}

Tensor EmbeddingModule::forward(const TokenTensor& tokens, int t_begin, int t_end, bool training, std::mt19937& rng) {
    if (tokens.Feats < 1 + static_cast<int>(mFeatLuts.size())) {
        throw std::logic_error(fmt::format("Embedding expects {} token streams, batch has {}",
                                           1 + mFeatLuts.size(), tokens.Feats));
    }
    const int batch = tokens.Batch;
    Tensor out = Tensor::zeros({static_cast<long>(t_end - t_begin) * batch, mOutputSize});
    const Tensor& words = mParams->value(mWordLut);
    for (int t = t_begin; t < t_end; ++t) {
        for (int b = 0; b < batch; ++b) {
            float* y = out.row(static_cast<long>(t - t_begin) * batch + b);
            std::copy_n(words.row(tokens.at(t, b, 0)), mConfig.word_vec_size, y);
            int offset = mConfig.word_vec_size;
            for (std::size_t f = 0; f < mFeatLuts.size(); ++f) {
                const float* v = mParams->value(mFeatLuts[f]).row(tokens.at(t, b, static_cast<int>(f) + 1));
                if (mConfig.feat_merge == EFeatMerge::CONCAT) {
                    std::copy_n(v, mFeatDims[f], y + offset);
                    offset += mFeatDims[f];
                } else {
                    ops::axpy(1.f, v, y, mConfig.word_vec_size);
                }
            }
        }
    }

    ops::dropout_mask(mDropoutMask, out.nelem(), training ? mConfig.dropout : 0.f, rng);
    for (std::size_t i = 0; i < out.nelem(); ++i) out[i] *= mDropoutMask[i];
    return out;
}

void EmbeddingModule::backward(const TokenTensor& tokens, int t_begin, int t_end, const Tensor& d_output) {
    const int batch = tokens.Batch;
    std::vector<float> dy(mOutputSize);
    Parameter& words = mParams->at(mWordLut);
    for (int t = t_begin; t < t_end; ++t) {
        for (int b = 0; b < batch; ++b) {
            long r = static_cast<long>(t - t_begin) * batch + b;
            const float* g = d_output.row(r);
            for (int i = 0; i < mOutputSize; ++i) dy[i] = g[i] * mDropoutMask[r * mOutputSize + i];

            int id = tokens.at(t, b, 0);
            if (words.Trainable && id != PAD_INDEX) {
                ops::axpy(1.f, dy.data(), words.Grad.row(id), mConfig.word_vec_size);
            }
            int offset = mConfig.word_vec_size;
            for (std::size_t f = 0; f < mFeatLuts.size(); ++f) {
                Parameter& lut = mParams->at(mFeatLuts[f]);
                int fid = tokens.at(t, b, static_cast<int>(f) + 1);
                const float* src = dy.data();
                if (mConfig.feat_merge == EFeatMerge::CONCAT) {
                    src += offset;
                    offset += mFeatDims[f];
                }
                if (lut.Trainable && fid != PAD_INDEX) {
                    ops::axpy(1.f, src, lut.Grad.row(fid), mFeatDims[f]);
                }
            }
        }
    }
}

} // namespace modules
