// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "encoders.h"

#include <algorithm>
#include <cmath>

#include "modules/primitives/ops.h"

namespace modules {

MeanEncoder::MeanEncoder(ParameterStore& params, int input_size, int hidden_size)
    : mProj(params, "encoder.proj", {input_size, hidden_size, true}), mHiddenSize(hidden_size) {
}

EncoderOutput MeanEncoder::forward(const Tensor& embedded, int src_len, const std::vector<int>& lengths) {
    const int batch = static_cast<int>(lengths.size());
    mInput = embedded;
    mLengths = lengths;
    mSrcLen = src_len;

    EncoderOutput out;
    out.MemoryBank = mProj.forward(embedded);
    out.FinalState = Tensor::zeros({batch, mHiddenSize});
    for (int b = 0; b < batch; ++b) {
        int len = std::min(lengths[b], src_len);
        if (len == 0) continue;
        for (int t = 0; t < len; ++t) {
            ops::axpy(1.f / len, out.MemoryBank.row(static_cast<long>(t) * batch + b), out.FinalState.row(b), mHiddenSize);
        }
    }
    return out;
}

Tensor MeanEncoder::backward(const Tensor& d_memory, const Tensor& d_final) {
    const int batch = static_cast<int>(mLengths.size());
    Tensor d_proj = d_memory;
    for (int b = 0; b < batch; ++b) {
        int len = std::min(mLengths[b], mSrcLen);
        for (int t = 0; t < len; ++t) {
            ops::axpy(1.f / len, d_final.row(b), d_proj.row(static_cast<long>(t) * batch + b), mHiddenSize);
        }
    }
    return mProj.backward(mInput, d_proj);
}

RnnEncoder::RnnEncoder(ParameterStore& params, int input_size, int hidden_size)
    : mInputProj(params, "encoder.rnn.input", {input_size, hidden_size, true}),
      mHiddenProj(params, "encoder.rnn.hidden", {hidden_size, hidden_size, false}),
      mInputSize(input_size), mHiddenSize(hidden_size) {
}

EncoderOutput RnnEncoder::forward(const Tensor& embedded, int src_len, const std::vector<int>& lengths) {
    const int batch = static_cast<int>(lengths.size());
    const int H = mHiddenSize;
    mInput = embedded;
    mLengths = lengths;
    mSrcLen = src_len;
    mStates = Tensor::zeros({static_cast<long>(src_len + 1) * batch, H});

    std::vector<float> rec(H);
    for (int t = 0; t < src_len; ++t) {
        for (int b = 0; b < batch; ++b) {
            const float* prev = mStates.row(static_cast<long>(t) * batch + b);
            float* h = mStates.row(static_cast<long>(t + 1) * batch + b);
            if (t >= lengths[b]) {
                std::copy_n(prev, H, h);
                continue;
            }
            mInputProj.forward_row(embedded.row(static_cast<long>(t) * batch + b), h);
            mHiddenProj.forward_row(prev, rec.data());
            for (int i = 0; i < H; ++i) h[i] = std::tanh(h[i] + rec[i]);
        }
    }

    EncoderOutput out;
    out.MemoryBank = slice_rows(mStates, batch, static_cast<long>(src_len + 1) * batch);
    out.FinalState = slice_rows(mStates, static_cast<long>(src_len) * batch, static_cast<long>(src_len + 1) * batch);
    return out;
}

/**
 * @brief Backpropagation through time over the cached source sequence.
 *
 * Padded positions pass the state gradient through unchanged, mirroring the
 * carried state of the forward pass.
 */
Tensor RnnEncoder::backward(const Tensor& d_memory, const Tensor& d_final) {
    const int batch = static_cast<int>(mLengths.size());
    const int H = mHiddenSize;
    Tensor d_input = Tensor::zeros({static_cast<long>(mSrcLen) * batch, mInputSize});
    Tensor dh = d_final;
    std::vector<float> dpre(H);
    std::vector<float> dprev(H);

    for (int t = mSrcLen - 1; t >= 0; --t) {
        for (int b = 0; b < batch; ++b) {
            long r = static_cast<long>(t) * batch + b;
            float* g = dh.row(b);
            ops::axpy(1.f, d_memory.row(r), g, H);
            if (t >= mLengths[b]) continue;

            const float* h = mStates.row(r + batch);
            for (int i = 0; i < H; ++i) dpre[i] = g[i] * (1.f - h[i] * h[i]);
            mInputProj.backward_row(mInput.row(r), dpre.data(), d_input.row(r));
            std::fill(dprev.begin(), dprev.end(), 0.f);
            mHiddenProj.backward_row(mStates.row(r), dpre.data(), dprev.data());
            std::copy(dprev.begin(), dprev.end(), g);
        }
    }
    return d_input;
}

} // namespace modules
