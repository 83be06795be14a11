// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "decoders.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "modules/primitives/ops.h"

namespace modules {

RnnDecoder::RnnDecoder(ParameterStore& params, int input_size, int hidden_size, float dropout, bool input_feed)
    : mInputProj(params, "decoder.rnn.input", {input_size + (input_feed ? hidden_size : 0), hidden_size, true}),
      mHiddenProj(params, "decoder.rnn.hidden", {hidden_size, hidden_size, false}),
      mOutProj(params, "decoder.attn.linear_out", {2 * hidden_size, hidden_size, true}),
      mInputSize(input_size), mHiddenSize(hidden_size), mDropout(dropout), mInputFeed(input_feed) {
}

void RnnDecoder::init_state(const EncoderOutput& encoder) {
    if (encoder.FinalState.row_size() != mHiddenSize) {
        throw std::logic_error(fmt::format("Decoder of size {} cannot start from encoder state {}",
                                           mHiddenSize, shape_to_str(encoder.FinalState)));
    }
    mHidden = encoder.FinalState;
    mFeed = Tensor::zeros({encoder.FinalState.rows(), mHiddenSize});
    mStateFromEncoder = true;
}

/**
 * @brief Run the decoder over one target window.
 *
 * @param embedded (T * B, E) target embeddings of the window.
 * @param tgt_len Number of time steps T in the window.
 * @param encoder Encoder output of the same batch.
 * @param src_lengths Valid source positions per batch entry; the rest is masked.
 * @param training Enables output dropout.
 * @param rng Dropout randomness.
 * @return Attentional outputs and attention distributions of the window.
 */
DecoderOutput RnnDecoder::forward(const Tensor& embedded, int tgt_len, const EncoderOutput& encoder,
                                  const std::vector<int>& src_lengths, bool training, std::mt19937& rng) {
    if (!has_state()) {
        throw std::logic_error("Decoder state used before init_state");
    }
    const int batch = static_cast<int>(src_lengths.size());
    const int H = mHiddenSize;
    const int S = batch == 0 ? 0 : static_cast<int>(encoder.MemoryBank.rows() / batch);
    const int X = mInputSize + (mInputFeed ? H : 0);
    const long rows = static_cast<long>(tgt_len) * batch;

    StepCache& c = mCache;
    c.TgtLen = tgt_len;
    c.SrcLen = S;
    c.Batch = batch;
    c.FromEncoder = mStateFromEncoder;
    c.Memory = encoder.MemoryBank;
    c.SrcLengths = src_lengths;
    c.Inputs = Tensor::zeros({rows, X});
    c.States = Tensor::zeros({static_cast<long>(tgt_len + 1) * batch, H});
    c.Contexts = Tensor::zeros({rows, H});
    c.PreDropout = Tensor::zeros({rows, H});
    c.Attention = Tensor::zeros({rows, S});
    std::copy(mHidden.Data.begin(), mHidden.Data.end(), c.States.data());
    ops::dropout_mask(c.Mask, rows * H, training ? mDropout : 0.f, rng);

    DecoderOutput out;
    out.Outputs = Tensor::zeros({rows, H});
    std::vector<float> rec(H);
    std::vector<float> cat(2 * H);
    Tensor feed = mFeed;

    for (int t = 0; t < tgt_len; ++t) {
        for (int b = 0; b < batch; ++b) {
            const long r = static_cast<long>(t) * batch + b;
            float* x = c.Inputs.row(r);
            std::copy_n(embedded.row(r), mInputSize, x);
            if (mInputFeed) std::copy_n(feed.row(b), H, x + mInputSize);

            const float* h_prev = c.States.row(r);
            float* h = c.States.row(r + batch);
            mInputProj.forward_row(x, h);
            mHiddenProj.forward_row(h_prev, rec.data());
            for (int i = 0; i < H; ++i) h[i] = std::tanh(h[i] + rec[i]);

            float* a = c.Attention.row(r);
            for (int s = 0; s < S; ++s) {
                a[s] = s < src_lengths[b]
                    ? ops::dot(h, c.Memory.row(static_cast<long>(s) * batch + b), H)
                    : -std::numeric_limits<float>::infinity();
            }
            if (S > 0) ops::softmax(a, S);

            float* ctx = c.Contexts.row(r);
            for (int s = 0; s < S; ++s) {
                if (a[s] != 0.f) ops::axpy(a[s], c.Memory.row(static_cast<long>(s) * batch + b), ctx, H);
            }

            std::copy_n(ctx, H, cat.data());
            std::copy_n(h, H, cat.data() + H);
            float* o = c.PreDropout.row(r);
            mOutProj.forward_row(cat.data(), o);
            float* y = out.Outputs.row(r);
            for (int i = 0; i < H; ++i) {
                o[i] = std::tanh(o[i]);
                y[i] = o[i] * c.Mask[r * H + i];
            }
            std::copy_n(y, H, feed.row(b));
        }
    }

    mHidden = slice_rows(c.States, static_cast<long>(tgt_len) * batch, static_cast<long>(tgt_len + 1) * batch);
    mFeed = std::move(feed);
    out.Attention = c.Attention;
    return out;
}

/**
 * @brief Backpropagation through the cached window.
 *
 * Gradients reaching the window's initial state are returned as DFinal only when
 * that state came from the encoder in the same forward call; a state carried over
 * from an earlier window is treated as a constant.
 */
DecoderGradients RnnDecoder::backward(const Tensor& d_outputs, const Tensor* d_attention) {
    const StepCache& c = mCache;
    const int batch = c.Batch;
    const int H = mHiddenSize;
    const int S = c.SrcLen;
    const int X = mInputSize + (mInputFeed ? H : 0);
    const long rows = static_cast<long>(c.TgtLen) * batch;
    if (d_outputs.rows() != rows) {
        throw std::logic_error(fmt::format("Decoder backward expects {} rows, got {}", rows, d_outputs.rows()));
    }

    DecoderGradients grads;
    grads.DEmbedded = Tensor::zeros({rows, mInputSize});
    grads.DMemory = Tensor::zeros({c.Memory.rows(), H});
    grads.DFinal = Tensor::zeros({batch, H});

    // gradient w.r.t. the post-dropout outputs, input feeding adds to it
    Tensor d_out = d_outputs;
    Tensor dh_next = Tensor::zeros({batch, H});
    std::vector<float> dz(H), dcat(2 * H), da(S), ds(S), dpre(H), dx(X), dprev(H), cat(2 * H);

    for (int t = c.TgtLen - 1; t >= 0; --t) {
        for (int b = 0; b < batch; ++b) {
            const long r = static_cast<long>(t) * batch + b;
            const float* o = c.PreDropout.row(r);
            const float* g = d_out.row(r);
            for (int i = 0; i < H; ++i) {
                float d = g[i] * c.Mask[r * H + i];
                dz[i] = d * (1.f - o[i] * o[i]);
            }

            const float* ctx = c.Contexts.row(r);
            const float* h = c.States.row(r + batch);
            std::copy_n(ctx, H, cat.data());
            std::copy_n(h, H, cat.data() + H);
            std::fill(dcat.begin(), dcat.end(), 0.f);
            mOutProj.backward_row(cat.data(), dz.data(), dcat.data());

            float* dh = dh_next.row(b);
            ops::axpy(1.f, dcat.data() + H, dh, H);

            // attention: c = sum_s a_s m_s, a = softmax(h . m)
            const float* a = c.Attention.row(r);
            for (int s = 0; s < S; ++s) {
                const float* m = c.Memory.row(static_cast<long>(s) * batch + b);
                da[s] = ops::dot(dcat.data(), m, H);
                if (d_attention) da[s] += d_attention->row(r)[s];
                if (a[s] != 0.f) ops::axpy(a[s], dcat.data(), grads.DMemory.row(static_cast<long>(s) * batch + b), H);
            }
            if (S > 0) ops::softmax_backward(a, da.data(), ds.data(), S);
            for (int s = 0; s < S; ++s) {
                if (ds[s] == 0.f) continue;
                float* dm = grads.DMemory.row(static_cast<long>(s) * batch + b);
                ops::axpy(ds[s], c.Memory.row(static_cast<long>(s) * batch + b), dh, H);
                ops::axpy(ds[s], h, dm, H);
            }

            for (int i = 0; i < H; ++i) dpre[i] = dh[i] * (1.f - h[i] * h[i]);
            std::fill(dx.begin(), dx.end(), 0.f);
            mInputProj.backward_row(c.Inputs.row(r), dpre.data(), dx.data());
            std::copy_n(dx.data(), mInputSize, grads.DEmbedded.row(r));
            if (mInputFeed && t > 0) {
                ops::axpy(1.f, dx.data() + mInputSize, d_out.row(r - batch), H);
            }

            std::fill(dprev.begin(), dprev.end(), 0.f);
            mHiddenProj.backward_row(c.States.row(r), dpre.data(), dprev.data());
            std::copy(dprev.begin(), dprev.end(), dh);
        }
    }

    if (c.FromEncoder) {
        grads.DFinal = std::move(dh_next);
    }
    return grads;
}

} // namespace modules
