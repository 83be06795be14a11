// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_DECODERS_H
#define NMTCORE_SRC_MODULES_DECODERS_H

#include <random>
#include <vector>

#include "modules/encoders.h"
#include "modules/parameter_store.h"
#include "modules/primitives/linear.h"
#include "utilities/tensor.h"

namespace modules {

struct DecoderOutput {
    Tensor Outputs;         ///< (T * B, H) after dropout
    Tensor Attention;       ///< (T * B, S) attention distributions
};

struct DecoderGradients {
    Tensor DEmbedded;       ///< (T * B, E)
    Tensor DMemory;         ///< (S * B, H)
    Tensor DFinal;          ///< (B, H), zero unless the window started from the encoder state
};

/**
 * @brief Target decoder interface.
 *
 * The recurrent state survives between forward calls so that a long target can be
 * processed in consecutive windows. init_state() starts a new sequence from the
 * encoder; detach_state() keeps the values but cuts the gradient path into the
 * previous window.
 */
class IDecoder {
public:
    virtual ~IDecoder() = default;

    virtual void init_state(const EncoderOutput& encoder) = 0;

    virtual DecoderOutput forward(const Tensor& embedded, int tgt_len, const EncoderOutput& encoder,
                                  const std::vector<int>& src_lengths, bool training, std::mt19937& rng) = 0;

    //! @param d_attention Optional gradient w.r.t. the attention distributions.
    virtual DecoderGradients backward(const Tensor& d_outputs, const Tensor* d_attention) = 0;

    virtual void detach_state() = 0;
    virtual void update_dropout(float p) = 0;

    [[nodiscard]] virtual bool has_state() const = 0;
    [[nodiscard]] virtual int hidden_size() const = 0;
};

/**
 * @brief Elman RNN decoder with global dot attention.
 *
 * Per step: h_t = tanh(W_ih x_t + b + W_hh h_{t-1}), a_t = softmax(h_t . m) over the
 * valid source positions, c_t = sum a_t m, o_t = dropout(tanh(W_out [c_t; h_t] + b_out)).
 */
class RnnDecoder : public IDecoder {
public:
    RnnDecoder(ParameterStore& params, int input_size, int hidden_size, float dropout)
        : RnnDecoder(params, input_size, hidden_size, dropout, false) {}

    void init_state(const EncoderOutput& encoder) override;
    DecoderOutput forward(const Tensor& embedded, int tgt_len, const EncoderOutput& encoder,
                          const std::vector<int>& src_lengths, bool training, std::mt19937& rng) override;
    DecoderGradients backward(const Tensor& d_outputs, const Tensor* d_attention) override;

    void detach_state() override { mStateFromEncoder = false; }
    void update_dropout(float p) override { mDropout = p; }

    [[nodiscard]] bool has_state() const override { return mHidden.has_value(); }
    [[nodiscard]] int hidden_size() const override { return mHiddenSize; }
    [[nodiscard]] bool input_feed() const { return mInputFeed; }

protected:
    RnnDecoder(ParameterStore& params, int input_size, int hidden_size, float dropout, bool input_feed);

private:
    LinearModule mInputProj;
    LinearModule mHiddenProj;
    LinearModule mOutProj;
    int mInputSize;
    int mHiddenSize;
    float mDropout;
    bool mInputFeed;

    // carried state, (B, H)
    Tensor mHidden;
    Tensor mFeed;
    bool mStateFromEncoder = false;

    // cache of the last forward window
    struct StepCache {
        Tensor Inputs;      ///< (T * B, E [+ H])
        Tensor States;      ///< ((T + 1) * B, H), block 0 is the window's initial state
        Tensor Contexts;    ///< (T * B, H)
        Tensor PreDropout;  ///< (T * B, H)
        Tensor Attention;   ///< (T * B, S)
        std::vector<float> Mask;
        Tensor Memory;
        std::vector<int> SrcLengths;
        int TgtLen = 0;
        int SrcLen = 0;
        int Batch = 0;
        bool FromEncoder = false;
    } mCache;
};

//! RnnDecoder whose step input is [embedding; previous attentional output].
class InputFeedRnnDecoder : public RnnDecoder {
public:
    InputFeedRnnDecoder(ParameterStore& params, int input_size, int hidden_size, float dropout)
        : RnnDecoder(params, input_size, hidden_size, dropout, true) {}
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_DECODERS_H
