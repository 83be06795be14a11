// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_ENCODERS_H
#define NMTCORE_SRC_MODULES_ENCODERS_H

#include <vector>

#include "modules/parameter_store.h"
#include "modules/primitives/linear.h"
#include "utilities/tensor.h"

namespace modules {

struct EncoderOutput {
    Tensor MemoryBank;      ///< (S * B, H), row s * B + b
    Tensor FinalState;      ///< (B, H), initial decoder state
};

/**
 * @brief Source encoder interface.
 *
 * forward() keeps what backward() needs; backward() must follow the forward call
 * it differentiates.
 */
class IEncoder {
public:
    virtual ~IEncoder() = default;

    virtual EncoderOutput forward(const Tensor& embedded, int src_len, const std::vector<int>& lengths) = 0;

    //! Gradient w.r.t. the embedded input of the last forward call.
    virtual Tensor backward(const Tensor& d_memory, const Tensor& d_final) = 0;

    [[nodiscard]] virtual int hidden_size() const = 0;
};

//! Per-position projection; the final state is the mean over the valid positions.
class MeanEncoder : public IEncoder {
public:
    MeanEncoder(ParameterStore& params, int input_size, int hidden_size);

    EncoderOutput forward(const Tensor& embedded, int src_len, const std::vector<int>& lengths) override;
    Tensor backward(const Tensor& d_memory, const Tensor& d_final) override;
    [[nodiscard]] int hidden_size() const override { return mHiddenSize; }

private:
    LinearModule mProj;
    int mHiddenSize;

    Tensor mInput;
    std::vector<int> mLengths;
    int mSrcLen = 0;
};

//! Single layer Elman RNN, h_t = tanh(W_ih x_t + b + W_hh h_{t-1}). Padding carries the state.
class RnnEncoder : public IEncoder {
public:
    RnnEncoder(ParameterStore& params, int input_size, int hidden_size);

    EncoderOutput forward(const Tensor& embedded, int src_len, const std::vector<int>& lengths) override;
    Tensor backward(const Tensor& d_memory, const Tensor& d_final) override;
    [[nodiscard]] int hidden_size() const override { return mHiddenSize; }

private:
    LinearModule mInputProj;
    LinearModule mHiddenProj;
    int mInputSize;
    int mHiddenSize;

    Tensor mInput;
    //! (S + 1) * B rows; row block 0 is the zero initial state
    Tensor mStates;
    std::vector<int> mLengths;
    int mSrcLen = 0;
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_ENCODERS_H
