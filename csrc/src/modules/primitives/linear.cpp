// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "linear.h"

#include <stdexcept>

#include <fmt/core.h>

#include "modules/primitives/ops.h"

namespace modules {

LinearModule::LinearModule(ParameterStore& params, const std::string& name, Config config)
    : mParams(&params), mConfig(config) {
    mWeight = params.add(name + ".weight", {config.out_features, config.in_features});
    if (config.has_bias) {
        mBias = params.add(name + ".bias", {config.out_features});
    }
}

void LinearModule::forward_row(const float* x, float* y) const {
    const Tensor& w = mParams->value(mWeight);
    const float* b = mBias >= 0 ? mParams->value(mBias).data() : nullptr;
    for (int o = 0; o < mConfig.out_features; ++o) {
        y[o] = ops::dot(w.row(o), x, mConfig.in_features) + (b ? b[o] : 0.f);
    }
}

void LinearModule::backward_row(const float* x, const float* dy, float* dx) {
    Parameter& w = mParams->at(mWeight);
    const int in = mConfig.in_features;
    for (int o = 0; o < mConfig.out_features; ++o) {
        if (dy[o] == 0.f) continue;
        if (w.Trainable) ops::axpy(dy[o], x, w.Grad.row(o), in);
        if (dx) ops::axpy(dy[o], w.Value.row(o), dx, in);
    }
    if (mBias >= 0) {
        Parameter& b = mParams->at(mBias);
        if (b.Trainable) ops::axpy(1.f, dy, b.Grad.data(), mConfig.out_features);
    }
}

Tensor LinearModule::forward(const Tensor& input) const {
    if (input.row_size() != mConfig.in_features) {
        throw std::logic_error(fmt::format("Linear expects {} input features, got {}",
                                           mConfig.in_features, shape_to_str(input)));
    }
    Tensor out = Tensor::zeros({input.rows(), mConfig.out_features});
    for (long r = 0; r < input.rows(); ++r) {
        forward_row(input.row(r), out.row(r));
    }
    return out;
}

Tensor LinearModule::backward(const Tensor& input, const Tensor& d_output) {
    Tensor d_input = Tensor::zeros({input.rows(), mConfig.in_features});
    for (long r = 0; r < input.rows(); ++r) {
        backward_row(input.row(r), d_output.row(r), d_input.row(r));
    }
    return d_input;
}

} // namespace modules
