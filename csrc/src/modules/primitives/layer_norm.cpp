// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "layer_norm.h"

#include <cmath>
#include <vector>

namespace modules {

LayerNormModule::LayerNormModule(ParameterStore& params, const std::string& name, int features, float epsilon)
    : mParams(&params), mFeatures(features), mEpsilon(epsilon) {
    mWeight = params.add(name + ".weight", {features});
    mBias = params.add(name + ".bias", {features});
    params.value(mWeight).fill(1.f);
}

Tensor LayerNormModule::forward(const Tensor& input) const {
    const float* w = mParams->value(mWeight).data();
    const float* b = mParams->value(mBias).data();
    Tensor out = Tensor::zeros(input.shape());
    const int n = mFeatures;
    for (long r = 0; r < input.rows(); ++r) {
        const float* x = input.row(r);
        float mean = 0.f;
        for (int i = 0; i < n; ++i) mean += x[i];
        mean /= n;
        float var = 0.f;
        for (int i = 0; i < n; ++i) var += (x[i] - mean) * (x[i] - mean);
        var /= n;
        float rstd = 1.f / std::sqrt(var + mEpsilon);
        float* y = out.row(r);
        for (int i = 0; i < n; ++i) y[i] = (x[i] - mean) * rstd * w[i] + b[i];
    }
    return out;
}

Tensor LayerNormModule::backward(const Tensor& input, const Tensor& d_output) {
    Parameter& w = mParams->at(mWeight);
    Parameter& b = mParams->at(mBias);
    Tensor d_input = Tensor::zeros(input.shape());
    const int n = mFeatures;
    std::vector<float> xhat(n);
    std::vector<float> dxhat(n);
    for (long r = 0; r < input.rows(); ++r) {
        const float* x = input.row(r);
        const float* dy = d_output.row(r);
        float mean = 0.f;
        for (int i = 0; i < n; ++i) mean += x[i];
        mean /= n;
        float var = 0.f;
        for (int i = 0; i < n; ++i) var += (x[i] - mean) * (x[i] - mean);
        var /= n;
        float rstd = 1.f / std::sqrt(var + mEpsilon);

        float sum_dxhat = 0.f;
        float sum_dxhat_xhat = 0.f;
        for (int i = 0; i < n; ++i) {
            xhat[i] = (x[i] - mean) * rstd;
            dxhat[i] = dy[i] * w.Value[i];
            sum_dxhat += dxhat[i];
            sum_dxhat_xhat += dxhat[i] * xhat[i];
            if (w.Trainable) w.Grad[i] += dy[i] * xhat[i];
            if (b.Trainable) b.Grad[i] += dy[i];
        }
        float* dx = d_input.row(r);
        for (int i = 0; i < n; ++i) {
            dx[i] = rstd * (dxhat[i] - sum_dxhat / n - xhat[i] * sum_dxhat_xhat / n);
        }
    }
    return d_input;
}

} // namespace modules
