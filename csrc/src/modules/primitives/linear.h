// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_PRIMITIVES_LINEAR_H
#define NMTCORE_SRC_MODULES_PRIMITIVES_LINEAR_H

#include <string>

#include "modules/parameter_store.h"
#include "utilities/tensor.h"

namespace modules {

/**
 * @brief Linear projection module: y = x @ W^T + b
 *
 * Weight layout:
 * - weight: (out_features, in_features)
 * - bias: (out_features,) optional
 *
 * Gradients are accumulated into the parameter store; frozen weights are skipped.
 */
class LinearModule {
public:
    struct Config {
        int in_features;            ///< Input dimension
        int out_features;           ///< Output dimension
        bool has_bias = true;       ///< Whether to add bias after matmul
    };

    LinearModule(ParameterStore& params, const std::string& name, Config config);

    //! (N, in) -> (N, out)
    [[nodiscard]] Tensor forward(const Tensor& input) const;

    /**
     * @brief Backward pass for a batch of rows.
     * @param input The input of the matching forward call.
     * @param d_output Gradient w.r.t. the output, (N, out).
     * @return Gradient w.r.t. the input, (N, in).
     */
    Tensor backward(const Tensor& input, const Tensor& d_output);

    //! Single row forward: y = W x + b.
    void forward_row(const float* x, float* y) const;
    //! Single row backward; adds into @p dx when it is not null.
    void backward_row(const float* x, const float* dy, float* dx);

    [[nodiscard]] int weight_slot() const { return mWeight; }
    [[nodiscard]] int bias_slot() const { return mBias; }
    [[nodiscard]] const Config& config() const { return mConfig; }

private:
    ParameterStore* mParams;
    Config mConfig;
    int mWeight;
    int mBias = -1;
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_PRIMITIVES_LINEAR_H
