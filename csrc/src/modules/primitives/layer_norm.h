// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_PRIMITIVES_LAYER_NORM_H
#define NMTCORE_SRC_MODULES_PRIMITIVES_LAYER_NORM_H

#include <string>

#include "modules/parameter_store.h"
#include "utilities/tensor.h"

namespace modules {

//! y = (x - mean) / sqrt(var + eps) * weight + bias, over the last dimension.
class LayerNormModule {
public:
    LayerNormModule(ParameterStore& params, const std::string& name, int features, float epsilon = 1e-6f);

    [[nodiscard]] Tensor forward(const Tensor& input) const;
    //! Recomputes the row statistics from @p input.
    Tensor backward(const Tensor& input, const Tensor& d_output);

private:
    ParameterStore* mParams;
    int mFeatures;
    float mEpsilon;
    int mWeight;
    int mBias;
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_PRIMITIVES_LAYER_NORM_H
