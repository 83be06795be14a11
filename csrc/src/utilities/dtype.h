// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_UTILS_DTYPE_H
#define NMTCORE_SRC_UTILS_DTYPE_H

#include <cstddef>
#include <string_view>

//! Storage precision of parameters. Host buffers are always FP32; narrower
//! types are emulated by rounding.
enum class ETensorDType : int {
    FP32,
    FP16,
    BF16,
};

std::size_t get_dtype_size(ETensorDType dtype);
const char* dtype_to_str(ETensorDType dtype);
ETensorDType dtype_from_str(std::string_view dtype);

//! Round a single value to the nearest value representable in @p dtype.
float round_to_dtype(float value, ETensorDType dtype);

//! Round @p count values in place to the precision of @p dtype.
void round_to_dtype(float* values, std::size_t count, ETensorDType dtype);

#endif //NMTCORE_SRC_UTILS_DTYPE_H
