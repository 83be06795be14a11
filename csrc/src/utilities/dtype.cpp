// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <fmt/core.h>

#include "utils.h"

std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return 4;
        case ETensorDType::FP16: return 2;
        case ETensorDType::BF16: return 2;
    }
    throw std::logic_error("Unknown dtype");
}

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "fp32";
        case ETensorDType::FP16: return "fp16";
        case ETensorDType::BF16: return "bf16";
    }
    throw std::logic_error("Unknown dtype");
}

ETensorDType dtype_from_str(std::string_view dtype) {
    if (iequals(dtype, "fp32") || iequals(dtype, "float32")) return ETensorDType::FP32;
    if (iequals(dtype, "fp16") || iequals(dtype, "float16")) return ETensorDType::FP16;
    if (iequals(dtype, "bf16") || iequals(dtype, "bfloat16")) return ETensorDType::BF16;
    throw config_error(fmt::format("Unknown dtype '{}'", dtype));
}

namespace {

float round_to_fp16(float value) {
    if (!std::isfinite(value) || value == 0.f) return value;
    constexpr float kMaxHalf = 65504.f;
    float mag = std::fabs(value);
    int exponent = static_cast<int>(std::floor(std::log2(mag)));
    // subnormals share the quantum of the smallest normal exponent
    float quantum = std::ldexp(1.f, std::max(exponent, -14) - 10);
    float rounded = std::nearbyint(mag / quantum) * quantum;
    if (rounded > kMaxHalf) rounded = std::numeric_limits<float>::infinity();
    return std::copysign(rounded, value);
}

float round_to_bf16(float value) {
    if (std::isnan(value)) return value;
    auto bits = std::bit_cast<std::uint32_t>(value);
    bits += 0x7FFFu + ((bits >> 16) & 1u);
    bits &= 0xFFFF0000u;
    return std::bit_cast<float>(bits);
}

} // namespace

float round_to_dtype(float value, ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return value;
        case ETensorDType::FP16: return round_to_fp16(value);
        case ETensorDType::BF16: return round_to_bf16(value);
    }
    throw std::logic_error("Unknown dtype");
}

void round_to_dtype(float* values, std::size_t count, ETensorDType dtype) {
    if (dtype == ETensorDType::FP32) return;
    for (std::size_t i = 0; i < count; ++i) {
        values[i] = round_to_dtype(values[i], dtype);
    }
}
