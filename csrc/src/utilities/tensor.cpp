// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

Tensor Tensor::zeros(const std::vector<long>& shape) {
    if (shape.empty() || shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error(fmt::format("Invalid tensor rank {}", shape.size()));
    }
    Tensor t;
    t.Rank = static_cast<int>(shape.size());
    std::size_t n = 1;
    for (int i = 0; i < t.Rank; ++i) {
        if (shape[i] < 0) throw std::runtime_error("Negative tensor dimension");
        t.Sizes[i] = shape[i];
        n *= shape[i];
    }
    for (int i = t.Rank; i < MAX_TENSOR_DIM; ++i) t.Sizes[i] = 1;
    t.Data.assign(n, 0.f);
    return t;
}

Tensor Tensor::from_values(const std::vector<long>& shape, std::vector<float> values) {
    Tensor t = zeros(shape);
    if (values.size() != t.nelem()) {
        throw std::runtime_error(fmt::format("Expected {} values for shape {}, got {}",
                                             t.nelem(), shape_to_str(shape), values.size()));
    }
    t.Data = std::move(values);
    return t;
}

void Tensor::fill(float value) {
    std::fill(Data.begin(), Data.end(), value);
}

bool Tensor::same_shape(const Tensor& other) const {
    if (Rank != other.Rank) return false;
    return std::equal(Sizes.begin(), Sizes.begin() + Rank, other.Sizes.begin());
}

/**
 * @brief Copy a contiguous range of rows (dimension 0) into a new tensor.
 *
 * @param src Source tensor; must have rank >= 1.
 * @param start First row (inclusive).
 * @param end Last row (exclusive).
 * @return Tensor with Sizes[0] == end - start and the remaining dims of @p src.
 *
 * @throws std::out_of_range If the range is not within [0, src.rows()].
 */
Tensor slice_rows(const Tensor& src, long start, long end) {
    if (start < 0 || end > src.rows() || start > end) {
        throw std::out_of_range(fmt::format("Row slice [{}, {}) out of range for shape {}",
                                            start, end, shape_to_str(src)));
    }
    auto shape = src.shape();
    shape[0] = end - start;
    Tensor dst = Tensor::zeros(shape);
    std::copy(src.row(start), src.row(start) + (end - start) * src.row_size(), dst.data());
    return dst;
}

std::string shape_to_str(const std::vector<long>& shape) {
    return fmt::format("[{}]", fmt::join(shape, ", "));
}

std::string shape_to_str(const Tensor& t) {
    return shape_to_str(t.shape());
}
