// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_UTILS_TENSOR_H
#define NMTCORE_SRC_UTILS_TENSOR_H

#include <array>
#include <cstddef>
#include <string>
#include <vector>

constexpr int MAX_TENSOR_DIM = 4;

//! \brief Owning, contiguous, row-major host tensor of FP32 values.
//! Row operations treat dimension 0 as rows and flatten the rest.
struct Tensor {
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    int Rank = 0;
    std::vector<float> Data;

    static Tensor zeros(const std::vector<long>& shape);
    static Tensor from_values(const std::vector<long>& shape, std::vector<float> values);

    [[nodiscard]] std::size_t nelem() const {
        if (Rank == 0) return 0;
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] std::size_t bytes() const { return nelem() * sizeof(float); }
    [[nodiscard]] bool has_value() const { return Rank > 0; }
    [[nodiscard]] std::vector<long> shape() const { return {Sizes.begin(), Sizes.begin() + Rank}; }

    [[nodiscard]] long rows() const { return Rank == 0 ? 0 : Sizes[0]; }
    [[nodiscard]] long row_size() const {
        long sz = 1;
        for (int i = 1; i < Rank; ++i) sz *= Sizes[i];
        return sz;
    }

    float* row(long r) { return Data.data() + r * row_size(); }
    [[nodiscard]] const float* row(long r) const { return Data.data() + r * row_size(); }

    float* data() { return Data.data(); }
    [[nodiscard]] const float* data() const { return Data.data(); }

    float& operator[](std::size_t i) { return Data[i]; }
    float operator[](std::size_t i) const { return Data[i]; }

    void fill(float value);
    [[nodiscard]] bool same_shape(const Tensor& other) const;
};

//! Copy of rows [start, end) of @p src.
Tensor slice_rows(const Tensor& src, long start, long end);

//! Human readable shape, e.g. "[32, 512]".
std::string shape_to_str(const Tensor& t);
std::string shape_to_str(const std::vector<long>& shape);

#endif //NMTCORE_SRC_UTILS_TENSOR_H
