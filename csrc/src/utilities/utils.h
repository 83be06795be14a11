// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_UTILS_UTILS_H
#define NMTCORE_SRC_UTILS_UTILS_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/// Invalid or inconsistent options. Always fatal, raised before training starts.
class config_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Raised when a vocabulary/embedding migration cannot be carried out.
class migration_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Checkpoint read/write or format failure. Never recovered.
class checkpoint_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Non-finite value produced while computing a loss.
class numerical_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<std::integral T>
constexpr T div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

bool iequals(std::string_view lhs, std::string_view rhs);

//! Comma separated list of the given names, for error messages.
std::string join_names(const std::vector<std::string_view>& names);

//! Step-indexed lookup: index of the last threshold strictly below @p step (0 if none).
template<class Int>
std::size_t active_schedule_index(const std::vector<Int>& thresholds, int step) {
    std::size_t active = 0;
    for (std::size_t i = 0; i < thresholds.size(); ++i) {
        if (step > thresholds[i]) active = i;
    }
    return active;
}

#endif //NMTCORE_SRC_UTILS_UTILS_H
