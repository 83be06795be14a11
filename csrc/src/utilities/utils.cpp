// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

/**
 * @brief Case-insensitive equality comparison for two string views (ASCII-ish semantics).
 *
 * Compares the two views element-wise after converting each byte to lowercase via
 * std::tolower on an unsigned-char widened value.
 *
 * @param lhs Left-hand string view.
 * @param rhs Right-hand string view.
 * @return True if both views have the same length and match case-insensitively; false otherwise.
 */
bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
    });
}

std::string join_names(const std::vector<std::string_view>& names) {
    return fmt::format("{}", fmt::join(names, ", "));
}
