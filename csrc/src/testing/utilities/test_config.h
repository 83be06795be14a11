// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

struct TestSizeConfig {
    int B = 3;          // sentences per batch
    int SrcLen = 5;
    int TgtLen = 6;     // including <s> and </s>
    int H = 8;          // embedding and hidden size
    int Words = 12;     // non-special tokens per side
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if (cfg.TgtLen < 3 || cfg.SrcLen < 2) {
        fprintf(stderr, "ERROR: sentences must have at least two tokens\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
