// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

struct TestSizeConfig {
    int Workers = 4;            // in-process workers for the distributed tests
    int MaxDim = 8;             // max_preconditioner_dim of the multi-tensor tests
    int Steps = 6;
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if(cfg.Workers < 2 || cfg.Workers % 2 != 0) {
        fprintf(stderr, "ERROR: Workers must be an even number >= 2\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
