// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for curvature classification, dimension merging and block decomposition.

#include <catch2/catch_test_macros.hpp>

#include <numeric>
#include <vector>

#include "optimizers/size_model.h"

using namespace shampoo;

namespace {

ShampooConfig make_config(ELargeDimMethod method, int max_dim, bool merge = true) {
    ShampooConfig config;
    config.large_dim_method = method;
    config.max_preconditioner_dim = max_dim;
    config.use_merge_dims = merge;
    return config;
}

} // namespace

TEST_CASE("merge_small_dims merges greedily from the front", "[size_model]") {
    REQUIRE(merge_small_dims({2, 3, 4}, 1024) == std::vector<long>{24});
    REQUIRE(merge_small_dims({2, 3, 4}, 6) == std::vector<long>{6, 4});
    REQUIRE(merge_small_dims({2048, 64}, 1024) == std::vector<long>{2048, 64});
    REQUIRE(merge_small_dims({1, 1, 5}, 4) == std::vector<long>{1, 5});
    REQUIRE(merge_small_dims({}, 16) == std::vector<long>{1});
}

TEST_CASE("split_extent cuts into max_dim chunks", "[size_model]") {
    REQUIRE(split_extent(10, 4) == std::vector<long>{4, 4, 2});
    REQUIRE(split_extent(8, 4) == std::vector<long>{4, 4});
    REQUIRE(split_extent(3, 4) == std::vector<long>{3});
}

TEST_CASE("Blocking splits a 2048x64 matrix into two 1024x64 blocks", "[size_model]") {
    const auto plan = classify({2048, 64}, make_config(ELargeDimMethod::BLOCKING, 1024));

    REQUIRE(plan.Kind == ECurvatureKind::BLOCK);
    REQUIRE(plan.PreconditionedShape == std::vector<long>{2048, 64});
    REQUIRE(plan.Blocks.size() == 2);
    REQUIRE(plan.Blocks[0].Offsets == std::vector<long>{0, 0});
    REQUIRE(plan.Blocks[0].Extents == std::vector<long>{1024, 64});
    REQUIRE(plan.Blocks[1].Offsets == std::vector<long>{1024, 0});
    REQUIRE(plan.Blocks[1].Extents == std::vector<long>{1024, 64});

    const auto sizes = buffer_sizes(plan, ETensorDType::FP32);
    REQUIRE(sizes == std::vector<std::size_t>{1024 * 64 * 4, 1024 * 64 * 4});
    REQUIRE(preconditioner_parameter_count(plan) == 2 * (2 * 1024 * 1024 + 2 * 64 * 64));
}

TEST_CASE("Blocking keeps small tensors whole", "[size_model]") {
    SECTION("merged") {
        const auto plan = classify({4, 8, 2}, make_config(ELargeDimMethod::BLOCKING, 1024));
        REQUIRE(plan.Kind == ECurvatureKind::FULL);
        REQUIRE(plan.PreconditionedShape == std::vector<long>{64});
        REQUIRE(plan.Blocks.size() == 1);
    }
    SECTION("unmerged") {
        const auto plan = classify({4, 8, 2}, make_config(ELargeDimMethod::BLOCKING, 1024, false));
        REQUIRE(plan.Kind == ECurvatureKind::FULL);
        REQUIRE(plan.PreconditionedShape == std::vector<long>{4, 8, 2});
        REQUIRE(preconditioner_parameter_count(plan) == 2 * (16 + 64 + 4));
    }
    SECTION("scalar") {
        const auto plan = classify({}, make_config(ELargeDimMethod::BLOCKING, 1024));
        REQUIRE(plan.Kind == ECurvatureKind::FULL);
        REQUIRE(plan.PreconditionedShape == std::vector<long>{1});
        REQUIRE(buffer_sizes(plan, ETensorDType::FP64) == std::vector<std::size_t>{8});
    }
}

TEST_CASE("Blocking orders blocks row-major", "[size_model]") {
    const auto plan = classify({5, 3}, make_config(ELargeDimMethod::BLOCKING, 2, false));
    REQUIRE(plan.Kind == ECurvatureKind::BLOCK);
    REQUIRE(plan.Blocks.size() == 6);
    REQUIRE(plan.Blocks[0].Offsets == std::vector<long>{0, 0});
    REQUIRE(plan.Blocks[1].Offsets == std::vector<long>{0, 2});
    REQUIRE(plan.Blocks[1].Extents == std::vector<long>{2, 1});
    REQUIRE(plan.Blocks[5].Offsets == std::vector<long>{4, 2});
    REQUIRE(plan.Blocks[5].Extents == std::vector<long>{1, 1});

    long total = 0;
    for (const auto& block : plan.Blocks) {
        total += block.numel();
    }
    REQUIRE(total == 15);
}

TEST_CASE("Adagrad fallback makes oversized tensors diagonal", "[size_model]") {
    const auto config = make_config(ELargeDimMethod::ADAGRAD, 1024);

    const auto large = classify({2048, 64}, config);
    REQUIRE(large.Kind == ECurvatureKind::DIAGONAL);
    REQUIRE(large.Blocks.size() == 1);
    REQUIRE(preconditioner_parameter_count(large) == 2048 * 64);

    const auto small = classify({512, 64}, config);
    REQUIRE(small.Kind == ECurvatureKind::FULL);
    REQUIRE(small.PreconditionedShape == std::vector<long>{512, 64});
}

TEST_CASE("Diagonal method only makes oversized dimensions diagonal", "[size_model]") {
    const auto plan = classify({2048, 64}, make_config(ELargeDimMethod::DIAGONAL, 1024));
    REQUIRE(plan.Kind == ECurvatureKind::FULL);
    REQUIRE(plan.DiagonalDims == std::vector<bool>{true, false});
    REQUIRE(preconditioner_parameter_count(plan) == 2 * 2048 + 2 * 64 * 64);
}

TEST_CASE("classify rejects negative extents", "[size_model]") {
    REQUIRE_THROWS_AS(classify({4, -1}, ShampooConfig{}), std::invalid_argument);
}

TEST_CASE("gather_block and scatter_block move a sub-rectangle", "[size_model]") {
    const std::vector<long> shape = {5, 7};
    std::vector<double> tensor(35);
    std::iota(tensor.begin(), tensor.end(), 0.0);

    const BlockSpec block{{2, 3}, {2, 3}};
    std::vector<double> data(block.numel());
    gather_block(tensor.data(), shape, block, data.data());
    REQUIRE(data == std::vector<double>{17, 18, 19, 24, 25, 26});

    std::vector<double> target(35, -1.0);
    scatter_block(data.data(), shape, block, target.data());
    REQUIRE(target[17] == 17.0);
    REQUIRE(target[26] == 26.0);
    REQUIRE(target[16] == -1.0);
    REQUIRE(target[20] == -1.0);

    SECTION("all blocks reassemble the tensor") {
        std::vector<double> rebuilt(35, 0.0);
        for (const auto& b : split_into_blocks(shape, 3)) {
            std::vector<double> chunk(b.numel());
            gather_block(tensor.data(), shape, b, chunk.data());
            scatter_block(chunk.data(), shape, b, rebuilt.data());
        }
        REQUIRE(rebuilt == tensor);
    }

    SECTION("rank mismatch") {
        const BlockSpec flat{{0}, {3}};
        REQUIRE_THROWS_AS(gather_block(tensor.data(), shape, flat, data.data()), std::logic_error);
    }
}
