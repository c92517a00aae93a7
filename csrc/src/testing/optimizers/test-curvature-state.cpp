// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the diagonal, full and block-decomposed curvature states.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "optimizers/curvature_state.h"
#include "testing/utilities/test_utils.h"
#include "utilities/allocator.h"

using namespace shampoo;
using Catch::Approx;

namespace {

CurvatureSettings fp64_settings(EGraftingType grafting = EGraftingType::NONE) {
    CurvatureSettings settings;
    settings.PreconditionerDType = ETensorDType::FP64;
    settings.GraftingType = grafting;
    settings.StartPreconditioningStep = 1;
    return settings;
}

ParamGroupOptions options(float beta2 = 1.0f, float eps = 1e-3f) {
    ParamGroupOptions opts;
    opts.beta2 = beta2;
    opts.epsilon = eps;
    return opts;
}

Eigen::MatrixXd as_matrix(const std::vector<double>& data, long rows, long cols) {
    return Eigen::Map<const testing_utils::RowMajor>(data.data(), rows, cols);
}

std::vector<double> as_vector(const Eigen::MatrixXd& m) {
    testing_utils::RowMajor r = m;
    return {r.data(), r.data() + r.size()};
}

const BufferRegion kRegion{0, 4096, 0};

} // namespace

// ----------------------------------------------------------------------------
// DiagonalState

TEST_CASE("Diagonal state accumulates squared gradients", "[curvature][diagonal]") {
    TensorAllocator alloc;
    DiagonalState state("w", 3, kRegion, true, fp64_settings(), alloc);
    const std::vector<double> g = {1.0, 2.0, 3.0};
    state.update(g.data(), options(1.0f, 1e-12f), 1);
    state.update(g.data(), options(1.0f, 1e-12f), 2);

    REQUIRE(to_double(state.accumulator()) == std::vector<double>{2.0, 8.0, 18.0});

    std::vector<double> factor(3);
    state.factor(options(1.0f, 1e-12f), 2, factor.data());
    REQUIRE(factor[0] == Approx(1.0 / std::sqrt(2.0)));
    REQUIRE(factor[1] == Approx(1.0 / std::sqrt(8.0)));
    REQUIRE(factor[2] == Approx(1.0 / std::sqrt(18.0)));

    std::vector<double> out(3);
    state.precondition(g.data(), options(1.0f, 1e-12f), 2, out.data());
    for (int i = 0; i < 3; ++i) {
        REQUIRE(out[i] == Approx(g[i] * factor[i]));
    }

    state.reset();
    REQUIRE(to_double(state.accumulator()) == std::vector<double>{0.0, 0.0, 0.0});
}

TEST_CASE("Diagonal state corrects the bias of its moving average", "[curvature][diagonal]") {
    TensorAllocator alloc;
    DiagonalState state("w", 1, kRegion, true, fp64_settings(), alloc);
    const std::vector<double> g = {2.0};
    const auto opts = options(0.5f, 1e-12f);
    state.update(g.data(), opts, 1);
    REQUIRE(to_double(state.accumulator())[0] == Approx(2.0));

    // 0.5 * 4 / (1 - 0.5) = 4
    double factor = 0.0;
    state.factor(opts, 1, &factor);
    REQUIRE(factor == Approx(0.5));
}

TEST_CASE("Diagonal state ignores the grafting type", "[curvature][diagonal]") {
    TensorAllocator alloc;
    DiagonalState state("w", 3, kRegion, true, fp64_settings(EGraftingType::ADAGRAD), alloc);
    const std::vector<double> g = {1.0, 2.0, 3.0};
    const auto opts = options(1.0f, 1e-12f);
    state.update(g.data(), opts, 1);
    state.update(g.data(), opts, 2);

    // plain Adagrad: g / sqrt(2 g^2)
    std::vector<double> out(3);
    state.precondition(g.data(), opts, 2, out.data());
    for (int i = 0; i < 3; ++i) {
        REQUIRE(out[i] == Approx(1.0 / std::sqrt(2.0)).epsilon(1e-9));
    }

    std::vector<std::string> names;
    state.for_each_tensor("p", [&](const std::string& name, const Tensor&) { names.push_back(name); });
    REQUIRE(names == std::vector<std::string>{"p.accumulator"});
    REQUIRE(alloc.total_allocation() == 3 * sizeof(double));
}

// ----------------------------------------------------------------------------
// FullState

TEST_CASE("Full state matches the Kronecker-factored reference", "[curvature][full]") {
    TensorAllocator alloc;
    FullState state("w", {4, 3}, {}, kRegion, true, fp64_settings(), alloc);
    REQUIRE(state.root() == 4.0);

    std::vector<double> g(12);
    testing_utils::fill_normal(g, 0.0, 1.0, 17);
    const Eigen::MatrixXd G = as_matrix(g, 4, 3);
    const auto opts = options();
    state.update(g.data(), opts, 1);

    REQUIRE((state.statistic(0) - G * G.transpose()).cwiseAbs().maxCoeff() < 1e-12);
    REQUIRE((state.statistic(1) - G.transpose() * G).cwiseAbs().maxCoeff() < 1e-12);

    SECTION("identity before the first inversion") {
        std::vector<double> out(12);
        state.precondition(g.data(), opts, 1, out.data());
        REQUIRE(out == g);
        REQUIRE(state.inverse_factor(0).isIdentity());
    }

    SECTION("root inverse factors after inversion") {
        InversionSupervisor supervisor(ETensorDType::FP64, true, 0);
        state.invert(opts, 1, supervisor);

        const Eigen::MatrixXd L = testing_utils::reference_root(G * G.transpose(), 1e-3, -0.25);
        const Eigen::MatrixXd R = testing_utils::reference_root(G.transpose() * G, 1e-3, -0.25);
        REQUIRE((state.inverse_factor(0) - L).cwiseAbs().maxCoeff() < 1e-8);
        REQUIRE((state.inverse_factor(1) - R).cwiseAbs().maxCoeff() < 1e-8);
        REQUIRE(state.factors()[0].HasInverse);

        std::vector<double> out(12);
        state.precondition(g.data(), opts, 1, out.data());
        REQUIRE(testing_utils::max_abs_diff(out, as_vector(L * G * R)) < 1e-8);

        InversionDiagnostics diagnostics;
        state.compute_residuals(opts, 1, diagnostics);
        REQUIRE(diagnostics.RelativeErrors.size() == 2);
        REQUIRE(diagnostics.RelativeErrors[0] < 1e-8);
        REQUIRE(diagnostics.RelativeResiduals[1] < 1e-6);
    }

    SECTION("reset keeps the inverse factors") {
        InversionSupervisor supervisor(ETensorDType::FP64, true, 0);
        state.invert(opts, 1, supervisor);
        state.reset();
        REQUIRE(state.statistic(0).isZero());
        REQUIRE_FALSE(state.inverse_factor(0).isIdentity());
    }
}

TEST_CASE("Full state uses an exponential moving average with bias correction", "[curvature][full]") {
    TensorAllocator alloc;
    FullState state("w", {2, 2}, {}, kRegion, true, fp64_settings(), alloc);
    const std::vector<double> g1 = {1.0, 0.0, 0.0, 1.0};
    const std::vector<double> g2 = {2.0, 0.0, 0.0, 0.0};
    const auto opts = options(0.5f);
    state.update(g1.data(), opts, 1);
    state.update(g2.data(), opts, 2);

    // 0.25 * I + 0.5 * diag(4, 0)
    const Eigen::MatrixXd F = state.statistic(0);
    REQUIRE(F(0, 0) == Approx(2.25));
    REQUIRE(F(1, 1) == Approx(0.25));
    REQUIRE(statistic_bias_correction(opts, fp64_settings(), 2) == Approx(0.75));

    CurvatureSettings no_bc = fp64_settings();
    no_bc.UseBiasCorrection = false;
    REQUIRE(statistic_bias_correction(opts, no_bc, 2) == 1.0);
}

TEST_CASE("Full state uses the grafting step before preconditioning starts", "[curvature][full]") {
    TensorAllocator alloc;
    CurvatureSettings settings = fp64_settings(EGraftingType::ADAGRAD);
    settings.StartPreconditioningStep = 3;
    FullState state("w", {2, 2}, {}, kRegion, true, settings, alloc);

    const std::vector<double> g = {1.0, 2.0, 3.0, 4.0};
    state.update(g.data(), options(), 1);
    std::vector<double> out(4);
    state.precondition(g.data(), options(), 1, out.data());
    for (int i = 0; i < 4; ++i) {
        REQUIRE(out[i] == Approx(g[i] / (std::abs(g[i]) + 1e-3)));
    }
}

TEST_CASE("Full state with a diagonal factor for an oversized dimension", "[curvature][full]") {
    TensorAllocator alloc;
    FullState state("w", {3, 2}, {true, false}, kRegion, true, fp64_settings(), alloc);
    const std::vector<double> g = {1.0, 1.0, 2.0, 0.0, 0.0, 3.0};
    state.update(g.data(), options(), 1);

    const Eigen::MatrixXd S0 = state.statistic(0);
    REQUIRE(S0(0, 0) == Approx(2.0));
    REQUIRE(S0(1, 1) == Approx(4.0));
    REQUIRE(S0(2, 2) == Approx(9.0));
    REQUIRE(S0(0, 1) == 0.0);

    InversionSupervisor supervisor(ETensorDType::FP64, true, 0);
    state.invert(options(), 1, supervisor);
    REQUIRE(state.inverse_factor(0)(1, 1) == Approx(std::pow(4.0 + 1e-3, -0.25)));
}

TEST_CASE("Remote full state holds no memory", "[curvature][full]") {
    TensorAllocator alloc;
    FullState state("w", {4, 3}, {}, kRegion, false, fp64_settings(EGraftingType::ADAGRAD), alloc);
    REQUIRE(alloc.total_allocation() == 0);

    std::vector<double> g(12, 1.0), out(12);
    REQUIRE_THROWS_AS(state.update(g.data(), options(), 1), std::logic_error);
    REQUIRE_THROWS_AS(state.precondition(g.data(), options(), 1, out.data()), std::logic_error);

    int visited = 0;
    state.for_each_tensor("p", [&](const std::string&, const Tensor&) { ++visited; });
    REQUIRE(visited == 0);
}

TEST_CASE("Full state names and exports its buffers", "[curvature][full]") {
    TensorAllocator alloc;
    FullState state("w", {4, 3}, {}, kRegion, true, fp64_settings(EGraftingType::RMSPROP), alloc);

    std::set<std::string> names;
    state.for_each_tensor("p", [&](const std::string& name, const Tensor&) { names.insert(name); });
    REQUIRE(names == std::set<std::string>{"p.factor0.statistic", "p.factor0.inverse", "p.factor1.statistic",
                                           "p.factor1.inverse", "p.grafting"});

    std::vector<double> g(12, 1.0);
    state.update(g.data(), options(), 1);
    InversionSupervisor supervisor(ETensorDType::FP64, true, 0);
    state.invert(options(), 1, supervisor);

    const nlohmann::json meta = state.export_meta();
    REQUIRE(meta.size() == 2);
    REQUIRE(meta[0]["has_inverse"].get<bool>());

    FullState other("w", {4, 3}, {}, kRegion, true, fp64_settings(EGraftingType::RMSPROP), alloc);
    other.import_meta(meta);
    REQUIRE(other.factors()[1].HasInverse);
    REQUIRE_THROWS_AS(other.import_meta(nlohmann::json::array()), std::runtime_error);
}

// ----------------------------------------------------------------------------
// CurvatureState

TEST_CASE("Block states on two workers reproduce the single-worker direction", "[curvature][block]") {
    ShampooConfig config;
    config.max_preconditioner_dim = 2;
    config.use_merge_dims = false;
    const CurvaturePlan plan = classify({5, 3}, config);
    REQUIRE(plan.Kind == ECurvatureKind::BLOCK);

    const auto sizes = buffer_sizes(plan, ETensorDType::FP64);
    const auto settings = fp64_settings(EGraftingType::ADAGRAD);

    std::vector<double> g(15);
    testing_utils::fill_normal(g, 0.0, 1.0, 3);
    const auto opts = options();
    InversionSupervisor supervisor(ETensorDType::FP64, true, 0);

    auto direction = [&](int group_size) {
        const BufferPlan bp = distribute_buffer_sizes(sizes, group_size);
        const auto regions = split_buffer(bp);
        std::vector<std::byte> buffer(bp.total_bytes());
        TensorAllocator alloc;
        std::vector<CurvatureState> states;
        for (int rank = 0; rank < group_size; ++rank) {
            states.push_back(CurvatureState::create("w", plan, regions, rank, settings, alloc));
        }
        for (auto& state : states) {
            REQUIRE(state.kind() == ECurvatureKind::BLOCK);
            REQUIRE(state.is_local());
            state.update(g.data(), opts, 1);
            state.invert(opts, 1, supervisor);
            state.apply(g.data(), opts, 1, buffer.data(), ETensorDType::FP64);
        }
        std::vector<double> out(15);
        states[0].read_direction(buffer.data(), ETensorDType::FP64, out.data());
        return out;
    };

    const auto single = direction(1);
    const auto pair = direction(2);
    REQUIRE(testing_utils::bitwise_equal(single, pair));
    REQUIRE_FALSE(testing_utils::bitwise_equal(single, g));
}

TEST_CASE("Curvature state dispatches diagonal plans", "[curvature]") {
    ShampooConfig config;
    config.max_preconditioner_dim = 4;
    config.large_dim_method = ELargeDimMethod::ADAGRAD;
    const CurvaturePlan plan = classify({8, 2}, config);

    TensorAllocator alloc;
    const auto bp = distribute_buffer_sizes(buffer_sizes(plan, ETensorDType::FP32), 1);
    auto state = CurvatureState::create("w", plan, split_buffer(bp), 0, fp64_settings(), alloc);
    REQUIRE(state.kind() == ECurvatureKind::DIAGONAL);
    REQUIRE(state.export_meta().is_null());

    std::vector<double> g(16, 2.0);
    state.update(g.data(), options(1.0f, 1e-12f), 1);
    // no-op for diagonal states
    InversionSupervisor supervisor(ETensorDType::FP64, true, 0);
    state.invert(options(1.0f, 1e-12f), 1, supervisor);

    std::vector<std::byte> buffer(bp.total_bytes());
    state.apply(g.data(), options(1.0f, 1e-12f), 1, buffer.data(), ETensorDType::FP32);
    std::vector<double> out(16);
    state.read_direction(buffer.data(), ETensorDType::FP32, out.data());
    REQUIRE(out[0] == Approx(1.0));
    REQUIRE(out[15] == Approx(1.0));

    SECTION("region too small") {
        std::vector<BufferRegion> tiny = {BufferRegion{0, 16, 0}};
        auto cramped = CurvatureState::create("v", plan, tiny, 0, fp64_settings(), alloc);
        cramped.update(g.data(), options(), 1);
        REQUIRE_THROWS_AS(cramped.apply(g.data(), options(), 1, buffer.data(), ETensorDType::FP32), std::logic_error);
    }

    SECTION("region count mismatch") {
        REQUIRE_THROWS_AS(CurvatureState::create("v", plan, {}, 0, fp64_settings(), alloc), std::logic_error);
    }
}
