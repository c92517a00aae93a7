// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/curvature_state.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/allocator.h"
#include "utilities/utils.h"

namespace shampoo {

namespace {

using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// A tensor viewed as (Pre, Dim, Post) around dimension k.
struct ModeLayout {
    long Pre;
    long Dim;
    long Post;
};

ModeLayout mode_layout(const std::vector<long>& shape, std::size_t k) {
    ModeLayout layout{1, shape.at(k), 1};
    for (std::size_t i = 0; i < k; ++i) {
        layout.Pre *= shape[i];
    }
    for (std::size_t i = k + 1; i < shape.size(); ++i) {
        layout.Post *= shape[i];
    }
    return layout;
}

Eigen::MatrixXd load_matrix(const Tensor& t, long d) {
    RowMajorMatrix m(d, d);
    load_range(t, 0, static_cast<std::size_t>(d * d), m.data());
    return m;
}

void store_matrix(Tensor& t, const Eigen::MatrixXd& X) {
    RowMajorMatrix m = X;
    store_range(t, 0, static_cast<std::size_t>(m.size()), m.data());
}

Eigen::VectorXd load_vector(const Tensor& t, long d) {
    Eigen::VectorXd v(d);
    load_range(t, 0, static_cast<std::size_t>(d), v.data());
    return v;
}

void store_vector(Tensor& t, const Eigen::VectorXd& v) {
    store_range(t, 0, static_cast<std::size_t>(v.size()), v.data());
}

//! sum_a M_a M_a^T over the mode-k unfoldings M_a (Dim x Post)
Eigen::MatrixXd mode_gram(const double* data, const std::vector<long>& shape, std::size_t k) {
    const auto [pre, d, post] = mode_layout(shape, k);
    Eigen::MatrixXd gram = Eigen::MatrixXd::Zero(d, d);
    for (long a = 0; a < pre; ++a) {
        Eigen::Map<const RowMajorMatrix> slice(data + a * d * post, d, post);
        gram.noalias() += slice * slice.transpose();
    }
    return gram;
}

//! Squared norms of the mode-k slices, the diagonal of mode_gram.
Eigen::VectorXd mode_square_norms(const double* data, const std::vector<long>& shape, std::size_t k) {
    const auto [pre, d, post] = mode_layout(shape, k);
    Eigen::VectorXd norms = Eigen::VectorXd::Zero(d);
    for (long a = 0; a < pre; ++a) {
        Eigen::Map<const RowMajorMatrix> slice(data + a * d * post, d, post);
        norms += slice.rowwise().squaredNorm();
    }
    return norms;
}

//! data <- data x_k X
void mode_product(std::vector<double>& data, const std::vector<long>& shape, std::size_t k, const Eigen::MatrixXd& X) {
    const auto [pre, d, post] = mode_layout(shape, k);
    RowMajorMatrix tmp(d, post);
    for (long a = 0; a < pre; ++a) {
        Eigen::Map<RowMajorMatrix> slice(data.data() + a * d * post, d, post);
        tmp.noalias() = X * slice;
        slice = tmp;
    }
}

void mode_scale(std::vector<double>& data, const std::vector<long>& shape, std::size_t k, const Eigen::VectorXd& v) {
    const auto [pre, d, post] = mode_layout(shape, k);
    for (long a = 0; a < pre; ++a) {
        Eigen::Map<RowMajorMatrix> slice(data.data() + a * d * post, d, post);
        slice = v.asDiagonal() * slice;
    }
}

void apply_grafting(const GraftingState& grafting, const double* grad, const ParamGroupOptions& options, int step,
                    double* preconditioned, long n) {
    if (grafting.type() == EGraftingType::NONE) {
        return;
    }
    std::vector<double> grafted(n);
    grafting.precondition(grad, options, step, grafted.data());
    const double scale = grafting_scale(grafted.data(), preconditioned, n);
    for (long i = 0; i < n; ++i) {
        preconditioned[i] *= scale;
    }
}

void write_region(const BufferRegion& region, const std::vector<double>& values, std::byte* buffer, ETensorDType dtype) {
    if (values.size() * get_dtype_size(dtype) > region.Bytes) {
        throw std::logic_error(fmt::format("{} elements of {} do not fit into buffer region of {} bytes",
                                           values.size(), dtype_to_str(dtype), region.Bytes));
    }
    store_raw(buffer + region.Offset, dtype, values.size(), values.data());
}

void require_local(bool is_local, const std::string& name) {
    if (!is_local) {
        throw std::logic_error(fmt::format("Curvature state {} is not owned by this worker", name));
    }
}

} // namespace

CurvatureSettings CurvatureSettings::from_config(const ShampooConfig& config) {
    CurvatureSettings settings;
    settings.PreconditionerDType = config.preconditioner_dtype;
    settings.UseBiasCorrection = config.use_bias_correction;
    settings.ExponentOverride = config.exponent_override;
    settings.ExponentMultiplier = config.exponent_multiplier;
    settings.StartPreconditioningStep = config.effective_start_step();
    settings.GraftingType = config.grafting_type;
    return settings;
}

double statistic_bias_correction(const ParamGroupOptions& options, const CurvatureSettings& settings, int step) {
    if (settings.UseBiasCorrection && options.beta2 < 1.0f) {
        return 1.0 - std::pow(static_cast<double>(options.beta2), step);
    }
    return 1.0;
}

// ----------------------------------------------------------------------------
// DiagonalState

DiagonalState::DiagonalState(std::string name, long numel, BufferRegion region, bool is_local,
                             const CurvatureSettings& settings, TensorAllocator& allocator) :
    mName(std::move(name)), mNumel(numel), mRegion(region), mIsLocal(is_local), mSettings(settings)
{
    if (!mIsLocal) {
        return;
    }
    mAccumulator = allocator.allocate(settings.PreconditionerDType, mName + ".accumulator", {numel});
}

void DiagonalState::update(const double* grad, const ParamGroupOptions& options, int /*step*/) {
    require_local(mIsLocal, mName);
    const double b2 = options.beta2;
    std::vector<double> acc(mNumel);
    load_range(mAccumulator, 0, mNumel, acc.data());
    for (long i = 0; i < mNumel; ++i) {
        const double g2 = grad[i] * grad[i];
        acc[i] = b2 == 1.0 ? acc[i] + g2 : b2 * acc[i] + (1.0 - b2) * g2;
    }
    store_range(mAccumulator, 0, mNumel, acc.data());
}

void DiagonalState::factor(const ParamGroupOptions& options, int step, double* out) const {
    require_local(mIsLocal, mName);
    const double bc = statistic_bias_correction(options, mSettings, step);
    load_range(mAccumulator, 0, mNumel, out);
    for (long i = 0; i < mNumel; ++i) {
        out[i] = std::pow(out[i] / bc + options.epsilon, -0.5);
    }
}

void DiagonalState::precondition(const double* grad, const ParamGroupOptions& options, int step, double* out) const {
    factor(options, step, out);
    for (long i = 0; i < mNumel; ++i) {
        out[i] *= grad[i];
    }
}

void DiagonalState::reset() {
    if (mIsLocal) {
        fill_zero(mAccumulator);
    }
}

void DiagonalState::for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const {
    if (!mIsLocal) {
        return;
    }
    visit(prefix + ".accumulator", mAccumulator);
}

// ----------------------------------------------------------------------------
// FullState

FullState::FullState(std::string name, std::vector<long> shape, const std::vector<bool>& diagonal_dims, BufferRegion region,
                     bool is_local, const CurvatureSettings& settings, TensorAllocator& allocator) :
    mName(std::move(name)), mShape(std::move(shape)), mNumel(shape_numel(mShape)), mRegion(region),
    mIsLocal(is_local), mSettings(settings)
{
    mFactors.resize(mShape.size());
    for (std::size_t k = 0; k < mShape.size(); ++k) {
        mFactors[k].Dim = mShape[k];
        mFactors[k].Diagonal = k < diagonal_dims.size() && diagonal_dims[k];
    }
    if (!mIsLocal) {
        return;
    }

    const ETensorDType dtype = settings.PreconditionerDType;
    for (std::size_t k = 0; k < mFactors.size(); ++k) {
        auto& f = mFactors[k];
        const std::vector<long> factor_shape = f.Diagonal ? std::vector<long>{f.Dim} : std::vector<long>{f.Dim, f.Dim};
        f.Statistic = allocator.allocate(dtype, fmt::format("{}.factor{}.statistic", mName, k), factor_shape);
        f.Inverse = allocator.allocate(dtype, fmt::format("{}.factor{}.inverse", mName, k), factor_shape);
    }
    mGrafting = GraftingState(settings.GraftingType, dtype, mNumel, mName + ".grafting", allocator);
}

double FullState::root() const {
    return mSettings.ExponentOverride != 0 ? static_cast<double>(mSettings.ExponentOverride)
                                           : 2.0 * static_cast<double>(mShape.size());
}

RootInverseRequest FullState::request(const ParamGroupOptions& options) const {
    return RootInverseRequest{root(), mSettings.ExponentMultiplier, options.epsilon};
}

Eigen::MatrixXd FullState::inverse_factor(std::size_t k) const {
    const auto& f = mFactors.at(k);
    if (!f.HasInverse) {
        return Eigen::MatrixXd::Identity(f.Dim, f.Dim);
    }
    if (f.Diagonal) {
        return Eigen::MatrixXd(load_vector(f.Inverse, f.Dim).asDiagonal());
    }
    return load_matrix(f.Inverse, f.Dim);
}

Eigen::MatrixXd FullState::statistic(std::size_t k) const {
    const auto& f = mFactors.at(k);
    require_local(mIsLocal, mName);
    if (f.Diagonal) {
        return Eigen::MatrixXd(load_vector(f.Statistic, f.Dim).asDiagonal());
    }
    return load_matrix(f.Statistic, f.Dim);
}

void FullState::update(const double* grad, const ParamGroupOptions& options, int /*step*/) {
    require_local(mIsLocal, mName);
    const double b2 = options.beta2;
    for (std::size_t k = 0; k < mFactors.size(); ++k) {
        auto& f = mFactors[k];
        if (f.Diagonal) {
            Eigen::VectorXd v = load_vector(f.Statistic, f.Dim);
            const Eigen::VectorXd norms = mode_square_norms(grad, mShape, k);
            v = b2 == 1.0 ? Eigen::VectorXd(v + norms) : Eigen::VectorXd(b2 * v + (1.0 - b2) * norms);
            store_vector(f.Statistic, v);
        } else {
            Eigen::MatrixXd F = load_matrix(f.Statistic, f.Dim);
            const Eigen::MatrixXd gram = mode_gram(grad, mShape, k);
            if (b2 == 1.0) {
                F += gram;
            } else {
                F = b2 * F + (1.0 - b2) * gram;
            }
            store_matrix(f.Statistic, F);
        }
    }
    mGrafting.update(grad, options);
}

void FullState::invert(const ParamGroupOptions& options, int step, const InversionSupervisor& supervisor) {
    if (!mIsLocal) {
        return;
    }
    const double bc = statistic_bias_correction(options, mSettings, step);
    const RootInverseRequest req = request(options);

    for (std::size_t k = 0; k < mFactors.size(); ++k) {
        auto& f = mFactors[k];
        if (f.Diagonal) {
            const Eigen::VectorXd v = load_vector(f.Statistic, f.Dim);
            const Eigen::VectorXd inverse = ((v.array() / bc) + req.Epsilon).pow(req.alpha()).matrix();
            store_vector(f.Inverse, inverse);
            f.HasInverse = true;
            continue;
        }

        const Eigen::MatrixXd A = load_matrix(f.Statistic, f.Dim) / bc;
        Eigen::MatrixXd X = inverse_factor(k);
        const auto result = supervisor.invert(A, req, X, f.StaleInversions, fmt::format("{}.factor{}", mName, k), step);
        if (result.Outcome != EInversionOutcome::STALE_FACTOR) {
            store_matrix(f.Inverse, X);
            f.HasInverse = true;
        }
    }
}

void FullState::precondition(const double* grad, const ParamGroupOptions& options, int step, double* out) const {
    require_local(mIsLocal, mName);
    if (step < mSettings.StartPreconditioningStep) {
        mGrafting.precondition(grad, options, step, out);
        return;
    }

    std::vector<double> data(grad, grad + mNumel);
    for (std::size_t k = 0; k < mFactors.size(); ++k) {
        const auto& f = mFactors[k];
        if (!f.HasInverse) {
            continue;
        }
        if (f.Diagonal) {
            mode_scale(data, mShape, k, load_vector(f.Inverse, f.Dim));
        } else {
            mode_product(data, mShape, k, load_matrix(f.Inverse, f.Dim));
        }
    }
    apply_grafting(mGrafting, grad, options, step, data.data(), mNumel);
    std::copy(data.begin(), data.end(), out);
}

void FullState::compute_residuals(const ParamGroupOptions& options, int step, InversionDiagnostics& diagnostics) const {
    if (!mIsLocal) {
        return;
    }
    const double bc = statistic_bias_correction(options, mSettings, step);
    const RootInverseRequest req = request(options);
    for (const auto& f : mFactors) {
        if (f.Diagonal || !f.HasInverse) {
            continue;
        }
        const Eigen::MatrixXd A = load_matrix(f.Statistic, f.Dim) / bc;
        const Eigen::MatrixXd X = load_matrix(f.Inverse, f.Dim);
        Eigen::MatrixXd reference;
        std::string reason;
        // factors whose fp64 recomputation fails have no reference to compare against
        if (!matrix_inverse_root(A, req, ETensorDType::FP64, reference, reason)) {
            continue;
        }
        diagnostics.RelativeErrors.push_back(relative_error(reference, X));
        diagnostics.RelativeResiduals.push_back(relative_residual(X, A, req));
    }
}

void FullState::reset() {
    if (!mIsLocal) {
        return;
    }
    for (auto& f : mFactors) {
        fill_zero(f.Statistic);
    }
}

void FullState::for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const {
    if (!mIsLocal) {
        return;
    }
    for (std::size_t k = 0; k < mFactors.size(); ++k) {
        visit(fmt::format("{}.factor{}.statistic", prefix, k), mFactors[k].Statistic);
        visit(fmt::format("{}.factor{}.inverse", prefix, k), mFactors[k].Inverse);
    }
    if (mGrafting.has_accumulator()) {
        visit(prefix + ".grafting", mGrafting.accumulator());
    }
}

nlohmann::json FullState::export_meta() const {
    nlohmann::json meta = nlohmann::json::array();
    for (const auto& f : mFactors) {
        meta.push_back({{"has_inverse", f.HasInverse}, {"stale_inversions", f.StaleInversions}});
    }
    return meta;
}

void FullState::import_meta(const nlohmann::json& meta) {
    if (!meta.is_array() || meta.size() != mFactors.size()) {
        throw std::runtime_error(fmt::format("Snapshot of {} does not have {} Kronecker factors", mName, mFactors.size()));
    }
    for (std::size_t k = 0; k < mFactors.size(); ++k) {
        mFactors[k].HasInverse = meta[k].at("has_inverse").get<bool>();
        mFactors[k].StaleInversions = meta[k].at("stale_inversions").get<int>();
    }
}

// ----------------------------------------------------------------------------
// BlockState

BlockState::BlockState(std::vector<long> shape, std::vector<BlockSpec> specs, std::vector<FullState> blocks) :
    mShape(std::move(shape)), mSpecs(std::move(specs)), mBlocks(std::move(blocks))
{
    if (mSpecs.size() != mBlocks.size()) {
        throw std::logic_error(fmt::format("{} block specs for {} blocks", mSpecs.size(), mBlocks.size()));
    }
}

void BlockState::update(const double* grad, const ParamGroupOptions& options, int step) {
    std::vector<double> scratch;
    for (std::size_t b = 0; b < mBlocks.size(); ++b) {
        if (!mBlocks[b].is_local()) {
            continue;
        }
        scratch.resize(mBlocks[b].numel());
        gather_block(grad, mShape, mSpecs[b], scratch.data());
        mBlocks[b].update(scratch.data(), options, step);
    }
}

void BlockState::invert(const ParamGroupOptions& options, int step, const InversionSupervisor& supervisor) {
    for (auto& block : mBlocks) {
        block.invert(options, step, supervisor);
    }
}

void BlockState::compute_residuals(const ParamGroupOptions& options, int step, InversionDiagnostics& diagnostics) const {
    for (const auto& block : mBlocks) {
        block.compute_residuals(options, step, diagnostics);
    }
}

void BlockState::reset() {
    for (auto& block : mBlocks) {
        block.reset();
    }
}

void BlockState::for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const {
    for (std::size_t b = 0; b < mBlocks.size(); ++b) {
        mBlocks[b].for_each_tensor(fmt::format("{}.block{}", prefix, b), visit);
    }
}

nlohmann::json BlockState::export_meta() const {
    nlohmann::json meta = nlohmann::json::array();
    for (const auto& block : mBlocks) {
        meta.push_back(block.export_meta());
    }
    return meta;
}

void BlockState::import_meta(const nlohmann::json& meta) {
    if (!meta.is_array() || meta.size() != mBlocks.size()) {
        throw std::runtime_error(fmt::format("Snapshot does not have {} blocks", mBlocks.size()));
    }
    for (std::size_t b = 0; b < mBlocks.size(); ++b) {
        mBlocks[b].import_meta(meta[b]);
    }
}

// ----------------------------------------------------------------------------
// CurvatureState

CurvatureState CurvatureState::create(const std::string& name, const CurvaturePlan& plan,
                                      const std::vector<BufferRegion>& regions, int group_rank,
                                      const CurvatureSettings& settings, TensorAllocator& allocator) {
    if (regions.size() != plan.Blocks.size()) {
        throw std::logic_error(fmt::format("{}: {} buffer regions for {} blocks", name, regions.size(), plan.Blocks.size()));
    }

    switch (plan.Kind) {
        case ECurvatureKind::DIAGONAL:
            return CurvatureState(DiagonalState(name, shape_numel(plan.PreconditionedShape), regions[0],
                                                regions[0].Owner == group_rank, settings, allocator));
        case ECurvatureKind::FULL:
            return CurvatureState(FullState(name, plan.PreconditionedShape, plan.DiagonalDims, regions[0],
                                            regions[0].Owner == group_rank, settings, allocator));
        case ECurvatureKind::BLOCK: {
            std::vector<FullState> blocks;
            blocks.reserve(plan.Blocks.size());
            for (std::size_t b = 0; b < plan.Blocks.size(); ++b) {
                blocks.emplace_back(fmt::format("{}.block{}", name, b), plan.Blocks[b].Extents, plan.DiagonalDims,
                                    regions[b], regions[b].Owner == group_rank, settings, allocator);
            }
            return CurvatureState(BlockState(plan.PreconditionedShape, plan.Blocks, std::move(blocks)));
        }
    }
    throw std::logic_error("Unknown curvature kind");
}

ECurvatureKind CurvatureState::kind() const {
    return std::visit([](const auto& state) {
        using StateType = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<StateType, DiagonalState>) {
            return ECurvatureKind::DIAGONAL;
        } else if constexpr (std::is_same_v<StateType, FullState>) {
            return ECurvatureKind::FULL;
        } else {
            return ECurvatureKind::BLOCK;
        }
    }, mState);
}

bool CurvatureState::is_local() const {
    return std::visit([](const auto& state) {
        using StateType = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<StateType, BlockState>) {
            return std::any_of(state.blocks().begin(), state.blocks().end(),
                               [](const FullState& block) { return block.is_local(); });
        } else {
            return state.is_local();
        }
    }, mState);
}

void CurvatureState::update(const double* grad, const ParamGroupOptions& options, int step) {
    std::visit([&](auto& state) {
        using StateType = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<StateType, BlockState>) {
            state.update(grad, options, step);
        } else if (state.is_local()) {
            state.update(grad, options, step);
        }
    }, mState);
}

void CurvatureState::invert(const ParamGroupOptions& options, int step, const InversionSupervisor& supervisor) {
    std::visit([&](auto& state) {
        if constexpr (requires { state.invert(options, step, supervisor); }) {
            state.invert(options, step, supervisor);
        }
    }, mState);
}

void CurvatureState::apply(const double* grad, const ParamGroupOptions& options, int step, std::byte* buffer,
                           ETensorDType dtype) const {
    std::visit([&](const auto& state) {
        using StateType = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<StateType, BlockState>) {
            std::vector<double> scratch;
            std::vector<double> out;
            for (std::size_t b = 0; b < state.blocks().size(); ++b) {
                const FullState& block = state.blocks()[b];
                if (!block.is_local()) {
                    continue;
                }
                scratch.resize(block.numel());
                out.resize(block.numel());
                gather_block(grad, state.shape(), state.specs()[b], scratch.data());
                block.precondition(scratch.data(), options, step, out.data());
                write_region(block.region(), out, buffer, dtype);
            }
        } else {
            if (!state.is_local()) {
                return;
            }
            std::vector<double> out(state.numel());
            state.precondition(grad, options, step, out.data());
            write_region(state.region(), out, buffer, dtype);
        }
    }, mState);
}

void CurvatureState::read_direction(const std::byte* buffer, ETensorDType dtype, double* out) const {
    std::visit([&](const auto& state) {
        using StateType = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<StateType, BlockState>) {
            std::vector<double> scratch;
            for (std::size_t b = 0; b < state.blocks().size(); ++b) {
                const FullState& block = state.blocks()[b];
                scratch.resize(block.numel());
                load_raw(buffer + block.region().Offset, dtype, scratch.size(), scratch.data());
                scatter_block(scratch.data(), state.shape(), state.specs()[b], out);
            }
        } else {
            load_raw(buffer + state.region().Offset, dtype, state.numel(), out);
        }
    }, mState);
}

void CurvatureState::compute_residuals(const ParamGroupOptions& options, int step, InversionDiagnostics& diagnostics) const {
    std::visit([&](const auto& state) {
        if constexpr (requires { state.compute_residuals(options, step, diagnostics); }) {
            state.compute_residuals(options, step, diagnostics);
        }
    }, mState);
}

void CurvatureState::reset() {
    std::visit([](auto& state) { state.reset(); }, mState);
}

void CurvatureState::for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const {
    std::visit([&](const auto& state) { state.for_each_tensor(prefix, visit); }, mState);
}

nlohmann::json CurvatureState::export_meta() const {
    return std::visit([](const auto& state) -> nlohmann::json {
        if constexpr (requires { state.export_meta(); }) {
            return state.export_meta();
        } else {
            return nullptr;
        }
    }, mState);
}

void CurvatureState::import_meta(const nlohmann::json& meta) {
    std::visit([&](auto& state) {
        if constexpr (requires { state.import_meta(meta); }) {
            state.import_meta(meta);
        }
    }, mState);
}

} // namespace shampoo
