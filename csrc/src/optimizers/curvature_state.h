// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Curvature state of one tensor.
//
// Design:
// - std::variant<DiagonalState, FullState, BlockState> chosen once from the CurvaturePlan
// - Runtime dispatch via std::visit in CurvatureState
// - Statistics and inverse factors only exist on the worker that owns the buffer region
// - Storage in the preconditioner dtype, arithmetic in double
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_CURVATURE_STATE_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_CURVATURE_STATE_H

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include <Eigen/Core>
#include <nlohmann/json_fwd.hpp>

#include "optimizers/buffer_plan.h"
#include "optimizers/grafting.h"
#include "optimizers/inversion_supervisor.h"
#include "optimizers/shampoo_config.h"
#include "optimizers/size_model.h"
#include "utilities/tensor.h"

class TensorAllocator;

namespace shampoo {

//! The parts of ShampooConfig a curvature state needs.
struct CurvatureSettings {
    ETensorDType PreconditionerDType = ETensorDType::FP32;
    bool UseBiasCorrection = true;
    int ExponentOverride = 0;
    float ExponentMultiplier = 1.0f;
    int StartPreconditioningStep = 1;
    EGraftingType GraftingType = EGraftingType::ADAGRAD;

    static CurvatureSettings from_config(const ShampooConfig& config);
};

//! 1 - beta2^step if bias correction is enabled and beta2 < 1, else 1.
double statistic_bias_correction(const ParamGroupOptions& options, const CurvatureSettings& settings, int step);

//! Relative errors and residuals of the current inverse factors, debug mode only.
struct InversionDiagnostics {
    std::vector<double> RelativeErrors;
    std::vector<double> RelativeResiduals;
};

//! Visits named state buffers; the views write through to the optimizer's memory.
using TensorVisitor = std::function<void(const std::string& name, const Tensor& tensor)>;

//! Statistic and root inverse for one dimension of a FullState.
struct KroneckerFactor {
    long Dim = 0;
    bool Diagonal = false;
    Tensor Statistic;       // Dim x Dim, or Dim for diagonal factors
    Tensor Inverse;         // same shape; identity until HasInverse
    bool HasInverse = false;
    int StaleInversions = 0;
};

/**
 * @brief Elementwise (Adagrad) accumulator for tensors too large for Kronecker factors.
 *
 * The step is the plain Adagrad direction; grafting applies to Kronecker states only.
 */
class DiagonalState {
public:
    DiagonalState(std::string name, long numel, BufferRegion region, bool is_local,
                  const CurvatureSettings& settings, TensorAllocator& allocator);

    void update(const double* grad, const ParamGroupOptions& options, int step);
    //! (A / bc2 + eps)^(-1/2) into `out`.
    void factor(const ParamGroupOptions& options, int step, double* out) const;
    void precondition(const double* grad, const ParamGroupOptions& options, int step, double* out) const;
    void reset();

    void for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const;

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] long numel() const { return mNumel; }
    [[nodiscard]] bool is_local() const { return mIsLocal; }
    [[nodiscard]] const BufferRegion& region() const { return mRegion; }
    [[nodiscard]] const Tensor& accumulator() const { return mAccumulator; }

private:
    std::string mName;
    long mNumel;
    BufferRegion mRegion;
    bool mIsLocal;
    CurvatureSettings mSettings;
    Tensor mAccumulator;
};

/**
 * @brief Shampoo preconditioner of one (sub-)tensor: one Kronecker factor per dimension.
 */
class FullState {
public:
    FullState(std::string name, std::vector<long> shape, const std::vector<bool>& diagonal_dims, BufferRegion region,
              bool is_local, const CurvatureSettings& settings, TensorAllocator& allocator);

    void update(const double* grad, const ParamGroupOptions& options, int step);
    void invert(const ParamGroupOptions& options, int step, const InversionSupervisor& supervisor);
    void precondition(const double* grad, const ParamGroupOptions& options, int step, double* out) const;
    void compute_residuals(const ParamGroupOptions& options, int step, InversionDiagnostics& diagnostics) const;
    void reset();

    void for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const;
    [[nodiscard]] nlohmann::json export_meta() const;
    void import_meta(const nlohmann::json& meta);

    //! 2 * order unless overridden
    [[nodiscard]] double root() const;
    [[nodiscard]] RootInverseRequest request(const ParamGroupOptions& options) const;

    //! The inverse factor of dimension k, identity before the first successful inversion.
    [[nodiscard]] Eigen::MatrixXd inverse_factor(std::size_t k) const;
    [[nodiscard]] Eigen::MatrixXd statistic(std::size_t k) const;

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] long numel() const { return mNumel; }
    [[nodiscard]] bool is_local() const { return mIsLocal; }
    [[nodiscard]] const BufferRegion& region() const { return mRegion; }
    [[nodiscard]] const std::vector<KroneckerFactor>& factors() const { return mFactors; }
    [[nodiscard]] const GraftingState& grafting() const { return mGrafting; }

private:
    std::string mName;
    std::vector<long> mShape;
    long mNumel;
    BufferRegion mRegion;
    bool mIsLocal;
    CurvatureSettings mSettings;
    std::vector<KroneckerFactor> mFactors;
    GraftingState mGrafting;
};

/**
 * @brief Independent FullState sub-problems on the blocks of a tensor.
 *
 * Each block has its own buffer region and owner, so a single tensor can be spread over
 * several workers.
 */
class BlockState {
public:
    BlockState(std::vector<long> shape, std::vector<BlockSpec> specs, std::vector<FullState> blocks);

    void update(const double* grad, const ParamGroupOptions& options, int step);
    void invert(const ParamGroupOptions& options, int step, const InversionSupervisor& supervisor);
    void compute_residuals(const ParamGroupOptions& options, int step, InversionDiagnostics& diagnostics) const;
    void reset();

    void for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const;
    [[nodiscard]] nlohmann::json export_meta() const;
    void import_meta(const nlohmann::json& meta);

    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] const std::vector<BlockSpec>& specs() const { return mSpecs; }
    [[nodiscard]] std::vector<FullState>& blocks() { return mBlocks; }
    [[nodiscard]] const std::vector<FullState>& blocks() const { return mBlocks; }

private:
    std::vector<long> mShape;
    std::vector<BlockSpec> mSpecs;
    std::vector<FullState> mBlocks;
};

/**
 * @brief Curvature state of one tensor with variant dispatch.
 *
 * Gradients are passed as the full tensor in row-major order, which is also the layout of
 * the merged PreconditionedShape. `apply` only touches the buffer regions owned by
 * `group_rank`; `read_direction` reassembles the whole tensor from the gathered buffer.
 */
class CurvatureState {
public:
    using Variant = std::variant<DiagonalState, FullState, BlockState>;

    static CurvatureState create(const std::string& name, const CurvaturePlan& plan,
                                 const std::vector<BufferRegion>& regions, int group_rank,
                                 const CurvatureSettings& settings, TensorAllocator& allocator);

    [[nodiscard]] ECurvatureKind kind() const;
    //! Whether any part of this tensor is owned by the calling worker.
    [[nodiscard]] bool is_local() const;

    void update(const double* grad, const ParamGroupOptions& options, int step);
    //! No-op for diagonal states.
    void invert(const ParamGroupOptions& options, int step, const InversionSupervisor& supervisor);
    //! Preconditions the locally owned parts of the gradient into their buffer regions.
    void apply(const double* grad, const ParamGroupOptions& options, int step, std::byte* buffer, ETensorDType dtype) const;
    //! Reads the search direction of the whole tensor from the gathered group buffer.
    void read_direction(const std::byte* buffer, ETensorDType dtype, double* out) const;
    void compute_residuals(const ParamGroupOptions& options, int step, InversionDiagnostics& diagnostics) const;
    void reset();

    void for_each_tensor(const std::string& prefix, const TensorVisitor& visit) const;
    [[nodiscard]] nlohmann::json export_meta() const;
    void import_meta(const nlohmann::json& meta);

    Variant& get() { return mState; }
    const Variant& get() const { return mState; }

private:
    explicit CurvatureState(Variant state) : mState(std::move(state)) {}
    Variant mState;
};

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_CURVATURE_STATE_H
