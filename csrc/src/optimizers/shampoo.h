// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_SHAMPOO_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_SHAMPOO_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "optimizers/buffer_plan.h"
#include "optimizers/communication_coordinator.h"
#include "optimizers/curvature_state.h"
#include "optimizers/inversion_supervisor.h"
#include "optimizers/shampoo_config.h"
#include "optimizers/size_model.h"
#include "optimizers/snapshot.h"
#include "utilities/allocator.h"
#include "utilities/tensor.h"

class Communicator;
class RunLogger;

namespace shampoo {

/**
 * @brief A trainable tensor, owned by the caller.
 *
 * The optimizer reads `Grad` and updates `Value` in place. A gradient with a null data
 * pointer counts as absent for that step.
 */
struct Parameter {
    std::string Name;
    Tensor Value;
    Tensor Grad;
    bool SparseGrad = false;
};

struct ParamGroup {
    std::vector<Parameter*> Params;
    //! Falls back to ShampooConfig::defaults.
    std::optional<ParamGroupOptions> Options;
};

/**
 * @brief Distributed Shampoo with layer-wise grafting.
 *
 * Every tensor gets a curvature state (full, block-decomposed or diagonal) whose
 * communication buffers are balanced over the workers of a group. Each worker only updates,
 * inverts and applies the states it owns, writing the preconditioned gradients into its slice
 * of the group buffer; one all-gather per parameter group then gives every worker the full
 * search direction, and all workers apply the identical update.
 *
 * Construction is collective if the world is split into several groups.
 */
class DistributedShampoo {
public:
    using Closure = std::function<float()>;

    /**
     * @param comm World communicator, or null for a single worker. Must outlive the optimizer.
     * @param logger Optional run log; warnings go to stderr without one.
     * @param solver Root-inverse solver override; defaults to matrix_inverse_root.
     * @throws std::invalid_argument On invalid configuration.
     * @throws std::runtime_error On unsupported parameter dtypes.
     */
    DistributedShampoo(std::vector<ParamGroup> groups, ShampooConfig config, Communicator* comm = nullptr,
                       RunLogger* logger = nullptr, RootSolver solver = {});
    ~DistributedShampoo();

    DistributedShampoo(const DistributedShampoo&) = delete;
    DistributedShampoo& operator=(const DistributedShampoo&) = delete;

    /**
     * @brief One optimizer iteration. Collective: every worker must call it in lockstep.
     * @param closure Evaluated first; its value is returned.
     * @throws std::runtime_error On sparse gradients or gradients that don't match their parameter.
     */
    std::optional<float> step(const Closure& closure = {});

    //! Zeroes all curvature statistics; inverse factors are kept until the next inversion.
    void reset_preconditioners();

    //! Scalars held by all curvature states of all workers.
    [[nodiscard]] long parameter_count() const { return mParameterCount; }

    [[nodiscard]] ShampooSnapshot state_dict() const;
    /**
     * @brief Restores a snapshot taken from an optimizer with the same structure.
     * @throws std::runtime_error If groups, tensors, group size or any buffer don't match.
     */
    void load_state_dict(const ShampooSnapshot& snapshot);

    [[nodiscard]] const ShampooConfig& config() const { return mConfig; }
    [[nodiscard]] int num_groups() const { return static_cast<int>(mGroups.size()); }
    [[nodiscard]] const ParamGroupOptions& group_options(int group) const { return mGroups.at(group).Options; }
    [[nodiscard]] const BufferPlan& buffer_plan(int group) const { return mGroups.at(group).Plan; }
    [[nodiscard]] const std::vector<BufferRegion>& buffer_regions(int group) const { return mGroups.at(group).Regions; }
    [[nodiscard]] int group_size() const { return mCoordinator.group_size(); }
    [[nodiscard]] int group_rank() const { return mCoordinator.group_rank(); }

    //! Null for empty tensors.
    [[nodiscard]] const CurvatureState* curvature_state(int group, int index) const;
    [[nodiscard]] const CurvaturePlan& curvature_plan(int group, int index) const;
    [[nodiscard]] int step_count(int group, int index) const;
    [[nodiscard]] const TensorAllocator& allocator() const { return *mAllocator; }

private:
    struct TensorSlot {
        int Group = 0;
        int Index = 0;
        Parameter* Param = nullptr;
        std::string Name;
        int Step = 0;
        CurvaturePlan Plan;
        std::optional<CurvatureState> State;
        Tensor Momentum;
        Tensor ExpAvg;
    };

    struct GroupState {
        ParamGroupOptions Options;
        std::vector<int> Slots;
        BufferPlan Plan;
        std::vector<BufferRegion> Regions;
        Tensor Buffer;
    };

    void build_group(int group_index, const ParamGroup& group);
    void check_gradient(const TensorSlot& slot) const;
    [[nodiscard]] bool has_gradient(const TensorSlot& slot) const;
    [[nodiscard]] std::string slot_prefix(const TensorSlot& slot) const;
    void visit_slot_tensors(const TensorSlot& slot, const TensorVisitor& visit) const;
    void log_root_inverse_residuals(int step);
    void warn(const std::string& msg) const;

    ShampooConfig mConfig;
    RunLogger* mLogger;
    std::unique_ptr<TensorAllocator> mAllocator;
    CommunicationCoordinator mCoordinator;
    InversionSupervisor mSupervisor;
    CurvatureSettings mSettings;

    std::vector<TensorSlot> mSlots;
    std::vector<GroupState> mGroups;
    long mParameterCount = 0;
};

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_SHAMPOO_H
