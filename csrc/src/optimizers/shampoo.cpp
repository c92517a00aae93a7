// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/shampoo.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <set>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "training/logging.h"
#include "utilities/utils.h"

namespace shampoo {

namespace {

constexpr int SNAPSHOT_FORMAT = 1;

ShampooConfig validated(ShampooConfig config) {
    config.validate();
    return config;
}

} // namespace

DistributedShampoo::DistributedShampoo(std::vector<ParamGroup> groups, ShampooConfig config, Communicator* comm,
                                       RunLogger* logger, RootSolver solver) :
    mConfig(validated(std::move(config))),
    mLogger(logger),
    mAllocator(std::make_unique<TensorAllocator>()),
    mCoordinator(comm, mConfig.num_workers_per_group, logger),
    mSupervisor(mConfig.preconditioner_dtype, mConfig.use_protected_eigh, mConfig.max_stale_inversions, logger, std::move(solver)),
    mSettings(CurvatureSettings::from_config(mConfig))
{
    if (mConfig.start_preconditioning_step == -1) {
        warn(fmt::format("start_preconditioning_step set to -1. Setting start_preconditioning_step equal to "
                         "precondition frequency {} by default.", mConfig.precondition_frequency));
    }
    if (mConfig.use_nesterov && mConfig.defaults.momentum == 0.0f) {
        warn("Nesterov flag is enabled but momentum parameter is zero! Continuing without using momentum or Nesterov acceleration...");
    }

    if (mLogger) {
        mLogger->log_options(mConfig.as_options());
    }

    mGroups.resize(groups.size());
    for (std::size_t g = 0; g < groups.size(); ++g) {
        build_group(static_cast<int>(g), groups[g]);
    }

    if (mLogger) {
        mLogger->log_parameter_count(mParameterCount);
        mLogger->log_allocator(*mAllocator);
    }
}

DistributedShampoo::~DistributedShampoo() = default;

void DistributedShampoo::warn(const std::string& msg) const {
    if (mLogger) {
        mLogger->log_warning(0, msg);
    } else {
        fprintf(stderr, "WARNING: %s\n", msg.c_str());
        fflush(stderr);
    }
}

void DistributedShampoo::build_group(int group_index, const ParamGroup& group) {
    GroupState& gs = mGroups[group_index];
    gs.Options = group.Options.value_or(mConfig.defaults);
    gs.Options.validate();

    auto ctx = mAllocator->with_context(fmt::format("group{}", group_index));

    // plan every tensor first; the buffer plan covers the items of the whole group
    std::vector<std::size_t> sizes;
    std::vector<std::pair<std::size_t, std::size_t>> item_range;   // per slot: [first, last) plan item
    for (std::size_t i = 0; i < group.Params.size(); ++i) {
        Parameter* param = group.Params[i];
        if (!param) {
            throw std::invalid_argument(fmt::format("Parameter {} of group {} is null", i, group_index));
        }
        if (param->Value.DType != ETensorDType::FP32 && param->Value.DType != ETensorDType::FP64) {
            throw std::runtime_error(fmt::format("Parameter {} has unsupported dtype {}. Must be fp32 or fp64.",
                                                 param->Name, dtype_to_str(param->Value.DType)));
        }

        TensorSlot slot;
        slot.Group = group_index;
        slot.Index = static_cast<int>(i);
        slot.Param = param;
        slot.Name = param->Name.empty() ? fmt::format("group{}.param{}", group_index, i) : param->Name;

        const std::size_t first = sizes.size();
        if (param->Value.nelem() > 0) {
            slot.Plan = classify(param->Value.shape(), mConfig);
            for (std::size_t bytes : buffer_sizes(slot.Plan, param->Value.DType)) {
                sizes.push_back(bytes);
            }
            mParameterCount += preconditioner_parameter_count(slot.Plan);
        }
        item_range.emplace_back(first, sizes.size());
        gs.Slots.push_back(static_cast<int>(mSlots.size()));
        mSlots.push_back(std::move(slot));
    }

    gs.Plan = distribute_buffer_sizes(sizes, mCoordinator.group_size());
    gs.Regions = split_buffer(gs.Plan);
    gs.Buffer = mAllocator->allocate(ETensorDType::BYTE, fmt::format("group{}.buffer", group_index),
                                     {static_cast<long>(gs.Plan.total_bytes())});

    std::vector<sBufferPlanEntry> log_entries;
    for (std::size_t i = 0; i < gs.Slots.size(); ++i) {
        TensorSlot& slot = mSlots[gs.Slots[i]];
        const auto [first, last] = item_range[i];
        if (first == last) {
            continue;
        }

        std::vector<BufferRegion> regions(gs.Regions.begin() + first, gs.Regions.begin() + last);
        for (std::size_t r = 0; r < regions.size(); ++r) {
            log_entries.push_back({regions.size() == 1 ? slot.Name : fmt::format("{}.block{}", slot.Name, r),
                                   regions[r].Bytes, regions[r].Offset, regions[r].Owner});
        }
        slot.State.emplace(CurvatureState::create(slot.Name, slot.Plan, regions, mCoordinator.group_rank(), mSettings, *mAllocator));

        const auto shape = slot.Param->Value.shape();
        const ETensorDType dtype = slot.Param->Value.DType;
        if (gs.Options.momentum != 0.0f) {
            slot.Momentum = mAllocator->allocate(dtype, slot.Name + ".momentum", shape);
        }
        if (gs.Options.beta1 != 0.0f && slot.State->is_local()) {
            slot.ExpAvg = mAllocator->allocate(dtype, slot.Name + ".exp_avg", shape);
        }
    }

    if (mLogger) {
        mLogger->log_buffer_plan(group_index, gs.Plan.GroupSize, gs.Plan.SharedSize, log_entries);
    }
}

bool DistributedShampoo::has_gradient(const TensorSlot& slot) const {
    return slot.State.has_value() && slot.Param->Grad.has_value();
}

void DistributedShampoo::check_gradient(const TensorSlot& slot) const {
    const Parameter& p = *slot.Param;
    if (p.SparseGrad) {
        throw std::runtime_error(fmt::format("Sparse gradient of {}: sparse parameters are not supported by Shampoo.", slot.Name));
    }
    if (p.Grad.DType != p.Value.DType) {
        throw std::runtime_error(fmt::format("Gradient of {} has dtype {}, parameter has {}",
                                             slot.Name, dtype_to_str(p.Grad.DType), dtype_to_str(p.Value.DType)));
    }
    if (p.Grad.shape() != p.Value.shape()) {
        throw std::runtime_error(fmt::format("Gradient of {} has shape {}, parameter has {}",
                                             slot.Name, shape_to_str(p.Grad.shape()), shape_to_str(p.Value.shape())));
    }
}

std::optional<float> DistributedShampoo::step(const Closure& closure) {
    std::optional<float> loss;
    if (closure) {
        loss = closure();
    }

    int iteration = 0;
    for (auto& slot : mSlots) {
        iteration = ++slot.Step;
    }

    // statistics, on the owning worker, from the (possibly L2-regularized) gradient
    std::vector<std::vector<double>> grads(mSlots.size());
    for (std::size_t s = 0; s < mSlots.size(); ++s) {
        TensorSlot& slot = mSlots[s];
        if (!slot.Param->Grad.has_value()) {
            continue;
        }
        check_gradient(slot);
        if (!slot.State || !slot.State->is_local()) {
            continue;
        }

        const ParamGroupOptions& opts = mGroups[slot.Group].Options;
        std::vector<double>& g = grads[s];
        g = to_double(slot.Param->Grad);
        if (!mConfig.use_decoupled_weight_decay && opts.weight_decay != 0.0f) {
            const std::vector<double> p = to_double(slot.Param->Value);
            for (std::size_t i = 0; i < g.size(); ++i) {
                g[i] += opts.weight_decay * p[i];
            }
        }
        slot.State->update(g.data(), opts, slot.Step);
    }

    if (iteration % mConfig.precondition_frequency == 0 && iteration >= mConfig.effective_start_step()) {
        for (auto& slot : mSlots) {
            if (has_gradient(slot)) {
                slot.State->invert(mGroups[slot.Group].Options, slot.Step, mSupervisor);
            }
        }
        if (mConfig.debug_mode) {
            log_root_inverse_residuals(iteration);
        }
    }

    for (auto& gs : mGroups) {
        const ParamGroupOptions& opts = gs.Options;

        for (int s : gs.Slots) {
            TensorSlot& slot = mSlots[s];
            if (!has_gradient(slot) || !slot.State->is_local()) {
                continue;
            }
            std::vector<double>& g = grads[s];
            if (opts.beta1 != 0.0f) {
                const double beta1 = opts.beta1;
                const double bc1 = mConfig.use_bias_correction ? 1.0 - std::pow(beta1, slot.Step) : 1.0;
                std::vector<double> m = to_double(slot.ExpAvg);
                for (std::size_t i = 0; i < g.size(); ++i) {
                    m[i] = beta1 * m[i] + (1.0 - beta1) * g[i];
                    g[i] = m[i] / bc1;
                }
                from_double(slot.ExpAvg, m);
            }
            slot.State->apply(g.data(), opts, slot.Step, gs.Buffer.Data, slot.Param->Value.DType);
        }

        mCoordinator.gather_all(gs.Buffer.Data, gs.Buffer.bytes(), gs.Plan.SharedSize);

        const double lr = opts.lr;
        const double wd = opts.weight_decay;
        const double mu = opts.momentum;
        for (int s : gs.Slots) {
            TensorSlot& slot = mSlots[s];
            if (!has_gradient(slot)) {
                continue;
            }
            Tensor& value = slot.Param->Value;
            std::vector<double> p = to_double(value);
            std::vector<double> d(p.size());
            slot.State->read_direction(gs.Buffer.Data, value.DType, d.data());

            if (mConfig.use_decoupled_weight_decay && wd != 0.0) {
                if (mu == 0.0) {
                    for (auto& x : p) {
                        x *= 1.0 - lr * wd;
                    }
                } else {
                    for (std::size_t i = 0; i < d.size(); ++i) {
                        d[i] += wd * p[i];
                    }
                }
            }

            if (mu != 0.0) {
                std::vector<double> m = to_double(slot.Momentum);
                for (std::size_t i = 0; i < d.size(); ++i) {
                    m[i] = mu * m[i] + d[i];
                    d[i] = mConfig.use_nesterov ? d[i] + mu * m[i] : m[i];
                }
                from_double(slot.Momentum, m);
            }

            for (std::size_t i = 0; i < p.size(); ++i) {
                p[i] -= lr * d[i];
            }
            from_double(value, p);
        }
    }

    return loss;
}

void DistributedShampoo::log_root_inverse_residuals(int step) {
    InversionDiagnostics diagnostics;
    for (const auto& slot : mSlots) {
        if (slot.State) {
            slot.State->compute_residuals(mGroups[slot.Group].Options, slot.Step, diagnostics);
        }
    }
    if (diagnostics.RelativeErrors.empty()) {
        return;
    }

    const double expected = mConfig.preconditioner_dtype == ETensorDType::FP64 ? 1e-7 : 1e-3;
    const auto errors = summarize_quantiles(diagnostics.RelativeErrors);
    const auto residuals = summarize_quantiles(diagnostics.RelativeResiduals);
    if (mLogger) {
        mLogger->log_message(step, fmt::format("Expect relative error <= {}", expected));
        mLogger->log_residuals(step, "relative_error", errors);
        mLogger->log_residuals(step, "relative_residual", residuals);
    } else {
        fprintf(stderr, "step %d: relative error mean %.3e max %.3e (expect <= %.0e), relative residual mean %.3e max %.3e\n",
                step, errors.Mean, errors.Quantiles[4], expected, residuals.Mean, residuals.Quantiles[4]);
    }
}

void DistributedShampoo::reset_preconditioners() {
    for (auto& slot : mSlots) {
        if (slot.State) {
            slot.State->reset();
        }
    }
}

const CurvatureState* DistributedShampoo::curvature_state(int group, int index) const {
    const TensorSlot& slot = mSlots.at(mGroups.at(group).Slots.at(index));
    return slot.State ? &*slot.State : nullptr;
}

const CurvaturePlan& DistributedShampoo::curvature_plan(int group, int index) const {
    return mSlots.at(mGroups.at(group).Slots.at(index)).Plan;
}

int DistributedShampoo::step_count(int group, int index) const {
    return mSlots.at(mGroups.at(group).Slots.at(index)).Step;
}

std::string DistributedShampoo::slot_prefix(const TensorSlot& slot) const {
    return fmt::format("group{}.param{}", slot.Group, slot.Index);
}

void DistributedShampoo::visit_slot_tensors(const TensorSlot& slot, const TensorVisitor& visit) const {
    const std::string prefix = slot_prefix(slot);
    if (slot.State) {
        slot.State->for_each_tensor(prefix, visit);
    }
    if (slot.Momentum.has_value()) {
        visit(prefix + ".momentum", slot.Momentum);
    }
    if (slot.ExpAvg.has_value()) {
        visit(prefix + ".exp_avg", slot.ExpAvg);
    }
}

ShampooSnapshot DistributedShampoo::state_dict() const {
    ShampooSnapshot snapshot;
    nlohmann::json& meta = snapshot.Metadata;
    meta["format"] = SNAPSHOT_FORMAT;
    meta["group_size"] = mCoordinator.group_size();
    meta["group_rank"] = mCoordinator.group_rank();
    meta["config"] = mConfig;

    meta["groups"] = nlohmann::json::array();
    for (const auto& gs : mGroups) {
        meta["groups"].push_back({{"options", gs.Options}, {"num_params", gs.Slots.size()}});
    }

    meta["slots"] = nlohmann::json::array();
    for (const auto& slot : mSlots) {
        nlohmann::json entry = {{"group", slot.Group}, {"index", slot.Index}, {"step", slot.Step}};
        if (slot.State) {
            entry["kind"] = to_str(slot.State->kind());
            entry["factors"] = slot.State->export_meta();
        }
        meta["slots"].push_back(std::move(entry));
    }

    for (const auto& slot : mSlots) {
        visit_slot_tensors(slot, [&](const std::string& name, const Tensor& tensor) {
            snapshot.Tensors.emplace(name, SnapshotTensor::copy_of(tensor));
        });
    }
    return snapshot;
}

void DistributedShampoo::load_state_dict(const ShampooSnapshot& snapshot) {
    const nlohmann::json& meta = snapshot.Metadata;
    try {
        if (meta.at("format").get<int>() != SNAPSHOT_FORMAT) {
            throw std::runtime_error(fmt::format("Unsupported snapshot format {}", meta.at("format").dump()));
        }

        const auto& groups = meta.at("groups");
        if (groups.size() != mGroups.size()) {
            throw std::runtime_error(fmt::format("Loaded state dict has {} parameter groups, optimizer has {}",
                                                 groups.size(), mGroups.size()));
        }
        for (std::size_t g = 0; g < mGroups.size(); ++g) {
            const auto n = groups[g].at("num_params").get<std::size_t>();
            if (n != mGroups[g].Slots.size()) {
                throw std::runtime_error(fmt::format("Loaded state dict contains a parameter group {} with {} tensors "
                                                     "that doesn't match the size of optimizer's group ({})",
                                                     g, n, mGroups[g].Slots.size()));
            }
        }

        const int group_size = meta.at("group_size").get<int>();
        const int group_rank = meta.at("group_rank").get<int>();
        if (group_size != mCoordinator.group_size() || group_rank != mCoordinator.group_rank()) {
            throw std::runtime_error(fmt::format("Snapshot was taken by worker {} of a group of {}, this is worker {} of {}",
                                                 group_rank, group_size, mCoordinator.group_rank(), mCoordinator.group_size()));
        }

        const auto& slots = meta.at("slots");
        if (slots.size() != mSlots.size()) {
            throw std::runtime_error(fmt::format("Snapshot has {} tensors, optimizer has {}", slots.size(), mSlots.size()));
        }
        for (std::size_t s = 0; s < mSlots.size(); ++s) {
            const TensorSlot& slot = mSlots[s];
            const std::string kind = slots[s].value("kind", std::string{});
            const std::string expected = slot.State ? to_str(slot.State->kind()) : "";
            if (kind != expected) {
                throw std::runtime_error(fmt::format("Tensor {} has curvature kind '{}' in the snapshot, expected '{}'",
                                                     slot.Name, kind, expected));
            }
        }

        // validate every buffer before touching any state
        std::set<std::string> seen;
        for (const auto& slot : mSlots) {
            visit_slot_tensors(slot, [&](const std::string& name, const Tensor& tensor) {
                auto it = snapshot.Tensors.find(name);
                if (it == snapshot.Tensors.end()) {
                    throw std::runtime_error(fmt::format("Buffer {} missing from snapshot", name));
                }
                if (it->second.DType != tensor.DType || it->second.Shape != tensor.shape()) {
                    throw std::runtime_error(fmt::format("Buffer {} is {} {} in the snapshot, expected {} {}", name,
                                                         dtype_to_str(it->second.DType), shape_to_str(it->second.Shape),
                                                         dtype_to_str(tensor.DType), shape_to_str(tensor.shape())));
                }
                if (it->second.Data.size() != tensor.bytes()) {
                    throw std::runtime_error(fmt::format("Buffer {} has {} bytes in the snapshot, expected {}", name,
                                                         it->second.Data.size(), tensor.bytes()));
                }
                seen.insert(name);
            });
        }
        for (const auto& [name, tensor] : snapshot.Tensors) {
            if (!seen.contains(name)) {
                throw std::runtime_error(fmt::format("Unexpected buffer {} in snapshot", name));
            }
        }

        std::vector<ParamGroupOptions> options;
        for (const auto& group : groups) {
            ParamGroupOptions opts;
            group.at("options").get_to(opts);
            opts.validate();
            options.push_back(opts);
        }

        for (std::size_t g = 0; g < mGroups.size(); ++g) {
            mGroups[g].Options = options[g];
        }
        for (std::size_t s = 0; s < mSlots.size(); ++s) {
            TensorSlot& slot = mSlots[s];
            slot.Step = slots[s].at("step").get<int>();
            if (slot.State) {
                slot.State->import_meta(slots[s].at("factors"));
            }
            visit_slot_tensors(slot, [&](const std::string& name, const Tensor& tensor) {
                const SnapshotTensor& src = snapshot.Tensors.at(name);
                if (!src.Data.empty()) {
                    std::memcpy(tensor.Data, src.Data.data(), src.Data.size());
                }
            });
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Malformed optimizer snapshot: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(fmt::format("Invalid hyperparameters in optimizer snapshot: {}", e.what()));
    }
}

} // namespace shampoo
