// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_SHAMPOO_CONFIG_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_SHAMPOO_CONFIG_H

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "utilities/dtype.h"

namespace shampoo {

//! How dimensions larger than `max_preconditioner_dim` are handled.
enum class ELargeDimMethod : int {
    DIAGONAL,   // diagonal Kronecker factor for every oversized dimension
    ADAGRAD,    // whole tensor falls back to a diagonal (Adagrad) accumulator
    BLOCKING    // tensor is cut into blocks of at most max_preconditioner_dim per dimension
};

enum class EGraftingType : int {
    NONE,
    SGD,
    ADAGRAD,
    RMSPROP,
    ADAM,
    ADAGRAD_NORMALIZED,
    RMSPROP_NORMALIZED,
    ADAM_NORMALIZED
};

const char* to_str(ELargeDimMethod method);
const char* to_str(EGraftingType type);
ELargeDimMethod large_dim_method_from_str(std::string_view name);
EGraftingType grafting_type_from_str(std::string_view name);

/**
 * @brief Hyperparameters shared by all tensors of one parameter group.
 */
struct ParamGroupOptions {
    float lr = 1e-2f;
    float beta1 = 0.9f;
    float beta2 = 1.0f;
    float epsilon = 1e-12f;
    float momentum = 0.0f;
    float weight_decay = 0.0f;
    float grafting_epsilon = 1e-3f;
    float grafting_beta2 = 1.0f;

    //! @throws std::invalid_argument naming the violated constraint.
    void validate() const;
};

/**
 * @brief Configuration of the distributed Shampoo optimizer.
 *
 * `defaults` seeds the hyperparameters of parameter groups that don't bring their own.
 */
struct ShampooConfig {
    ParamGroupOptions defaults;

    int max_preconditioner_dim = 1024;
    int precondition_frequency = 1;
    // -1: same as precondition_frequency
    int start_preconditioning_step = -1;
    // 0: use 2 * tensor order
    int exponent_override = 0;
    float exponent_multiplier = 1.0f;

    bool use_nesterov = false;
    bool use_bias_correction = true;
    bool use_decoupled_weight_decay = true;
    bool use_merge_dims = true;

    ETensorDType preconditioner_dtype = ETensorDType::FP32;
    ELargeDimMethod large_dim_method = ELargeDimMethod::BLOCKING;
    EGraftingType grafting_type = EGraftingType::ADAGRAD;

    // -1: LOCAL_WORLD_SIZE from the environment, else the world size
    int num_workers_per_group = -1;

    bool use_protected_eigh = true;
    // 0: unbounded reuse of stale inverse factors
    int max_stale_inversions = 0;
    bool debug_mode = false;

    //! @throws std::invalid_argument naming the violated constraint.
    void validate() const;

    //! start_preconditioning_step with -1 resolved
    [[nodiscard]] int effective_start_step() const {
        return start_preconditioning_step == -1 ? precondition_frequency : start_preconditioning_step;
    }

    using OptionValue = std::variant<bool, std::int64_t, float, std::string>;
    [[nodiscard]] std::vector<std::pair<std::string_view, OptionValue>> as_options() const;
};

void to_json(nlohmann::json& j, const ParamGroupOptions& opts);
void from_json(const nlohmann::json& j, ParamGroupOptions& opts);
void to_json(nlohmann::json& j, const ShampooConfig& config);
void from_json(const nlohmann::json& j, ShampooConfig& config);

ShampooConfig load_shampoo_config(const std::string& file_name);

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_SHAMPOO_CONFIG_H
