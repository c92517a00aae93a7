// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/shampoo_config.h"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace shampoo {

const char* to_str(ELargeDimMethod method) {
    switch (method) {
        case ELargeDimMethod::DIAGONAL: return "diagonal";
        case ELargeDimMethod::ADAGRAD: return "adagrad";
        case ELargeDimMethod::BLOCKING: return "blocking";
    }
    return "unknown";
}

const char* to_str(EGraftingType type) {
    switch (type) {
        case EGraftingType::NONE: return "none";
        case EGraftingType::SGD: return "sgd";
        case EGraftingType::ADAGRAD: return "adagrad";
        case EGraftingType::RMSPROP: return "rmsprop";
        case EGraftingType::ADAM: return "adam";
        case EGraftingType::ADAGRAD_NORMALIZED: return "adagrad_normalized";
        case EGraftingType::RMSPROP_NORMALIZED: return "rmsprop_normalized";
        case EGraftingType::ADAM_NORMALIZED: return "adam_normalized";
    }
    return "unknown";
}

ELargeDimMethod large_dim_method_from_str(std::string_view name) {
    for (auto method : {ELargeDimMethod::DIAGONAL, ELargeDimMethod::ADAGRAD, ELargeDimMethod::BLOCKING}) {
        if (iequals(name, to_str(method))) return method;
    }
    throw std::invalid_argument(fmt::format("Unknown large dim method '{}'", name));
}

EGraftingType grafting_type_from_str(std::string_view name) {
    for (auto type : {EGraftingType::NONE, EGraftingType::SGD, EGraftingType::ADAGRAD, EGraftingType::RMSPROP,
                      EGraftingType::ADAM, EGraftingType::ADAGRAD_NORMALIZED, EGraftingType::RMSPROP_NORMALIZED,
                      EGraftingType::ADAM_NORMALIZED}) {
        if (iequals(name, to_str(type))) return type;
    }
    throw std::invalid_argument(fmt::format("Unknown grafting type '{}'", name));
}

// NaN fails every comparison, so each check is phrased as "is in range".
void ParamGroupOptions::validate() const {
    if (!(lr >= 0.0f)) {
        throw std::invalid_argument(fmt::format("Invalid learning rate: {}. Must be >= 0.0.", lr));
    }
    if (!(beta1 >= 0.0f && beta1 < 1.0f)) {
        throw std::invalid_argument(fmt::format("Invalid beta parameter at index 0: {}. Must be in [0.0, 1.0).", beta1));
    }
    if (!(beta2 > 0.0f && beta2 <= 1.0f)) {
        throw std::invalid_argument(fmt::format("Invalid beta parameter at index 1: {}. Must be in (0.0, 1.0].", beta2));
    }
    if (!(epsilon > 0.0f)) {
        throw std::invalid_argument(fmt::format("Invalid epsilon value: {}. Must be > 0.0.", epsilon));
    }
    if (!(momentum >= 0.0f && momentum < 1.0f)) {
        throw std::invalid_argument(fmt::format("Invalid momentum parameter: {}. Must be [0.0, 1.0).", momentum));
    }
    if (!(weight_decay >= 0.0f)) {
        throw std::invalid_argument(fmt::format("Invalid weight_decay value: {}. Must be > 0.0.", weight_decay));
    }
    if (!(grafting_beta2 > 0.0f && grafting_beta2 <= 1.0f)) {
        throw std::invalid_argument(fmt::format("Invalid grafting beta parameter: {}. Must be in (0.0, 1.0].", grafting_beta2));
    }
    if (!(grafting_epsilon > 0.0f)) {
        throw std::invalid_argument(fmt::format("Invalid epsilon value: {}. Must be > 0.0.", grafting_epsilon));
    }
}

void ShampooConfig::validate() const {
    defaults.validate();
    if (max_preconditioner_dim < 1) {
        throw std::invalid_argument(fmt::format("Invalid max preconditioner dimension: {}. Must be >= 1.", max_preconditioner_dim));
    }
    if (precondition_frequency < 1) {
        throw std::invalid_argument(fmt::format("Invalid precondition frequency: {}. Must be >= 1.", precondition_frequency));
    }
    if (start_preconditioning_step < -1) {
        throw std::invalid_argument(fmt::format("Invalid start preconditioning step: {}. Must be >= -1.", start_preconditioning_step));
    }
    if (exponent_override < 0) {
        throw std::invalid_argument(fmt::format("Invalid exponent override: {}. Must be >= 0.", exponent_override));
    }
    if (!(exponent_multiplier > 0.0f) || !std::isfinite(exponent_multiplier)) {
        throw std::invalid_argument(fmt::format("Invalid exponent multiplier: {}. Must be > 0.0.", exponent_multiplier));
    }
    if (num_workers_per_group < -1 || num_workers_per_group == 0) {
        throw std::invalid_argument(fmt::format("Invalid number of workers per group: {}. Must be >= 1 or -1.", num_workers_per_group));
    }
    if (max_stale_inversions < 0) {
        throw std::invalid_argument(fmt::format("Invalid max stale inversions: {}. Must be >= 0.", max_stale_inversions));
    }
    if (preconditioner_dtype != ETensorDType::FP32 && preconditioner_dtype != ETensorDType::FP64) {
        throw std::invalid_argument(fmt::format("Invalid preconditioner dtype: {}. Must be fp32 or fp64.", dtype_to_str(preconditioner_dtype)));
    }
}

std::vector<std::pair<std::string_view, ShampooConfig::OptionValue>> ShampooConfig::as_options() const {
    return {
        {"lr", defaults.lr},
        {"beta1", defaults.beta1},
        {"beta2", defaults.beta2},
        {"epsilon", defaults.epsilon},
        {"momentum", defaults.momentum},
        {"weight_decay", defaults.weight_decay},
        {"grafting_epsilon", defaults.grafting_epsilon},
        {"grafting_beta2", defaults.grafting_beta2},
        {"max_preconditioner_dim", std::int64_t{max_preconditioner_dim}},
        {"precondition_frequency", std::int64_t{precondition_frequency}},
        {"start_preconditioning_step", std::int64_t{effective_start_step()}},
        {"exponent_override", std::int64_t{exponent_override}},
        {"exponent_multiplier", exponent_multiplier},
        {"use_nesterov", use_nesterov},
        {"use_bias_correction", use_bias_correction},
        {"use_decoupled_weight_decay", use_decoupled_weight_decay},
        {"use_merge_dims", use_merge_dims},
        {"preconditioner_dtype", std::string(dtype_to_str(preconditioner_dtype))},
        {"large_dim_method", std::string(to_str(large_dim_method))},
        {"grafting_type", std::string(to_str(grafting_type))},
        {"num_workers_per_group", std::int64_t{num_workers_per_group}},
        {"use_protected_eigh", use_protected_eigh},
        {"max_stale_inversions", std::int64_t{max_stale_inversions}},
        {"debug_mode", debug_mode},
    };
}

void to_json(nlohmann::json& j, const ParamGroupOptions& opts) {
    j = nlohmann::json{
        {"lr", opts.lr},
        {"betas", {opts.beta1, opts.beta2}},
        {"epsilon", opts.epsilon},
        {"momentum", opts.momentum},
        {"weight_decay", opts.weight_decay},
        {"grafting_epsilon", opts.grafting_epsilon},
        {"grafting_beta2", opts.grafting_beta2},
    };
}

void from_json(const nlohmann::json& j, ParamGroupOptions& opts) {
    ParamGroupOptions defaults = opts;
    opts.lr = j.value("lr", defaults.lr);
    if (auto it = j.find("betas"); it != j.end()) {
        auto betas = it->get<std::vector<float>>();
        if (betas.size() != 2) {
            throw std::invalid_argument(fmt::format("Expected two betas, got {}", betas.size()));
        }
        opts.beta1 = betas[0];
        opts.beta2 = betas[1];
    }
    opts.epsilon = j.value("epsilon", defaults.epsilon);
    opts.momentum = j.value("momentum", defaults.momentum);
    opts.weight_decay = j.value("weight_decay", defaults.weight_decay);
    opts.grafting_epsilon = j.value("grafting_epsilon", defaults.grafting_epsilon);
    opts.grafting_beta2 = j.value("grafting_beta2", defaults.grafting_beta2);
}

void to_json(nlohmann::json& j, const ShampooConfig& config) {
    j = nlohmann::json{
        {"defaults", config.defaults},
        {"max_preconditioner_dim", config.max_preconditioner_dim},
        {"precondition_frequency", config.precondition_frequency},
        {"start_preconditioning_step", config.start_preconditioning_step},
        {"exponent_override", config.exponent_override},
        {"exponent_multiplier", config.exponent_multiplier},
        {"use_nesterov", config.use_nesterov},
        {"use_bias_correction", config.use_bias_correction},
        {"use_decoupled_weight_decay", config.use_decoupled_weight_decay},
        {"use_merge_dims", config.use_merge_dims},
        {"preconditioner_dtype", dtype_to_str(config.preconditioner_dtype)},
        {"large_dim_method", to_str(config.large_dim_method)},
        {"grafting_type", to_str(config.grafting_type)},
        {"num_workers_per_group", config.num_workers_per_group},
        {"use_protected_eigh", config.use_protected_eigh},
        {"max_stale_inversions", config.max_stale_inversions},
        {"debug_mode", config.debug_mode},
    };
}

void from_json(const nlohmann::json& j, ShampooConfig& config) {
    ShampooConfig d;
    if (auto it = j.find("defaults"); it != j.end()) {
        it->get_to(config.defaults);
    }
    config.max_preconditioner_dim = j.value("max_preconditioner_dim", d.max_preconditioner_dim);
    config.precondition_frequency = j.value("precondition_frequency", d.precondition_frequency);
    config.start_preconditioning_step = j.value("start_preconditioning_step", d.start_preconditioning_step);
    config.exponent_override = j.value("exponent_override", d.exponent_override);
    config.exponent_multiplier = j.value("exponent_multiplier", d.exponent_multiplier);
    config.use_nesterov = j.value("use_nesterov", d.use_nesterov);
    config.use_bias_correction = j.value("use_bias_correction", d.use_bias_correction);
    config.use_decoupled_weight_decay = j.value("use_decoupled_weight_decay", d.use_decoupled_weight_decay);
    config.use_merge_dims = j.value("use_merge_dims", d.use_merge_dims);
    config.preconditioner_dtype = dtype_from_str(j.value("preconditioner_dtype", std::string(dtype_to_str(d.preconditioner_dtype))));
    config.large_dim_method = large_dim_method_from_str(j.value("large_dim_method", std::string(to_str(d.large_dim_method))));
    config.grafting_type = grafting_type_from_str(j.value("grafting_type", std::string(to_str(d.grafting_type))));
    config.num_workers_per_group = j.value("num_workers_per_group", d.num_workers_per_group);
    config.use_protected_eigh = j.value("use_protected_eigh", d.use_protected_eigh);
    config.max_stale_inversions = j.value("max_stale_inversions", d.max_stale_inversions);
    config.debug_mode = j.value("debug_mode", d.debug_mode);
}

ShampooConfig load_shampoo_config(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", file_name));
    }
    ShampooConfig config;
    try {
        nlohmann::json::parse(file).get_to(config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("invalid config file {}: {}", file_name, e.what()));
    }
    config.validate();
    return config;
}

} // namespace shampoo
