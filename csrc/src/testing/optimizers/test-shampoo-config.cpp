// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for hyperparameter validation and the JSON form of the configuration.

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "optimizers/shampoo_config.h"

using namespace shampoo;
namespace fs = std::filesystem;

TEST_CASE("Default configuration is valid", "[config]") {
    ShampooConfig config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.effective_start_step() == 1);
    config.precondition_frequency = 10;
    REQUIRE(config.effective_start_step() == 10);
    config.start_preconditioning_step = 3;
    REQUIRE(config.effective_start_step() == 3);
}

TEST_CASE("Hyperparameter validation names the offending value", "[config]") {
    auto rejects = [](auto mutate) {
        ShampooConfig config;
        mutate(config);
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    };

    rejects([](ShampooConfig& c) { c.defaults.lr = -1.0f; });
    rejects([](ShampooConfig& c) { c.defaults.beta1 = 1.0f; });
    rejects([](ShampooConfig& c) { c.defaults.beta2 = 0.0f; });
    rejects([](ShampooConfig& c) { c.defaults.beta2 = 1.5f; });
    rejects([](ShampooConfig& c) { c.defaults.epsilon = 0.0f; });
    rejects([](ShampooConfig& c) { c.defaults.momentum = 1.0f; });
    rejects([](ShampooConfig& c) { c.defaults.weight_decay = -0.1f; });
    rejects([](ShampooConfig& c) { c.defaults.grafting_beta2 = 0.0f; });
    rejects([](ShampooConfig& c) { c.defaults.grafting_epsilon = -1e-3f; });
    rejects([](ShampooConfig& c) { c.max_preconditioner_dim = 0; });
    rejects([](ShampooConfig& c) { c.precondition_frequency = 0; });
    rejects([](ShampooConfig& c) { c.start_preconditioning_step = -2; });
    rejects([](ShampooConfig& c) { c.exponent_override = -1; });
    rejects([](ShampooConfig& c) { c.exponent_multiplier = 0.0f; });
    rejects([](ShampooConfig& c) { c.num_workers_per_group = 0; });
    rejects([](ShampooConfig& c) { c.max_stale_inversions = -1; });
    rejects([](ShampooConfig& c) { c.preconditioner_dtype = ETensorDType::BYTE; });

    ShampooConfig config;
    config.defaults.beta1 = 1.0f;
    try {
        config.validate();
        FAIL("expected validation to fail");
    } catch (const std::invalid_argument& e) {
        REQUIRE(std::string(e.what()) == "Invalid beta parameter at index 0: 1. Must be in [0.0, 1.0).");
    }
}

TEST_CASE("Enum names parse case-insensitively", "[config]") {
    REQUIRE(large_dim_method_from_str("Blocking") == ELargeDimMethod::BLOCKING);
    REQUIRE(grafting_type_from_str("adam_normalized") == EGraftingType::ADAM_NORMALIZED);
    REQUIRE(std::string(to_str(EGraftingType::RMSPROP)) == "rmsprop");
    REQUIRE_THROWS_AS(grafting_type_from_str("lion"), std::invalid_argument);
}

TEST_CASE("Configuration survives a JSON round trip", "[config]") {
    ShampooConfig config;
    config.defaults.lr = 0.5f;
    config.defaults.beta1 = 0.0f;
    config.defaults.beta2 = 0.99f;
    config.max_preconditioner_dim = 256;
    config.precondition_frequency = 20;
    config.start_preconditioning_step = 40;
    config.use_nesterov = true;
    config.preconditioner_dtype = ETensorDType::FP64;
    config.large_dim_method = ELargeDimMethod::DIAGONAL;
    config.grafting_type = EGraftingType::ADAM;
    config.num_workers_per_group = 2;
    config.max_stale_inversions = 5;

    const nlohmann::json j = config;
    REQUIRE(j["defaults"]["betas"].size() == 2);
    REQUIRE(j["grafting_type"] == "adam");

    const ShampooConfig restored = j.get<ShampooConfig>();
    REQUIRE(restored.defaults.lr == 0.5f);
    REQUIRE(restored.defaults.beta2 == 0.99f);
    REQUIRE(restored.max_preconditioner_dim == 256);
    REQUIRE(restored.start_preconditioning_step == 40);
    REQUIRE(restored.use_nesterov);
    REQUIRE(restored.preconditioner_dtype == ETensorDType::FP64);
    REQUIRE(restored.large_dim_method == ELargeDimMethod::DIAGONAL);
    REQUIRE(restored.grafting_type == EGraftingType::ADAM);
    REQUIRE(restored.num_workers_per_group == 2);
    REQUIRE(restored.max_stale_inversions == 5);
}

TEST_CASE("Configuration files fill in defaults and are validated", "[config]") {
    const fs::path dir = fs::temp_directory_path() / "distshampoo_config_test";
    fs::create_directories(dir);
    const fs::path file = dir / "shampoo.json";

    {
        std::ofstream out(file);
        out << R"({"defaults": {"lr": 0.1, "betas": [0.0, 0.999]}, "grafting_type": "rmsprop"})";
    }
    const ShampooConfig config = load_shampoo_config(file.string());
    REQUIRE(config.defaults.lr == 0.1f);
    REQUIRE(config.defaults.beta1 == 0.0f);
    REQUIRE(config.defaults.momentum == 0.0f);
    REQUIRE(config.grafting_type == EGraftingType::RMSPROP);
    REQUIRE(config.max_preconditioner_dim == 1024);

    {
        std::ofstream out(file);
        out << R"({"precondition_frequency": 0})";
    }
    REQUIRE_THROWS_AS(load_shampoo_config(file.string()), std::invalid_argument);

    {
        std::ofstream out(file);
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(load_shampoo_config(file.string()), std::runtime_error);
    REQUIRE_THROWS_AS(load_shampoo_config((dir / "missing.json").string()), std::runtime_error);

    fs::remove_all(dir);
}

TEST_CASE("Options listing covers every setting", "[config]") {
    const auto options = ShampooConfig{}.as_options();
    bool has_grafting = false;
    for (const auto& [name, value] : options) {
        if (name == "grafting_type") {
            has_grafting = std::get<std::string>(value) == "adagrad";
        }
    }
    REQUIRE(has_grafting);
    REQUIRE(options.size() >= 17);
}
