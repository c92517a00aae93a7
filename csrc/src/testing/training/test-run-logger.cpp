// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the JSON run log and the quantile summaries of debug diagnostics.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "training/logging.h"

using Catch::Approx;
namespace fs = std::filesystem;

TEST_CASE("summarize_quantiles picks nearest-rank quantiles", "[logging]") {
    SECTION("odd count") {
        auto summary = summarize_quantiles({5.0, 1.0, 4.0, 2.0, 3.0});
        REQUIRE(summary.Count == 5);
        REQUIRE(summary.Mean == Approx(3.0));
        REQUIRE(summary.Quantiles == std::array<double, 5>{1.0, 2.0, 3.0, 4.0, 5.0});
    }

    SECTION("even count rounds the index") {
        auto summary = summarize_quantiles({4.0, 3.0, 2.0, 1.0});
        REQUIRE(summary.Quantiles == std::array<double, 5>{1.0, 2.0, 3.0, 3.0, 4.0});
        REQUIRE(summary.Mean == Approx(2.5));
    }

    SECTION("empty input") {
        auto summary = summarize_quantiles({});
        REQUIRE(summary.Count == 0);
        REQUIRE(summary.Mean == 0.0);
    }
}

TEST_CASE("RunLogger forwards rank 0 lines to the callback", "[logging]") {
    std::vector<std::string> lines;
    RunLogger logger("", 0, RunLogger::SILENT);
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });

    logger.log_step(3, 12, 0.5f, 0.01f);
    logger.log_warning(3, R"(factor "w" is stale)");
    {
        auto section = logger.log_section_start(3, "save snapshot");
    }

    REQUIRE(lines.size() == 3);
    auto step = nlohmann::json::parse(lines[0]);
    REQUIRE(step["log"] == "step");
    REQUIRE(step["step"] == 3);
    REQUIRE(step["loss"].get<float>() == Approx(0.5f));

    auto warning = nlohmann::json::parse(lines[1]);
    REQUIRE(warning["message"] == R"(factor "w" is stale)");

    auto section = nlohmann::json::parse(lines[2]);
    REQUIRE(section["message"] == "save snapshot");
    REQUIRE(section.contains("duration_ms"));
}

TEST_CASE("RunLogger on other ranks stays quiet", "[logging]") {
    std::vector<std::string> lines;
    RunLogger logger("", 1, RunLogger::SILENT);
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });

    logger.log_step(1, 1, 1.0f, 0.1f);
    logger.log_parameter_count(100);
    logger.log_residuals(1, "relative_error", summarize_quantiles({1e-6}));
    logger.log_inversion_fallback(1, "w.factor0", "stale_factor", "non-finite eigenvalues");
    REQUIRE(lines.empty());
}

TEST_CASE("RunLogger writes a valid JSON array", "[logging]") {
    const fs::path dir = fs::temp_directory_path() / "distshampoo_logger_test";
    const fs::path file = dir / "nested" / "log.json";
    fs::remove_all(dir);

    {
        RunLogger logger(file.string(), 0, RunLogger::SILENT);
        logger.log_options({{"lr", 0.01f}, {"grafting_type", std::string("adagrad")}, {"use_nesterov", true}});
        logger.log_buffer_plan(0, 2, 128, {{"w.block0", 128, 0, 0}, {"w.block1", 64, 128, 1}});
        logger.log_residuals(4, "relative_residual", summarize_quantiles({1.0, 2.0}));
    }

    std::ifstream in(file);
    REQUIRE(in.good());
    auto log = nlohmann::json::parse(in);
    REQUIRE(log.is_array());

    int options = 0;
    int buffers = 0;
    for (const auto& entry : log) {
        if (entry["log"] == "option") ++options;
        if (entry["log"] == "buffer") ++buffers;
        if (entry["log"] == "buffer_plan") {
            REQUIRE(entry["workers"] == 2);
            REQUIRE(entry["shared_size"] == 128);
        }
        if (entry["log"] == "residual") {
            REQUIRE(entry["quantiles"].size() == 5);
            REQUIRE(entry["mean"].get<double>() == Approx(1.5));
        }
    }
    REQUIRE(options == 3);
    REQUIRE(buffers == 2);
    fs::remove_all(dir);
}
