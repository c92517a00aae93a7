// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <numeric>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "utilities/allocator.h"

namespace {

//! JSON-escape a free-form string (messages, factor names)
std::string escape(std::string_view text) {
    std::string dumped = nlohmann::json(std::string(text)).dump();
    return dumped.substr(1, dumped.size() - 2);
}

} // namespace

/**
 * @brief Mean and nearest-rank quantiles of `values`.
 *
 * Quantile q picks the element at index round(q * (n - 1)) of the sorted values.
 */
sQuantileSummary summarize_quantiles(std::vector<double> values) {
    sQuantileSummary summary;
    summary.Count = values.size();
    if(values.empty()) {
        return summary;
    }
    std::sort(values.begin(), values.end());
    summary.Mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    constexpr std::array<double, 5> levels = {0.0, 0.25, 0.5, 0.75, 1.0};
    for(std::size_t i = 0; i < levels.size(); ++i) {
        auto idx = static_cast<std::size_t>(std::lround(levels[i] * static_cast<double>(values.size() - 1)));
        summary.Quantiles[i] = values[idx];
    }
    return summary;
}

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty to disable the file.
 * @param rank Worker rank; only rank 0 writes the JSON file and prints most output.
 * @param verbosity Verbosity level controlling stdout printing.
 */
RunLogger::RunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if(!mLogFile) {
            throw std::runtime_error(fmt::format("Could not open log file '{}'", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

RunLogger::~RunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void RunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void RunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += fmt::format("\"{}\"", escape(argv[i]));
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line; VERBOSE also prints them as a table.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void RunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if(mRank != 0) return;

    int option_length = 0;
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": "{}"}})",
                                     std::chrono::system_clock::now(), name, escape(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
        };
        option_length = std::max(option_length, static_cast<int>(name.size()));
        std::visit(log, value);
    }

    if(mVerbosity >= VERBOSE) {
        printf("[Options]\n");
        for(auto& [name, value]: options) {
            std::visit([&](auto&& v) {
                printf("  %-*s : %s\n", option_length, std::string(name).c_str(), fmt::format("{}", v).c_str());
            }, value);
        }
        printf("\n");
    }
}

void RunLogger::log_buffer_plan(int group, int group_size, std::size_t shared_size, const std::vector<sBufferPlanEntry>& entries) {
    if(mRank != 0) return;

    std::vector<std::size_t> loads(group_size, 0);
    for(const auto& entry : entries) {
        loads.at(entry.Owner) += entry.Bytes;
        log_line(fmt::format(R"(  {{"log": "buffer", "time": "{}", "step": 0, "group": {}, "name": "{}", "bytes": {}, "offset": {}, "owner": {}}})",
                             std::chrono::system_clock::now(), group, escape(entry.Name), entry.Bytes, entry.Offset, entry.Owner));
    }
    log_line(fmt::format(R"(  {{"log": "buffer_plan", "time": "{}", "step": 0, "group": {}, "workers": {}, "shared_size": {}, "buffers": {}}})",
                         std::chrono::system_clock::now(), group, group_size, shared_size, entries.size()));

    if(mVerbosity >= DEFAULT) {
        printf("[Buffers] group %d: %zu buffers, %zu bytes per worker\n", group, entries.size(), shared_size);
        if(mVerbosity >= VERBOSE) {
            for(const auto& entry : entries) {
                printf("  %-40s : %10zu bytes @ %10zu -> worker %d\n", entry.Name.c_str(), entry.Bytes, entry.Offset, entry.Owner);
            }
        }
        for(int w = 0; w < group_size; ++w) {
            printf("  worker %3d : %10zu bytes\n", w, loads[w]);
        }
        printf("\n");
    }
}

void RunLogger::log_parameter_count(long count) {
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "parameters", "time": "{}", "step": 0, "preconditioner_parameters": {}}})",
                         std::chrono::system_clock::now(), count));
    if(mVerbosity >= DEFAULT) {
        printf("Total preconditioner parameters: %ld\n\n", count);
    }
}

void RunLogger::log_allocator(const TensorAllocator& allocator) {
    if(mRank != 0) return;
    for(const auto& [ctx, bytes] : allocator.get_allocation_segments()) {
        log_line(fmt::format(R"(  {{"log": "allocator", "time": "{}", "step": 0, "context": "{}", "bytes": {}}})",
                             std::chrono::system_clock::now(), escape(ctx), bytes));
    }
    if(mVerbosity >= VERBOSE) {
        allocator.print_stats();
    }
}

void RunLogger::log_step(int step, int duration_ms, float loss, float lr)
{
    if(mRank != 0) return;
    mTotalLoss += loss;
    ++mTotalSteps;

    if(mVerbosity >= DEFAULT) {
        // Loss trend indicator
        char trend = ' ';
        if (mPreviousLoss > 0) {
            if (loss < mPreviousLoss) {
                trend = '\\';
            } else if (loss > mPreviousLoss) {
                trend = '/';
            }
        }
        mPreviousLoss = loss;

        printf(":: step %7d %c loss %10.6f | mean %10.6f | lr %8.2e | %5d ms\n",
               step, trend, loss, mTotalLoss / mTotalSteps, lr, duration_ms);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "duration_ms": {}, "loss": {}, "lr": {}}})",
        std::chrono::system_clock::now(), step, duration_ms, loss, lr));
}

void RunLogger::log_inversion_fallback(int step, std::string_view factor, std::string_view outcome, std::string_view reason) {
    if(mVerbosity > SILENT) {
        fprintf(stderr, "WARNING: [rank %d] step %d: root inverse of %s failed (%s), %s\n",
                mRank, step, std::string(factor).c_str(), std::string(reason).c_str(), std::string(outcome).c_str());
        fflush(stderr);
    }
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "step": {}, "factor": "{}", "outcome": "{}", "reason": "{}"}})",
                         std::chrono::system_clock::now(), step, escape(factor), outcome, escape(reason)));
}

void RunLogger::log_residuals(int step, std::string_view quantity, const sQuantileSummary& summary) {
    if(mRank != 0) return;
    const auto& q = summary.Quantiles;
    log_line(fmt::format(R"(  {{"log": "residual", "time": "{}", "step": {}, "quantity": "{}", "count": {}, "mean": {}, "quantiles": [{}, {}, {}, {}, {}]}})",
                         std::chrono::system_clock::now(), step, quantity, summary.Count, summary.Mean, q[0], q[1], q[2], q[3], q[4]));
    if(mVerbosity >= DEFAULT) {
        printf("  %s (step %d): mean %.3e | q0 %.3e q25 %.3e q50 %.3e q75 %.3e q100 %.3e\n",
               std::string(quantity).c_str(), step, summary.Mean, q[0], q[1], q[2], q[3], q[4]);
    }
}

void RunLogger::log_warning(int step, const std::string& msg) {
    if(mVerbosity > SILENT) {
        fprintf(stderr, "WARNING: %s\n", msg.c_str());
        fflush(stderr);
    }
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "step": {}, "message": "{}"}})",
                         std::chrono::system_clock::now(), step, escape(msg)));
}

void RunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open()) return;
    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

void RunLogger::log_message(int step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= DEFAULT) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": "{}"}})",
                         std::chrono::system_clock::now(), step, escape(msg)));
}

RunLogger::RAII_Section RunLogger::log_section_start(int step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= DEFAULT) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void RunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": "{}", "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, escape(mSectionInfo), milliseconds ));

    if(mVerbosity >= DEFAULT) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}
