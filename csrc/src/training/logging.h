// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_TRAINING_LOGGING_H
#define DISTSHAMPOO_SRC_TRAINING_LOGGING_H

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

class TensorAllocator;

//! One row of the communication-buffer plan, as shown in the log.
struct sBufferPlanEntry {
    std::string Name;
    std::size_t Bytes;
    std::size_t Offset;
    int Owner;
};

//! Mean and nearest-rank quantiles (0, 25, 50, 75, 100) of a diagnostic quantity.
struct sQuantileSummary {
    double Mean = 0.0;
    std::array<double, 5> Quantiles{};
    std::size_t Count = 0;
};

sQuantileSummary summarize_quantiles(std::vector<double> values);

/**
 * @brief Run log shared by the optimizer and the benchmark driver.
 *
 * Rank 0 keeps a JSON array on disk (one object per line) and prints human-readable
 * summaries to stdout depending on the verbosity. Warnings are printed by every rank.
 */
class RunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    //! An empty `file_name` disables the JSON log file.
    RunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~RunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_buffer_plan(int group, int group_size, std::size_t shared_size, const std::vector<sBufferPlanEntry>& entries);
    void log_parameter_count(long count);
    void log_allocator(const TensorAllocator& allocator);
    void log_step(int step, int duration_ms, float loss, float lr);

    //! An inversion fell back to a lower rung; printed on every rank.
    void log_inversion_fallback(int step, std::string_view factor, std::string_view outcome, std::string_view reason);
    void log_residuals(int step, std::string_view quantity, const sQuantileSummary& summary);
    void log_warning(int step, const std::string& msg);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(RunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        RunLogger* mLogger;

        friend class RunLogger;
    };

    void log_message(int step, const std::string& msg);
    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }
private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // running mean for training loss
    double mTotalLoss = 0.0;
    int mTotalSteps = 0;
    float mPreviousLoss = -1.f;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we save intermediaries
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //DISTSHAMPOO_SRC_TRAINING_LOGGING_H
