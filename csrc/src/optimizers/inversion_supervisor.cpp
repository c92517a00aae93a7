// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/inversion_supervisor.h"

#include <cstdio>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "training/logging.h"

namespace shampoo {

const char* to_str(EInversionRung rung) {
    switch (rung) {
        case EInversionRung::ATTEMPT_CONFIGURED_PRECISION: return "attempt_configured_precision";
        case EInversionRung::ATTEMPT_HIGHER_PRECISION: return "attempt_higher_precision";
        case EInversionRung::REUSE_STALE_FACTOR: return "reuse_stale_factor";
    }
    return "unknown";
}

const char* to_str(EInversionOutcome outcome) {
    switch (outcome) {
        case EInversionOutcome::CONFIGURED_PRECISION: return "configured precision";
        case EInversionOutcome::HIGHER_PRECISION: return "recovered in fp64";
        case EInversionOutcome::STALE_FACTOR: return "keeping previous factor";
    }
    return "unknown";
}

InversionSupervisor::InversionSupervisor(ETensorDType precision, bool use_protected_eigh, int max_stale_inversions,
                                         RunLogger* logger, RootSolver solver) :
    mPrecision(precision), mProtected(use_protected_eigh), mMaxStale(max_stale_inversions), mLogger(logger),
    mSolver(solver ? std::move(solver) : RootSolver(matrix_inverse_root))
{
    if (!is_floating(precision)) {
        throw std::invalid_argument(fmt::format("Invalid inversion precision {}", dtype_to_str(precision)));
    }
}

EInversionRung InversionSupervisor::next_rung(EInversionRung current) const {
    switch (current) {
        case EInversionRung::ATTEMPT_CONFIGURED_PRECISION:
            return mPrecision == ETensorDType::FP64 ? EInversionRung::REUSE_STALE_FACTOR
                                                    : EInversionRung::ATTEMPT_HIGHER_PRECISION;
        case EInversionRung::ATTEMPT_HIGHER_PRECISION:
        case EInversionRung::REUSE_STALE_FACTOR:
            return EInversionRung::REUSE_STALE_FACTOR;
    }
    throw std::logic_error("Unknown inversion rung");
}

InversionResult InversionSupervisor::invert(const Eigen::MatrixXd& statistic, const RootInverseRequest& request,
                                            Eigen::MatrixXd& inverse, int& stale_count, std::string_view name, int step) const {
    InversionResult result{EInversionOutcome::STALE_FACTOR, {}};
    EInversionRung rung = EInversionRung::ATTEMPT_CONFIGURED_PRECISION;

    auto report = [&](EInversionOutcome outcome) {
        const std::string reason = fmt::format("{}", fmt::join(result.Failures, "; "));
        if (mLogger) {
            mLogger->log_inversion_fallback(step, name, to_str(outcome), reason);
        } else {
            fprintf(stderr, "WARNING: step %d: root inverse of %s failed (%s), %s\n",
                    step, std::string(name).c_str(), reason.c_str(), to_str(outcome));
            fflush(stderr);
        }
    };

    while (true) {
        switch (rung) {
            case EInversionRung::ATTEMPT_CONFIGURED_PRECISION:
            case EInversionRung::ATTEMPT_HIGHER_PRECISION: {
                const bool retry = rung == EInversionRung::ATTEMPT_HIGHER_PRECISION;
                const ETensorDType precision = retry ? ETensorDType::FP64 : mPrecision;
                Eigen::MatrixXd candidate;
                std::string reason;
                if (mSolver(statistic, request, precision, candidate, reason)) {
                    inverse = std::move(candidate);
                    stale_count = 0;
                    result.Outcome = retry ? EInversionOutcome::HIGHER_PRECISION : EInversionOutcome::CONFIGURED_PRECISION;
                    if (retry) {
                        report(result.Outcome);
                    }
                    return result;
                }
                result.Failures.push_back(fmt::format("{}: {}", dtype_to_str(precision), reason));
                if (!mProtected) {
                    throw std::runtime_error(fmt::format("Root inverse of {} failed at step {}: {}", name, step, reason));
                }
                rung = next_rung(rung);
                break;
            }
            case EInversionRung::REUSE_STALE_FACTOR: {
                ++stale_count;
                if (mMaxStale > 0 && stale_count > mMaxStale) {
                    throw std::runtime_error(fmt::format(
                        "Root inverse of {} failed {} consecutive times (limit {}) at step {}: {}",
                        name, stale_count, mMaxStale, step, fmt::join(result.Failures, "; ")));
                }
                result.Outcome = EInversionOutcome::STALE_FACTOR;
                report(result.Outcome);
                return result;
            }
        }
    }
}

} // namespace shampoo
