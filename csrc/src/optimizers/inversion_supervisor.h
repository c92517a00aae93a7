// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_INVERSION_SUPERVISOR_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_INVERSION_SUPERVISOR_H

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Core>

#include "optimizers/matrix_root.h"

class RunLogger;

namespace shampoo {

enum class EInversionRung : int {
    ATTEMPT_CONFIGURED_PRECISION,
    ATTEMPT_HIGHER_PRECISION,
    REUSE_STALE_FACTOR
};

enum class EInversionOutcome : int {
    CONFIGURED_PRECISION,   // fresh factor from the first attempt
    HIGHER_PRECISION,       // fresh factor from the fp64 retry
    STALE_FACTOR            // previous factor kept
};

const char* to_str(EInversionRung rung);
const char* to_str(EInversionOutcome outcome);

//! Signature of one root-inverse attempt; see matrix_inverse_root.
using RootSolver = std::function<bool(const Eigen::MatrixXd& A, const RootInverseRequest& request, ETensorDType precision,
                                      Eigen::MatrixXd& X, std::string& reason)>;

struct InversionResult {
    EInversionOutcome Outcome;
    std::vector<std::string> Failures;  // one reason per failed attempt
};

/**
 * @brief Runs the root-inverse fallback ladder for one Kronecker factor.
 *
 * ATTEMPT_CONFIGURED_PRECISION -> ATTEMPT_HIGHER_PRECISION -> REUSE_STALE_FACTOR.
 * The fp64 retry is skipped when the configured precision already is fp64. Reusing the
 * stale factor is never fatal unless `max_stale_inversions` > 0 and the factor has been
 * reused more than that many consecutive times. With protection disabled, the first
 * failure raises.
 */
class InversionSupervisor {
public:
    InversionSupervisor(ETensorDType precision, bool use_protected_eigh, int max_stale_inversions,
                        RunLogger* logger = nullptr, RootSolver solver = {});

    /**
     * @brief Invert `statistic`, writing the new factor to `inverse` on success.
     *
     * @param[in,out] inverse Only written if a rung succeeds; otherwise keeps the stale factor.
     * @param[in,out] stale_count Consecutive stale reuses of this factor, reset on success.
     * @throws std::runtime_error If protection is disabled and the attempt fails, or the
     *         staleness limit is exceeded.
     */
    InversionResult invert(const Eigen::MatrixXd& statistic, const RootInverseRequest& request,
                           Eigen::MatrixXd& inverse, int& stale_count, std::string_view name, int step) const;

    //! Rung that follows a failed `current` rung.
    [[nodiscard]] EInversionRung next_rung(EInversionRung current) const;

    [[nodiscard]] ETensorDType precision() const { return mPrecision; }

private:
    ETensorDType mPrecision;
    bool mProtected;
    int mMaxStale;
    RunLogger* mLogger;
    RootSolver mSolver;
};

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_INVERSION_SUPERVISOR_H
