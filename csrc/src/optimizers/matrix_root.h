// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_MATRIX_ROOT_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_MATRIX_ROOT_H

#include <string>

#include <Eigen/Core>

#include "utilities/dtype.h"

namespace shampoo {

//! Computes (A + Epsilon * I)^(-ExponentMultiplier / Root).
struct RootInverseRequest {
    double Root = 2.0;
    double ExponentMultiplier = 1.0;
    double Epsilon = 1e-12;

    [[nodiscard]] double alpha() const { return -ExponentMultiplier / Root; }
};

/**
 * @brief Eigendecomposition-based inverse root of a symmetric positive semi-definite matrix.
 *
 * The decomposition runs in `precision` (FP32 or FP64). Eigenvalues are shifted to be
 * non-negative (L -= min(min(L), 0)), epsilon is added, and the result is reassembled as
 * Q * diag(L^alpha) * Q^T.
 *
 * @param[out] X The root inverse, only written on success.
 * @param[out] reason Why the attempt failed: non-finite input, no convergence, or a
 *             non-finite result.
 * @return true on success.
 */
bool matrix_inverse_root(const Eigen::MatrixXd& A, const RootInverseRequest& request, ETensorDType precision,
                         Eigen::MatrixXd& X, std::string& reason);

//! X^exponent for symmetric positive definite X, via eigendecomposition in double precision.
Eigen::MatrixXd symmetric_matrix_power(const Eigen::MatrixXd& X, double exponent);

//! max|a_ij|
double infinity_norm(const Eigen::MatrixXd& A);

//! ||reference - approx||_inf / ||reference||_inf
double relative_error(const Eigen::MatrixXd& reference, const Eigen::MatrixXd& approx);

/**
 * @brief How well `X` inverts the root: ||X^(-Root/ExponentMultiplier) - (A + eps I)||_inf / ||A + eps I||_inf.
 */
double relative_residual(const Eigen::MatrixXd& X, const Eigen::MatrixXd& A, const RootInverseRequest& request);

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_MATRIX_ROOT_H
