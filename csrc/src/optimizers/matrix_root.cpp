// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/matrix_root.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <Eigen/Eigenvalues>
#include <fmt/core.h>

namespace shampoo {

namespace {

template<typename Scalar>
bool inverse_root_impl(const Eigen::MatrixXd& A, const RootInverseRequest& request, Eigen::MatrixXd& X, std::string& reason) {
    using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
    using Vector = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

    const Matrix a = A.template cast<Scalar>();
    Eigen::SelfAdjointEigenSolver<Matrix> solver(a);
    if (solver.info() != Eigen::Success) {
        reason = fmt::format("eigendecomposition did not converge in {}", sizeof(Scalar) == 4 ? "fp32" : "fp64");
        return false;
    }

    Vector L = solver.eigenvalues();
    const Matrix& Q = solver.eigenvectors();
    if (!L.allFinite() || !Q.allFinite()) {
        reason = "non-finite eigendecomposition";
        return false;
    }

    // guard against slightly negative eigenvalues from round-off
    const Scalar lambda_min = L.size() > 0 ? L.minCoeff() : Scalar(0);
    L.array() -= std::min(lambda_min, Scalar(0));
    L.array() += static_cast<Scalar>(request.Epsilon);
    const Vector powered = L.array().pow(static_cast<Scalar>(request.alpha())).matrix();

    const Matrix result = Q * powered.asDiagonal() * Q.transpose();
    if (!result.allFinite()) {
        reason = "non-finite root inverse";
        return false;
    }
    X = result.template cast<double>();
    return true;
}

} // namespace

bool matrix_inverse_root(const Eigen::MatrixXd& A, const RootInverseRequest& request, ETensorDType precision,
                         Eigen::MatrixXd& X, std::string& reason) {
    if (A.rows() != A.cols()) {
        throw std::logic_error(fmt::format("matrix_inverse_root: expected square matrix, got {}x{}", A.rows(), A.cols()));
    }
    if (!A.allFinite()) {
        reason = "non-finite statistic";
        return false;
    }
    switch (precision) {
        case ETensorDType::FP32: return inverse_root_impl<float>(A, request, X, reason);
        case ETensorDType::FP64: return inverse_root_impl<double>(A, request, X, reason);
        default:
            throw std::logic_error(fmt::format("matrix_inverse_root: unsupported precision {}", dtype_to_str(precision)));
    }
}

Eigen::MatrixXd symmetric_matrix_power(const Eigen::MatrixXd& X, double exponent) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(X);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("symmetric_matrix_power: eigendecomposition did not converge");
    }
    const Eigen::VectorXd powered = solver.eigenvalues().array().pow(exponent).matrix();
    return solver.eigenvectors() * powered.asDiagonal() * solver.eigenvectors().transpose();
}

double infinity_norm(const Eigen::MatrixXd& A) {
    return A.size() == 0 ? 0.0 : A.cwiseAbs().maxCoeff();
}

double relative_error(const Eigen::MatrixXd& reference, const Eigen::MatrixXd& approx) {
    return infinity_norm(reference - approx) / infinity_norm(reference);
}

double relative_residual(const Eigen::MatrixXd& X, const Eigen::MatrixXd& A, const RootInverseRequest& request) {
    const Eigen::MatrixXd regularized = A + request.Epsilon * Eigen::MatrixXd::Identity(A.rows(), A.cols());
    const Eigen::MatrixXd reconstructed = symmetric_matrix_power(X, -request.Root / request.ExponentMultiplier);
    return infinity_norm(reconstructed - regularized) / infinity_norm(regularized);
}

} // namespace shampoo
