// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "linalg.h"

#include "constants.h"
#include "errors.h"

#include <algorithm>
#include <boost/math/distributions/chi_squared.hpp>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace oem {

static auto nanMatrix(const Eigen::Index rows,
                      const Eigen::Index cols) -> Eigen::MatrixXd
{
    return Eigen::MatrixXd::Constant(rows, cols, fill::nan);
}

auto invert(const Eigen::MatrixXd& A, const bool strict) -> Eigen::MatrixXd
{
    if (A.rows() != A.cols()) {
        throw std::invalid_argument { "cannot invert a non-square matrix of "
                                      "shape ("
                                      + std::to_string(A.rows()) + ", "
                                      + std::to_string(A.cols()) + ')' };
    }
    if (A.size() == 0) {
        return A;
    }
    if (A.hasNaN()) {
        spdlog::warn("Found NaN in matrix, returning NaN");
        return nanMatrix(A.rows(), A.cols());
    }
    // 2-norm condition number
    const Eigen::JacobiSVD<Eigen::MatrixXd> svd { A };
    const Eigen::VectorXd& sigma { svd.singularValues() };
    const double cond { sigma(0) / sigma(sigma.size() - 1) };
    if (!(cond <= 1.0 / std::numeric_limits<double>::epsilon())) {
        if (strict) {
            throw NumericalDegeneracy { "matrix is singular (condition "
                                        "number "
                                        + std::to_string(cond) + ')' };
        }
        spdlog::warn("Singular matrix (condition number {:.3g}), returning "
                     "NaN",
                     cond);
        return nanMatrix(A.rows(), A.cols());
    }
    return A.inverse();
}

auto matrixRank(const Eigen::MatrixXd& A) -> int
{
    if (A.size() == 0) {
        return 0;
    }
    const Eigen::JacobiSVD<Eigen::MatrixXd> svd { A };
    const Eigen::VectorXd& sigma { svd.singularValues() };
    const double tol { sigma.maxCoeff()
                       * static_cast<double>(std::max(A.rows(), A.cols()))
                       * std::numeric_limits<double>::epsilon() };
    return static_cast<int>((sigma.array() > tol).count());
}

auto generalizedChiSquare(const Eigen::MatrixXd& S,
                          const Eigen::VectorXd& z,
                          const double atol) -> ChiSquare
{
    // Covariances are symmetric up to round-off
    const Eigen::MatrixXd S_sym = 0.5 * (S + S.transpose());
    const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen { S_sym };
    if (eigen.info() != Eigen::Success) {
        throw NumericalDegeneracy {
            "eigendecomposition of covariance matrix failed"
        };
    }
    const Eigen::VectorXd z_proj = eigen.eigenvectors().transpose() * z;
    const Eigen::VectorXd& lambda { eigen.eigenvalues() };
    ChiSquare result {};
    for (int i {}; i < lambda.size(); ++i) {
        if (std::abs(lambda(i)) > atol) {
            result.chi2 += z_proj(i) * z_proj(i) / lambda(i);
            ++result.dofs;
        }
    }
    if (result.dofs < lambda.size()) {
        spdlog::info("Covariance matrix is singular: using {} of {} "
                     "degrees of freedom",
                     result.dofs,
                     lambda.size());
    }
    return result;
}

auto chiSquareCritical(const double significance, const int dofs) -> double
{
    if (!(significance > 0.0 && significance < 1.0)) {
        throw std::invalid_argument {
            "significance must be between 0 and 1, got "
            + std::to_string(significance)
        };
    }
    if (dofs <= 0) {
        spdlog::warn("Chi-square test with 0 degrees of freedom");
        return fill::nan;
    }
    const boost::math::chi_squared distribution { static_cast<double>(dofs) };
    return boost::math::quantile(
      boost::math::complement(distribution, significance));
}

auto testChiSquare(const Eigen::MatrixXd& S,
                   const Eigen::VectorXd& z,
                   const double significance,
                   const double atol) -> ChiSquareResult
{
    const auto [chi2, dofs] { generalizedChiSquare(S, z, atol) };
    const double chi2_critical { chiSquareCritical(significance, dofs) };
    return { chi2 < chi2_critical, chi2, chi2_critical };
}

} // namespace oem
