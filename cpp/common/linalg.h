// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Linear algebra operations: robust matrix inversion and chi-square
// statistics of possibly singular covariance matrices.

#pragma once

#include <Eigen/Dense>

namespace oem {

// Chi-square statistic of a residual and the number of degrees of
// freedom it was computed with.
struct ChiSquare
{
    double chi2 {};
    int dofs {};
};

// Outcome of a chi-square hypothesis test
struct ChiSquareResult
{
    bool passed {};
    double chi2 {};
    double chi2_critical {};
};

// Invert a square matrix. If A contains NaN the result is all NaN and
// a warning is logged. If the condition number of A exceeds the
// reciprocal of the machine epsilon the matrix is considered
// singular. Then, if strict is true, NumericalDegeneracy is thrown,
// otherwise a warning is logged and the result is all NaN.
[[nodiscard]] auto invert(const Eigen::MatrixXd& A,
                          const bool strict = true) -> Eigen::MatrixXd;

// Numerical rank from the singular values. Singular values below
// s_max * max(rows, cols) * eps count as zero.
[[nodiscard]] auto matrixRank(const Eigen::MatrixXd& A) -> int;

// Generalized chi-square statistic
//
//   chi2 = sum_k (v_k^T z)^2 / lambda_k
//
// where lambda_k and v_k are the eigenvalues and eigenvectors of the
// covariance S. Only eigenvalues with |lambda_k| > atol are included
// and their number is returned as the degrees of freedom. This way
// the statistic is well defined for singular covariances.
[[nodiscard]] auto generalizedChiSquare(const Eigen::MatrixXd& S,
                                        const Eigen::VectorXd& z,
                                        const double atol) -> ChiSquare;

// Chi-square value that is exceeded with probability significance
// (inverse survival function). Returns NaN if dofs is 0.
[[nodiscard]] auto chiSquareCritical(const double significance,
                                     const int dofs) -> double;

// Test whether the residual z is consistent with the covariance S at
// the given significance level.
[[nodiscard]] auto testChiSquare(const Eigen::MatrixXd& S,
                                 const Eigen::VectorXd& z,
                                 const double significance,
                                 const double atol) -> ChiSquareResult;

} // namespace oem
