// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Statistical tests of a converged retrieval following chapters 5.1
// and 12 of Rodgers 2000. All tests require a converged retrieval. If
// it did not converge a warning is printed and the results are NaN
// (and passed = false).

#pragma once

#include "optimal_estimation.h"

#include <common/linalg.h>

#include <array>

namespace oem {

struct LinearityResult
{
    // Linearization error of each error pattern relative to the
    // measurement noise, sorted in descending order. Values below 1
    // mean the problem is moderately linear.
    std::vector<double> linearity {};
    // Same for the difference between the true and retrieved state
    double true_linearity { fill::nan };
    double true_linearity_chi2 { fill::nan };
    double true_linearity_chi2_critical { fill::nan };
};

enum class Chi2Test
{
    // Retrieved y vs measurement
    y_optimal_vs_observation,
    // Measurement vs y of the prior
    y_observation_vs_prior,
    // Retrieved y vs y of the prior
    y_optimal_vs_prior,
    // Retrieved x vs prior
    x_optimal_vs_prior,
    n_tests,
};

using Chi2Results =
  std::array<ChiSquareResult, static_cast<size_t>(Chi2Test::n_tests)>;

[[nodiscard]] auto chi2TestToString(const Chi2Test test) -> std::string;

// Perturb the solution along each error pattern, the eigenvectors of
// S_op scaled by the square root of the eigenvalue, and compare the
// forward model response with its linear approximation:
//
//   dy = F(x_op + e) - y_op - K e,  linearity = dy^T S_y^-1 dy
//
// At most max_error_patterns values are returned (0 for all). If the
// true state is known the same is done for x_truth - x_op, including a
// chi2 test of dy with the covariance S_y.
[[nodiscard]] auto linearityTest(const OptimalEstimation& oe,
                                 const int max_error_patterns = 10,
                                 const double significance = 0.05,
                                 const double atol = 1e-5) -> LinearityResult;

// Whether the retrieved y agrees with the measurement (Rodgers eq. 12.9)
[[nodiscard]] auto chiSquareTestYOptimalObservation(
  const OptimalEstimation& oe,
  const double significance = 0.05,
  const double atol = 1e-5) -> ChiSquareResult;

// Whether the measurement agrees with the prior in y space
[[nodiscard]] auto chiSquareTestYObservationPrior(
  const OptimalEstimation& oe,
  const double significance = 0.05,
  const double atol = 1e-5) -> ChiSquareResult;

// Whether the retrieved y agrees with the prior in y space (Rodgers
// eq. 12.16)
[[nodiscard]] auto chiSquareTestYOptimalPrior(const OptimalEstimation& oe,
                                              const double significance = 0.05,
                                              const double atol = 1e-5)
  -> ChiSquareResult;

// Whether the retrieved x agrees with the prior (Rodgers eq. 12.12)
[[nodiscard]] auto chiSquareTestXOptimalPrior(const OptimalEstimation& oe,
                                              const double significance = 0.05,
                                              const double atol = 1e-5)
  -> ChiSquareResult;

// All four tests, indexed by Chi2Test
[[nodiscard]] auto chiSquareTest(const OptimalEstimation& oe,
                                 const double significance = 0.05,
                                 const double atol = 1e-5) -> Chi2Results;

// Same with the parameters from the diagnostics section of the
// configuration
[[nodiscard]] auto linearityTest(const OptimalEstimation& oe,
                                 const SettingsRetrieval& settings)
  -> LinearityResult;
[[nodiscard]] auto chiSquareTest(const OptimalEstimation& oe,
                                 const SettingsRetrieval& settings)
  -> Chi2Results;

} // namespace oem
