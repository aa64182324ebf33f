// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "diagnostics.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <spdlog/spdlog.h>
#include <utility>

namespace oem {

auto chi2TestToString(const Chi2Test test) -> std::string
{
    switch (test) {
    case Chi2Test::y_optimal_vs_observation:
        return "Y_Optimal_vs_Observation";
    case Chi2Test::y_observation_vs_prior:
        return "Y_Observation_vs_Prior";
    case Chi2Test::y_optimal_vs_prior:
        return "Y_Optimal_vs_Prior";
    case Chi2Test::x_optimal_vs_prior:
        return "X_Optimal_vs_Prior";
    case Chi2Test::n_tests:
        break;
    }
    return "unknown";
}

// Return true if the retrieval converged. Otherwise print a notice.
static auto checkConverged(const OptimalEstimation& oe,
                           const std::string& test) -> bool
{
    if (!oe.converged()) {
        spdlog::warn("Retrieval did not converge, {} is undefined", test);
        return false;
    }
    return true;
}

static auto undefinedChiSquare() -> ChiSquareResult
{
    return { false, fill::nan, fill::nan };
}

// Jacobian of the accepted solution
static auto convergedJacobian(const OptimalEstimation& oe)
  -> const Eigen::MatrixXd&
{
    return oe.iterations().at(oe.result().conv_i).K_x.values();
}

// Covariance of the measurement predicted from the prior, K S_a K^T
static auto priorMeasurementCovariance(const OptimalEstimation& oe)
  -> Eigen::MatrixXd
{
    const Eigen::MatrixXd& K { convergedJacobian(oe) };
    return K * oe.getPriorCovariance().values() * K.transpose();
}

// Normalized linearization error dy^T S_y^-1 dy for a state x near
// x_op where dy = F(x) - y_op - K (x - x_op). Also returns dy.
static auto linearizationError(const OptimalEstimation& oe,
                               const NamedVector& x,
                               const Eigen::MatrixXd& S_y_inv)
  -> std::pair<double, Eigen::VectorXd>
{
    const RetrievalResult& result { oe.result() };
    const Eigen::VectorXd del_y =
      oe.forwardModel(x).values() - result.y_op.values()
      - convergedJacobian(oe) * (x.values() - result.x_op.values());
    return { del_y.dot(S_y_inv * del_y), del_y };
}

auto linearityTest(const OptimalEstimation& oe,
                   const int max_error_patterns,
                   const double significance,
                   const double atol) -> LinearityResult
{
    if (max_error_patterns < 0) {
        throw std::invalid_argument {
            "maximum number of error patterns must not be negative"
        };
    }
    const int x_n { oe.getPriorState().size() };
    const int n_kept { max_error_patterns == 0
                         ? x_n
                         : std::min(x_n, max_error_patterns) };
    LinearityResult linearity {};
    linearity.linearity.assign(n_kept, fill::nan);
    if (!checkConverged(oe, "the linearity test")) {
        return linearity;
    }
    const RetrievalResult& result { oe.result() };
    const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen {
        result.S_op.values()
    };
    Eigen::ArrayXd lambda = eigen.eigenvalues().array();
    lambda = (lambda.abs() <= atol).select(0.0, lambda);
    if ((lambda < 0.0).any()) {
        spdlog::warn("Found negative eigenvalues of the posterior "
                     "covariance, it is not positive semi-definite");
        return linearity;
    }
    const Eigen::MatrixXd S_y_inv =
      invert(oe.getObservationCovariance().values(), oe.getStrictInversion());

    std::vector<double> values(x_n);
    for (int h {}; h < x_n; ++h) {
        const NamedVector error_pattern {
            result.x_op.axis(),
            std::sqrt(lambda(h)) * eigen.eigenvectors().col(h)
        };
        const NamedVector x_hat { result.x_op + error_pattern };
        values[h] = linearizationError(oe, x_hat, S_y_inv).first;
    }
    std::ranges::sort(values, std::greater {});
    values.resize(n_kept);
    linearity.linearity = values;

    if (const auto& x_truth { oe.getTruth() }; x_truth) {
        const auto [true_linearity, del_y] { linearizationError(
          oe, *x_truth, S_y_inv) };
        const ChiSquareResult chi2 { testChiSquare(
          oe.getObservationCovariance().values(), del_y, significance, atol) };
        linearity.true_linearity = true_linearity;
        linearity.true_linearity_chi2 = chi2.chi2;
        linearity.true_linearity_chi2_critical = chi2.chi2_critical;
    }
    return linearity;
}

auto chiSquareTestYOptimalObservation(const OptimalEstimation& oe,
                                      const double significance,
                                      const double atol) -> ChiSquareResult
{
    if (!checkConverged(
          oe, chi2TestToString(Chi2Test::y_optimal_vs_observation))) {
        return undefinedChiSquare();
    }
    const RetrievalResult& result { oe.result() };
    const Eigen::MatrixXd& S_Ep { result.S_Ep.values() };
    const Eigen::MatrixXd KSaKSep_inv = invert(
      priorMeasurementCovariance(oe) + S_Ep, oe.getStrictInversion());
    const Eigen::MatrixXd S_deyd = S_Ep * KSaKSep_inv * S_Ep;
    const Eigen::VectorXd delta_y =
      result.y_op.values() - oe.getObservation().values();
    return testChiSquare(S_deyd, delta_y, significance, atol);
}

auto chiSquareTestYObservationPrior(const OptimalEstimation& oe,
                                    const double significance,
                                    const double atol) -> ChiSquareResult
{
    if (!checkConverged(
          oe, chi2TestToString(Chi2Test::y_observation_vs_prior))) {
        return undefinedChiSquare();
    }
    const Eigen::MatrixXd KSaKSep =
      priorMeasurementCovariance(oe) + oe.result().S_Ep.values();
    const Eigen::VectorXd delta_y =
      oe.getObservation().values() - oe.yPrior().values();
    return testChiSquare(KSaKSep, delta_y, significance, atol);
}

auto chiSquareTestYOptimalPrior(const OptimalEstimation& oe,
                                const double significance,
                                const double atol) -> ChiSquareResult
{
    if (!checkConverged(oe, chi2TestToString(Chi2Test::y_optimal_vs_prior))) {
        return undefinedChiSquare();
    }
    const RetrievalResult& result { oe.result() };
    const Eigen::MatrixXd KSaK = priorMeasurementCovariance(oe);
    const Eigen::MatrixXd KSaKSep_inv =
      invert(KSaK + result.S_Ep.values(), oe.getStrictInversion());
    const Eigen::MatrixXd S_yd = KSaK * KSaKSep_inv * KSaK;
    const Eigen::VectorXd delta_y =
      result.y_op.values() - oe.yPrior().values();
    return testChiSquare(S_yd, delta_y, significance, atol);
}

auto chiSquareTestXOptimalPrior(const OptimalEstimation& oe,
                                const double significance,
                                const double atol) -> ChiSquareResult
{
    if (!checkConverged(oe, chi2TestToString(Chi2Test::x_optimal_vs_prior))) {
        return undefinedChiSquare();
    }
    const RetrievalResult& result { oe.result() };
    const Eigen::MatrixXd& S_a { oe.getPriorCovariance().values() };
    const Eigen::MatrixXd& K { convergedJacobian(oe) };
    const Eigen::MatrixXd KSaKSep_inv =
      invert(priorMeasurementCovariance(oe) + result.S_Ep.values(),
             oe.getStrictInversion());
    const Eigen::MatrixXd S_xd =
      S_a * K.transpose() * KSaKSep_inv * K * S_a;
    const Eigen::VectorXd delta_x =
      result.x_op.values() - oe.getPriorState().values();
    return testChiSquare(S_xd, delta_x, significance, atol);
}

auto chiSquareTest(const OptimalEstimation& oe,
                   const double significance,
                   const double atol) -> Chi2Results
{
    Chi2Results results {};
    results[static_cast<int>(Chi2Test::y_optimal_vs_observation)] =
      chiSquareTestYOptimalObservation(oe, significance, atol);
    results[static_cast<int>(Chi2Test::y_observation_vs_prior)] =
      chiSquareTestYObservationPrior(oe, significance, atol);
    results[static_cast<int>(Chi2Test::y_optimal_vs_prior)] =
      chiSquareTestYOptimalPrior(oe, significance, atol);
    results[static_cast<int>(Chi2Test::x_optimal_vs_prior)] =
      chiSquareTestXOptimalPrior(oe, significance, atol);
    if (oe.converged()) {
        for (int i {}; i < static_cast<int>(Chi2Test::n_tests); ++i) {
            spdlog::info("{:<25} chi2 = {:.3g}, critical value = {:.3g} ({})",
                         chi2TestToString(static_cast<Chi2Test>(i)),
                         results[i].chi2,
                         results[i].chi2_critical,
                         results[i].passed ? "passed" : "failed");
        }
    }
    return results;
}

auto linearityTest(const OptimalEstimation& oe,
                   const SettingsRetrieval& settings) -> LinearityResult
{
    return linearityTest(oe,
                         settings.diagnostics.max_error_patterns,
                         settings.diagnostics.significance,
                         settings.diagnostics.atol);
}

auto chiSquareTest(const OptimalEstimation& oe,
                   const SettingsRetrieval& settings) -> Chi2Results
{
    return chiSquareTest(
      oe, settings.diagnostics.significance, settings.diagnostics.atol);
}

} // namespace oem
