// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "optimal_estimation.h"

#include <common/errors.h>
#include <common/io.h>
#include <common/linalg.h>
#include <common/timer.h>

#include <cmath>
#include <spdlog/spdlog.h>

namespace oem {

auto statusToString(const RetrievalStatus status) -> std::string
{
    switch (status) {
    case RetrievalStatus::initialized:
        return "initialized";
    case RetrievalStatus::iterating:
        return "iterating";
    case RetrievalStatus::converged:
        return "converged";
    case RetrievalStatus::max_iterations_reached:
        return "maximum number of iterations reached";
    case RetrievalStatus::time_exceeded:
        return "maximum time exceeded";
    case RetrievalStatus::degenerate_stop:
        return "zero degrees of freedom";
    }
    return "unknown";
}

// Check that a covariance matrix belongs to a vector and that both
// are usable.
static auto checkCovariance(const NamedVector& v,
                            const NamedMatrix& S,
                            const std::string& v_name,
                            const std::string& S_name) -> void
{
    if (!S.isSquare() || !(S.rows() == v.axis())) {
        throw ConfigurationError { "axes of " + S_name
                                   + " do not match the names of " + v_name
                                   + " (" + v.axis().str() + ')' };
    }
    if (v.hasNaN()) {
        throw ConfigurationError { "NaN found in " + v_name };
    }
    if (S.hasNaN()) {
        throw ConfigurationError { "NaN found in " + S_name };
    }
    if (matrixRank(S.values()) < v.size()) {
        throw ConfigurationError { S_name + " is singular" };
    }
}

OptimalEstimation::OptimalEstimation(const NamedVector& x_a,
                                     const NamedMatrix& S_a,
                                     const NamedVector& y_obs,
                                     const NamedMatrix& S_y,
                                     ForwardModel forward,
                                     const SettingsRetrieval& settings,
                                     const NamedVector& b_p,
                                     const NamedMatrix& S_b,
                                     const std::optional<NamedVector>& x_truth)
  : x_a { x_a }
  , S_a { S_a }
  , y_obs { y_obs }
  , S_y { S_y }
  , b_p { b_p }
  , S_b { S_b }
  , x_truth { x_truth }
  , forward { std::move(forward) }
  , default_max_iter { settings.retrieval.max_iter }
  , default_max_time { settings.retrieval.max_time }
  , convergence_factor { settings.retrieval.convergence_factor }
  , gamma_factor { settings.retrieval.gamma_factor }
  , strict_inversion { settings.retrieval.strict_inversion }
  , x_lower_limit { settings.bounds.lower }
  , x_upper_limit { settings.bounds.upper }
{
    if (x_a.empty()) {
        throw ConfigurationError { "state vector is empty" };
    }
    if (y_obs.empty()) {
        throw ConfigurationError { "measurement vector is empty" };
    }
    checkCovariance(x_a, S_a, "x_a", "S_a");
    checkCovariance(y_obs, S_y, "y_obs", "S_y");
    checkCovariance(b_p, S_b, "b_p", "S_b");
    // Throws if x and b share a name
    const Axis xb_axis { concat(x_a.axis(), b_p.axis()) };
    if (x_truth) {
        if (!(x_truth->axis() == x_a.axis())) {
            throw ConfigurationError { "names of x_truth do not match those "
                                       "of x_a" };
        }
        if (x_truth->hasNaN()) {
            throw ConfigurationError { "NaN found in x_truth" };
        }
    }
    for (const auto* limits : { &x_lower_limit, &x_upper_limit }) {
        for (const auto& [name, limit] : *limits) {
            if (!x_a.axis().contains(name)) {
                throw ConfigurationError { "limit given for " + name
                                           + ", which is not a state vector "
                                             "element" };
            }
        }
    }
    x_a_err = NamedVector { x_a.axis(),
                            S_a.values().diagonal().cwiseSqrt() };
    b_p_err = NamedVector { b_p.axis(), S_b.values().diagonal().cwiseSqrt() };

    Disturbance disturbance { UniformDisturbance {
      settings.jacobian.disturbance } };
    if (!settings.jacobian.disturbance_per_variable.empty()) {
        disturbance =
          PerVariableDisturbance { settings.jacobian.disturbance_per_variable };
    }
    jacobian = JacobianEstimator { x_a.axis(),
                                   b_p.axis(),
                                   y_obs.axis(),
                                   concat(x_a_err, b_p_err).values(),
                                   disturbance,
                                   settings.jacobian.mode,
                                   this->forward };
}

auto OptimalEstimation::evaluate(const NamedVector& x) const -> NamedVector
{
    return callForwardModel(forward, concat(x, b_p), y_obs.axis());
}

auto OptimalEstimation::effectiveCovariance(const NamedMatrix& K_b) const
  -> NamedMatrix
{
    if (b_p.empty()) {
        return S_y;
    }
    return { S_y.rows(),
             S_y.cols(),
             S_y.values()
               + K_b.values() * S_b.values() * K_b.values().transpose() };
}

auto OptimalEstimation::repairBounds(NamedVector& x,
                                     const int iteration) const -> int
{
    int n_reset {};
    for (int j {}; j < x.size(); ++j) {
        const std::string& name { x.axis().name(j) };
        std::string reason {};
        if (const auto it { x_lower_limit.find(name) };
            it != x_lower_limit.end() && x(j) < it->second) {
            reason = "lower limit";
        } else if (const auto it { x_upper_limit.find(name) };
                   it != x_upper_limit.end() && x(j) > it->second) {
            reason = "upper limit";
        } else if (std::isnan(x(j))) {
            reason = "NaN";
        }
        if (!reason.empty()) {
            spdlog::warn("Reset due to {}: {} from {} to {} in iteration {}",
                         reason,
                         name,
                         x(j),
                         x_a(j),
                         iteration);
            x(j) = x_a(j);
            ++n_reset;
        }
    }
    return n_reset;
}

auto OptimalEstimation::finalize(const std::optional<int> conv_i) -> void
{
    solution = RetrievalResult {};
    if (conv_i) {
        const IterationRecord& record { records.at(*conv_i) };
        solution.converged = true;
        solution.conv_i = *conv_i;
        solution.x_op = record.x;
        solution.y_op = record.y;
        solution.S_op = record.S_aposterior;
        solution.x_op_err =
          NamedVector { x_a.axis(),
                        record.S_aposterior.values().diagonal().cwiseSqrt() };
        solution.dgf = record.dgf;
        solution.dgf_x = record.A.diagonal();
        solution.S_Ep = effectiveCovariance(record.K_b);
        return;
    }
    const Axis& x_axis { x_a.axis() };
    const Axis& y_axis { y_obs.axis() };
    solution.x_op = NamedVector::constant(x_axis, fill::nan);
    solution.y_op = NamedVector::constant(y_axis, fill::nan);
    solution.S_op = NamedMatrix::constant(x_axis, x_axis, fill::nan);
    solution.x_op_err = NamedVector::constant(x_axis, fill::nan);
    solution.dgf_x = NamedVector::constant(x_axis, fill::nan);
    solution.S_Ep = NamedMatrix::constant(y_axis, y_axis, fill::nan);
}

auto OptimalEstimation::run(const int max_iter,
                            const std::optional<NamedVector>& x_0,
                            const double max_time) -> bool
{
    if (max_iter <= 0) {
        throw std::invalid_argument {
            "number of iterations must be positive, got "
            + std::to_string(max_iter)
        };
    }
    if (static_cast<int>(gamma_factor.size()) > max_iter) {
        throw ConfigurationError { "more damping factors ("
                                   + std::to_string(gamma_factor.size())
                                   + ") than iterations ("
                                   + std::to_string(max_iter) + ')' };
    }
    if (x_0) {
        checkAligned(x_0->axis(), x_a.axis(), "first guess");
        if (x_0->hasNaN()) {
            throw ConfigurationError { "NaN found in first guess" };
        }
    }
    records.clear();
    finalize(std::nullopt);
    state = RetrievalStatus::iterating;

    printHeading("Optimal estimation retrieval");
    Timer timer {};
    timer.start();

    const int x_n { x_a.size() };
    const double y_n { static_cast<double>(y_obs.size()) };
    const Eigen::MatrixXd S_a_inv = invert(S_a.values(), strict_inversion);

    NamedVector x_i { x_0.value_or(x_a) };
    NamedVector y_i { evaluate(x_i) };
    // Whether the previous iteration fulfilled the convergence criterion
    bool converging { false };
    std::optional<int> conv_i {};
    for (int i {}; i < max_iter; ++i) {
        IterationRecord record {};
        record.x = x_i;
        record.y = y_i;
        if (i < static_cast<int>(gamma_factor.size())) {
            record.gamma = gamma_factor[i];
        }
        const double gamma { record.gamma };

        const auto [K_x, K_b] { jacobian.compute(concat(x_i, b_p), y_i) };
        record.K_x = K_x;
        record.K_b = K_b;
        const NamedMatrix S_Ep { effectiveCovariance(K_b) };
        const Eigen::MatrixXd S_Ep_inv =
          invert(S_Ep.values(), strict_inversion);

        const Eigen::MatrixXd& K { K_x.values() };
        const Eigen::MatrixXd KtSinv = K.transpose() * S_Ep_inv;
        const Eigen::MatrixXd KtSinvK = KtSinv * K;
        const Eigen::MatrixXd B = gamma * S_a_inv + KtSinvK;
        const Eigen::MatrixXd B_inv = invert(B, strict_inversion);
        record.S_aposterior = NamedMatrix {
            x_a.axis(), B_inv * (gamma * gamma * S_a_inv + KtSinvK) * B_inv
        };
        // Gain matrix
        const Eigen::MatrixXd G = B_inv * KtSinv;
        record.A = NamedMatrix { x_a.axis(), G * K };

        NamedVector x_next {
            x_a.axis(),
            x_a.values()
              + G
                  * (y_obs.values() - y_i.values()
                     + K * (x_i.values() - x_a.values()))
        };
        NamedVector y_next { evaluate(x_next) };

        record.dgf = record.A.values().trace();
        record.H =
          -0.5
          * std::log(
            (Eigen::MatrixXd::Identity(x_n, x_n) - record.A.values())
              .determinant());

        const int n_reset { repairBounds(x_next, i) };
        if (n_reset > 0) {
            y_next = evaluate(x_next);
        }

        const Eigen::VectorXd dx = x_i.values() - x_next.values();
        record.d_i2 =
          dx.dot(invert(record.S_aposterior.values(), strict_inversion) * dx);
        record.x_next = x_next;
        record.y_next = y_next;
        records.push_back(record);

        const double d_i2 { record.d_i2 };
        const double dgf { record.dgf };
        const auto progress { [&](const std::string& text) {
            spdlog::info("{:.2f} s, iteration {}, degrees of freedom: {:.2f} "
                         "of {}. {} d_i^2 = {:.3g}",
                         timer.elapsed(),
                         i,
                         dgf,
                         x_n,
                         text,
                         d_i2);
        } };

        // The solution was accepted in the previous iteration. This
        // iteration only evaluated the Jacobian, posterior covariance
        // and averaging kernel at the accepted state.
        if (converging) {
            progress("Done.");
            state = RetrievalStatus::converged;
            conv_i = i;
            break;
        }
        if (timer.elapsed() > max_time) {
            progress("Maximum time exceeded!");
            state = RetrievalStatus::time_exceeded;
            break;
        }
        if (i == 0) {
            progress("First iteration.");
        } else if (std::abs(d_i2) < y_n / convergence_factor && gamma == 1.0
                   && (d_i2 != 0.0 || (dgf != 0.0 && n_reset == 0))) {
            // A zero step only counts if the measurement carries
            // information and the step was not undone by a reset.
            progress("Convergence criterion fulfilled.");
            converging = true;
        } else if (i > 1 && dgf == 0.0) {
            progress("Zero degrees of freedom!");
            state = RetrievalStatus::degenerate_stop;
            break;
        } else {
            progress("Convergence criterion not fulfilled.");
        }
        x_i = x_next;
        y_i = y_next;
    }
    timer.stop();
    spdlog::info("Retrieval finished after {} iterations in {:.2f} s",
                 records.size(),
                 timer.time());

    if (state == RetrievalStatus::iterating) {
        state = RetrievalStatus::max_iterations_reached;
        if (converging) {
            spdlog::warn("Convergence criterion fulfilled in the last "
                         "iteration but no iterations left to confirm it");
        }
    }
    if (state != RetrievalStatus::converged) {
        spdlog::warn("Retrieval did not converge: {}", statusToString(state));
    }
    finalize(conv_i);
    return solution.converged;
}

auto OptimalEstimation::run() -> bool
{
    return run(default_max_iter, std::nullopt, default_max_time);
}

auto OptimalEstimation::status() const -> RetrievalStatus
{
    return state;
}

auto OptimalEstimation::converged() const -> bool
{
    return solution.converged;
}

auto OptimalEstimation::result() const -> const RetrievalResult&
{
    return solution;
}

auto OptimalEstimation::iterations() const
  -> const std::vector<IterationRecord>&
{
    return records;
}

auto OptimalEstimation::stateIterations() const -> std::vector<NamedVector>
{
    std::vector<NamedVector> states {};
    for (const auto& record : records) {
        states.push_back(record.x);
    }
    if (!records.empty()) {
        states.push_back(records.back().x_next);
    }
    return states;
}

auto OptimalEstimation::measurementIterations() const
  -> std::vector<NamedVector>
{
    std::vector<NamedVector> measurements {};
    for (const auto& record : records) {
        measurements.push_back(record.y);
    }
    if (!records.empty()) {
        measurements.push_back(records.back().y_next);
    }
    return measurements;
}

auto OptimalEstimation::yPrior() const -> const NamedVector&
{
    if (!y_a) {
        y_a = evaluate(x_a);
    }
    return *y_a;
}

auto OptimalEstimation::forwardModel(const NamedVector& x) const -> NamedVector
{
    checkAligned(x.axis(), x_a.axis(), "forward model input");
    return evaluate(x);
}

auto OptimalEstimation::getPriorState() const -> const NamedVector&
{
    return x_a;
}

auto OptimalEstimation::getPriorCovariance() const -> const NamedMatrix&
{
    return S_a;
}

auto OptimalEstimation::getPriorError() const -> const NamedVector&
{
    return x_a_err;
}

auto OptimalEstimation::getObservation() const -> const NamedVector&
{
    return y_obs;
}

auto OptimalEstimation::getObservationCovariance() const -> const NamedMatrix&
{
    return S_y;
}

auto OptimalEstimation::getParameters() const -> const NamedVector&
{
    return b_p;
}

auto OptimalEstimation::getParameterCovariance() const -> const NamedMatrix&
{
    return S_b;
}

auto OptimalEstimation::getParameterError() const -> const NamedVector&
{
    return b_p_err;
}

auto OptimalEstimation::getTruth() const -> const std::optional<NamedVector>&
{
    return x_truth;
}

auto OptimalEstimation::getStrictInversion() const -> bool
{
    return strict_inversion;
}

} // namespace oem
