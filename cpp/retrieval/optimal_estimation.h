// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Optimal estimation retrieval (Rodgers 2000). Given a prior state
// x_a with covariance S_a, a measurement y_obs with covariance S_y,
// and optionally model parameters b_p with covariance S_b, find the
// state x that best explains the measurement through a forward model
// y = F(x, b). The iterations follow the damped Gauss-Newton scheme
// of Turner and Löhnert 2013:
//
//   B     = gamma S_a^-1 + K^T S_Ep^-1 K
//   x_i+1 = x_a + B^-1 K^T S_Ep^-1 (y_obs - y_i + K (x_i - x_a))
//   S     = B^-1 (gamma^2 S_a^-1 + K^T S_Ep^-1 K) B^-1
//
// where S_Ep = S_y + K_b S_b K_b^T is the measurement covariance
// including the parameter uncertainty. Usage:
//
//   OptimalEstimation oe { x_a, S_a, y_obs, S_y, forward, settings };
//   if (oe.run()) {
//       const auto& result { oe.result() };
//       ...

#pragma once

#include "jacobian.h"
#include "settings_retrieval.h"

#include <optional>

namespace oem {

enum class RetrievalStatus
{
    // Constructed but not run
    initialized,
    // Run in progress. Also the final state of a run that was aborted
    // by an exception from the forward model or a strict inversion.
    iterating,
    converged,
    max_iterations_reached,
    time_exceeded,
    // Zero degrees of freedom, the measurement carries no information
    degenerate_stop,
};

[[nodiscard]] auto statusToString(const RetrievalStatus status)
  -> std::string;

// Snapshot of one iteration i. It contains the quantities evaluated
// at the state x = x_i and the resulting update x_next = x_i+1.
struct IterationRecord
{
    NamedVector x {};
    NamedVector y {};
    NamedMatrix K_x {};
    NamedMatrix K_b {};
    // Posterior covariance
    NamedMatrix S_aposterior {};
    // Averaging kernel
    NamedMatrix A {};
    // Degrees of freedom for signal, trace(A)
    double dgf {};
    // Shannon information content
    double H {};
    // Convergence criterion, the step size under the posterior metric
    double d_i2 {};
    // Damping factor
    double gamma { 1.0 };
    NamedVector x_next {};
    NamedVector y_next {};
};

// Solution of a converged retrieval. If the retrieval did not
// converge all quantities are NaN (with the correct axes) and conv_i
// is fill::i.
struct RetrievalResult
{
    bool converged {};
    // Iteration at which the solution was accepted
    int conv_i { fill::i };
    NamedVector x_op {};
    NamedVector y_op {};
    NamedMatrix S_op {};
    NamedVector x_op_err {};
    double dgf { fill::nan };
    NamedVector dgf_x {};
    // Measurement covariance including the parameter uncertainty
    NamedMatrix S_Ep {};
};

class OptimalEstimation
{
private:
    NamedVector x_a {};
    NamedMatrix S_a {};
    NamedVector y_obs {};
    NamedMatrix S_y {};
    NamedVector b_p {};
    NamedMatrix S_b {};
    // Only used by the diagnostics of validation runs
    std::optional<NamedVector> x_truth {};
    NamedVector x_a_err {};
    NamedVector b_p_err {};
    ForwardModel forward {};
    JacobianEstimator jacobian {};

    // Limits used by run() without arguments
    int default_max_iter {};
    double default_max_time {};
    double convergence_factor {};
    std::vector<double> gamma_factor {};
    bool strict_inversion { true };
    std::map<std::string, double> x_lower_limit {};
    std::map<std::string, double> x_upper_limit {};

    RetrievalStatus state { RetrievalStatus::initialized };
    std::vector<IterationRecord> records {};
    RetrievalResult solution {};
    // Forward model at the prior, computed when first needed
    mutable std::optional<NamedVector> y_a {};

    // Run the forward model at state x (parameters b_p appended)
    [[nodiscard]] auto evaluate(const NamedVector& x) const -> NamedVector;
    // S_y + K_b S_b K_b^T
    [[nodiscard]] auto effectiveCovariance(const NamedMatrix& K_b) const
      -> NamedMatrix;
    // Reset elements of x that violate a bound or are NaN to their
    // prior value. Returns the number of elements reset.
    auto repairBounds(NamedVector& x, const int iteration) const -> int;
    // Set the result from iteration conv_i or to undefined values
    auto finalize(const std::optional<int> conv_i) -> void;

public:
    // Check the input and resolve the settings. Throws
    // ConfigurationError if any input contains NaN, the covariance
    // axes do not match those of the vectors, a covariance matrix is
    // singular, or the settings are inconsistent with the names of
    // the state and parameter vectors.
    OptimalEstimation(const NamedVector& x_a,
                      const NamedMatrix& S_a,
                      const NamedVector& y_obs,
                      const NamedMatrix& S_y,
                      ForwardModel forward,
                      const SettingsRetrieval& settings = {},
                      const NamedVector& b_p = {},
                      const NamedMatrix& S_b = {},
                      const std::optional<NamedVector>& x_truth = {});
    // Run the retrieval for at most max_iter iterations starting from
    // x_0 (default x_a). Iterations stop once max_time seconds have
    // elapsed. Returns whether the retrieval converged. A new run
    // discards the results of the previous one.
    auto run(const int max_iter,
             const std::optional<NamedVector>& x_0 = {},
             const double max_time = 1e7) -> bool;
    // Run with the iteration and time limits from the settings
    auto run() -> bool;

    // Outcome of the last run. If it is still iterating after run()
    // returned, the run was aborted by an exception and the result is
    // undefined.
    [[nodiscard]] auto status() const -> RetrievalStatus;
    [[nodiscard]] auto converged() const -> bool;
    [[nodiscard]] auto result() const -> const RetrievalResult&;
    [[nodiscard]] auto iterations() const
      -> const std::vector<IterationRecord>&;
    // All states x_0, ..., x_N+1 of the last run
    [[nodiscard]] auto stateIterations() const -> std::vector<NamedVector>;
    // All simulated measurements y_0, ..., y_N+1 of the last run
    [[nodiscard]] auto measurementIterations() const
      -> std::vector<NamedVector>;

    // Forward model evaluated at the prior state
    [[nodiscard]] auto yPrior() const -> const NamedVector&;
    // Forward model evaluated at any state
    [[nodiscard]] auto forwardModel(const NamedVector& x) const -> NamedVector;

    [[nodiscard]] auto getPriorState() const -> const NamedVector&;
    [[nodiscard]] auto getPriorCovariance() const -> const NamedMatrix&;
    [[nodiscard]] auto getPriorError() const -> const NamedVector&;
    [[nodiscard]] auto getObservation() const -> const NamedVector&;
    [[nodiscard]] auto getObservationCovariance() const -> const NamedMatrix&;
    [[nodiscard]] auto getParameters() const -> const NamedVector&;
    [[nodiscard]] auto getParameterCovariance() const -> const NamedMatrix&;
    [[nodiscard]] auto getParameterError() const -> const NamedVector&;
    [[nodiscard]] auto getTruth() const -> const std::optional<NamedVector>&;
    [[nodiscard]] auto getStrictInversion() const -> bool;

    ~OptimalEstimation() = default;
};

} // namespace oem
