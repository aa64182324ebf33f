// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Finite difference Jacobian of a forward model around a point of the
// combined state and parameter space.

#pragma once

#include <common/constants.h>
#include <common/named.h>

#include <functional>
#include <map>
#include <variant>

namespace oem {

// Forward model. It takes the state vector x followed by the
// parameter vector b, with their names, and returns the simulated
// measurement vector y. Any additional configuration of the model
// should be bound in the callable, e.g. by a lambda capture.
using ForwardModel = std::function<NamedVector(const NamedVector& xb)>;

// Same finite difference factor for all variables
struct UniformDisturbance
{
    double factor {};
};

// One factor per state or parameter name
struct PerVariableDisturbance
{
    std::map<std::string, double> factors {};
};

using Disturbance = std::variant<UniformDisturbance, PerVariableDisturbance>;

// Derivatives of y with respect to the state (rows y, columns x) and
// the parameters (rows y, columns b).
struct Jacobian
{
    NamedMatrix K_x {};
    NamedMatrix K_b {};
};

// Evaluate the forward model and check that the result is a vector
// over the measurement axis (std::invalid_argument otherwise).
[[nodiscard]] auto callForwardModel(const ForwardModel& forward,
                                    const NamedVector& xb,
                                    const Axis& y_axis) -> NamedVector;

class JacobianEstimator
{
private:
    Axis x_axis {};
    Axis b_axis {};
    Axis y_axis {};
    // Prior uncertainty (standard deviation) of each element of xb
    Eigen::VectorXd xb_err {};
    // Disturbance factor of each element of xb
    Eigen::VectorXd factors {};
    DisturbanceMode mode { DisturbanceMode::additive };
    ForwardModel forward {};

public:
    JacobianEstimator() = default;
    // Resolve the disturbance into one factor per name of x followed
    // by b. Throws ConfigurationError if a per-variable disturbance
    // does not name each variable exactly.
    JacobianEstimator(const Axis& x_axis,
                      const Axis& b_axis,
                      const Axis& y_axis,
                      const Eigen::VectorXd& xb_err,
                      const Disturbance& disturbance,
                      const DisturbanceMode mode,
                      ForwardModel forward);
    // Estimate the Jacobian around xb where y = F(xb). Each variable
    // is disturbed in turn and the forward model is evaluated once
    // per variable:
    //
    //   additive:       xb_j + f_j * err_j, step f_j * err_j
    //   multiplicative: xb_j * f_j,         step xb_j * (f_j - 1)
    //
    // Entries that turn out NaN or infinite are set to 0. Throws
    // ConfigurationError if a step is zero or, in the multiplicative
    // mode, if any element of xb is zero.
    [[nodiscard]] auto compute(const NamedVector& xb,
                               const NamedVector& y) const -> Jacobian;
    [[nodiscard]] auto getFactors() const -> const Eigen::VectorXd&;
    ~JacobianEstimator() = default;
};

} // namespace oem
