// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "jacobian.h"

#include <common/errors.h>

#include <spdlog/spdlog.h>
#include <utility>

namespace oem {

auto callForwardModel(const ForwardModel& forward,
                      const NamedVector& xb,
                      const Axis& y_axis) -> NamedVector
{
    NamedVector y { forward(xb) };
    checkAligned(y.axis(), y_axis, "forward model output");
    return y;
}

JacobianEstimator::JacobianEstimator(const Axis& x_axis,
                                     const Axis& b_axis,
                                     const Axis& y_axis,
                                     const Eigen::VectorXd& xb_err,
                                     const Disturbance& disturbance,
                                     const DisturbanceMode mode,
                                     ForwardModel forward)
  : x_axis { x_axis }
  , b_axis { b_axis }
  , y_axis { y_axis }
  , xb_err { xb_err }
  , mode { mode }
  , forward { std::move(forward) }
{
    const Axis xb_axis { concat(x_axis, b_axis) };
    if (xb_err.size() != xb_axis.size()) {
        throw ConfigurationError { "expected " + std::to_string(xb_axis.size())
                                   + " prior uncertainties, got "
                                   + std::to_string(xb_err.size()) };
    }
    factors.resize(xb_axis.size());
    if (const auto* uniform { std::get_if<UniformDisturbance>(&disturbance) }) {
        factors.setConstant(uniform->factor);
    } else {
        const auto& per_variable { std::get<PerVariableDisturbance>(
                                     disturbance)
                                     .factors };
        for (const auto& [name, factor] : per_variable) {
            if (!xb_axis.contains(name)) {
                throw ConfigurationError {
                    "disturbance given for unknown variable " + name
                };
            }
        }
        for (int i {}; i < xb_axis.size(); ++i) {
            const auto it { per_variable.find(xb_axis.name(i)) };
            if (it == per_variable.end()) {
                throw ConfigurationError { "no disturbance given for "
                                           + xb_axis.name(i) };
            }
            factors(i) = it->second;
        }
    }
}

auto JacobianEstimator::compute(const NamedVector& xb,
                                const NamedVector& y) const -> Jacobian
{
    checkAligned(xb.axis(), concat(x_axis, b_axis), "Jacobian state");
    checkAligned(y.axis(), y_axis, "Jacobian measurement");
    if (mode == DisturbanceMode::multiplicative
        && (xb.values().array() == 0.0).any()) {
        throw ConfigurationError { "multiplicative disturbance of a zero "
                                   "valued element of the state or "
                                   "parameter vector" };
    }
    Eigen::MatrixXd K(y_axis.size(), xb.size());
    for (int j {}; j < xb.size(); ++j) {
        const double step { mode == DisturbanceMode::additive
                              ? factors(j) * xb_err(j)
                              : xb(j) * (factors(j) - 1.0) };
        if (step == 0.0) {
            throw ConfigurationError { "zero disturbance of "
                                       + xb.axis().name(j)
                                       + ", derivative is undefined" };
        }
        NamedVector xb_disturbed { xb };
        xb_disturbed(j) = mode == DisturbanceMode::additive
                            ? xb(j) + step
                            : xb(j) * factors(j);
        const NamedVector y_disturbed { callForwardModel(
          forward, xb_disturbed, y_axis) };
        K.col(j) = (y_disturbed.values() - y.values()) / step;
    }
    // Unresolvable sensitivities count as zero sensitivity
    const int n_invalid { static_cast<int>(
      (!K.array().isFinite()).count()) };
    if (n_invalid > 0) {
        spdlog::debug("Setting {} non-finite Jacobian elements to 0",
                      n_invalid);
        K = K.array().isFinite().select(K.array(), 0.0).matrix();
    }
    const int n_x { x_axis.size() };
    return { { y_axis, x_axis, K.leftCols(n_x) },
             { y_axis, b_axis, K.rightCols(b_axis.size()) } };
}

auto JacobianEstimator::getFactors() const -> const Eigen::VectorXd&
{
    return factors;
}

} // namespace oem
