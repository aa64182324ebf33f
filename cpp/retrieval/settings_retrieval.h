// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the optimal
// estimation retrieval and its diagnostics

#pragma once

#include <common/settings.h>

namespace oem {

class SettingsRetrieval : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    SettingsRetrieval() = default;
    SettingsRetrieval(const std::string& yaml_file) : Settings { yaml_file } {}
    explicit SettingsRetrieval(const YAML::Node& node) : Settings { node } {}

    struct
    {
        Setting<int> max_iter { { "retrieval", "max_iter" },
                                10,
                                "Gauss-Newton iteration limit" };
        Setting<double> max_time {
            { "retrieval", "max_time" },
            1e7,
            "wall clock time budget of one retrieval, s. It is checked\n"
            "between iterations only."
        };
        Setting<double> convergence_factor {
            { "retrieval", "convergence_factor" },
            10.0,
            "The retrieval has converged if the step size d_i^2 is less\n"
            "than the number of measurements divided by this factor."
        };
        Setting<std::vector<double>> gamma_factor {
            { "retrieval", "gamma_factor" },
            {},
            "Levenberg-Marquardt damping factors of the first iterations.\n"
            "Remaining iterations are undamped (gamma = 1). Convergence\n"
            "is only possible for undamped iterations."
        };
        Setting<bool> strict_inversion {
            { "retrieval", "strict_inversion" },
            true,
            "Whether inverting a singular matrix during the iterations is\n"
            "an error. If not, the result is NaN and the iterations\n"
            "continue."
        };
    } retrieval;

    struct
    {
        Setting<double> disturbance {
            { "jacobian", "disturbance" },
            0.1,
            "finite difference step, relative to the prior uncertainty\n"
            "(additive) or a multiplication factor (multiplicative)"
        };
        Setting<std::map<std::string, double>> disturbance_per_variable {
            { "jacobian", "disturbance_per_variable" },
            {},
            "Disturbance for each state and parameter vector element. If\n"
            "given, it must name every element and [jacobian][disturbance]\n"
            "is ignored."
        };
        Setting<DisturbanceMode> mode { { "jacobian", "mode" },
                                        DisturbanceMode::additive,
                                        "additive or multiplicative" };
    } jacobian;

    struct
    {
        Setting<std::map<std::string, double>> lower {
            { "bounds", "lower" },
            {},
            "Lower limits of state vector elements. A violating element is\n"
            "reset to its prior value."
        };
        Setting<std::map<std::string, double>> upper {
            { "bounds", "upper" },
            {},
            "upper limits of state vector elements"
        };
    } bounds;

    struct
    {
        Setting<double> significance { { "diagnostics", "significance" },
                                       0.05,
                                       "significance level of chi2 tests" };
        Setting<double> atol {
            { "diagnostics", "atol" },
            1e-5,
            "eigenvalues of covariance matrices with an absolute value\n"
            "below this are treated as zero"
        };
        Setting<int> max_error_patterns {
            { "diagnostics", "max_error_patterns" },
            10,
            "number of linearity test results kept (0 for all)"
        };
    } diagnostics;

    auto scanKeys() -> void override;
};

} // namespace oem
