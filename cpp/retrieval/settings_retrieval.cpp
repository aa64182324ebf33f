// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_retrieval.h"

#include <common/errors.h>

namespace oem {

auto SettingsRetrieval::scanKeys() -> void
{
    scan(retrieval.max_iter);
    scan(retrieval.max_time);
    scan(retrieval.convergence_factor);
    scan(retrieval.gamma_factor);
    scan(retrieval.strict_inversion);

    scan(jacobian.disturbance);
    scan(jacobian.disturbance_per_variable);
    scan(jacobian.mode);

    scan(bounds.lower);
    scan(bounds.upper);

    scan(diagnostics.significance);
    scan(diagnostics.atol);
    scan(diagnostics.max_error_patterns);
}

auto SettingsRetrieval::checkParameters() -> void
{
    if (retrieval.max_iter <= 0) {
        throw ConfigurationError { retrieval.max_iter.keyToStr()
                                   + " must be positive" };
    }
    if (!(retrieval.max_time > 0.0)) {
        throw ConfigurationError { retrieval.max_time.keyToStr()
                                   + " must be positive" };
    }
    if (!(retrieval.convergence_factor > 0.0)) {
        throw ConfigurationError { retrieval.convergence_factor.keyToStr()
                                   + " must be positive" };
    }
    if (static_cast<int>(retrieval.gamma_factor.size()) > retrieval.max_iter) {
        throw ConfigurationError { retrieval.gamma_factor.keyToStr()
                                   + " has more elements than "
                                   + retrieval.max_iter.keyToStr() };
    }
    for (const auto& [name, lower] : bounds.lower) {
        if (bounds.upper.contains(name) && lower > bounds.upper.at(name)) {
            throw ConfigurationError { "lower limit of " + name
                                       + " exceeds its upper limit" };
        }
    }
    if (!(diagnostics.significance > 0.0 && diagnostics.significance < 1.0)) {
        throw ConfigurationError { diagnostics.significance.keyToStr()
                                   + " must be between 0 and 1" };
    }
    if (diagnostics.atol < 0.0) {
        throw ConfigurationError { diagnostics.atol.keyToStr()
                                   + " must not be negative" };
    }
    if (diagnostics.max_error_patterns < 0) {
        throw ConfigurationError { diagnostics.max_error_patterns.keyToStr()
                                   + " must not be negative" };
    }
}

} // namespace oem
