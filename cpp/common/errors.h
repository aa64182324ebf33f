// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Exceptions raised by the retrieval. Programming errors such as
// mixing differently named axes are reported with
// std::invalid_argument instead.

#pragma once

#include <stdexcept>

namespace oem {

// Invalid retrieval input: singular or NaN covariances and priors,
// inconsistent vector lengths, or a disturbance setup that leaves the
// Jacobian undefined.
class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A singular matrix was encountered when inverting with strict = true
class NumericalDegeneracy : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace oem
