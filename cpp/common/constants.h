// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <limits>

namespace oem {

// Fill values to denote a missing or undefined value
namespace fill {

constexpr int i { -32767 };
constexpr double nan { std::numeric_limits<double>::quiet_NaN() };

} // namespace fill

// How the state and parameter vectors are disturbed when estimating
// the Jacobian by finite differences.
enum class DisturbanceMode
{
    additive,       // x + factor * sqrt(prior variance)
    multiplicative, // x * factor
};

} // namespace oem
