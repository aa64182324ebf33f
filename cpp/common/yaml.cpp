// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "yaml.h"

#include "errors.h"
#include "io.h"

#include <algorithm>

// Mapping between a disturbance mode and its corresponding entry in
// DisturbanceMode
const std::map<std::string, oem::DisturbanceMode> disturbance_mode_to_enum {
    { "additive", oem::DisturbanceMode::additive },
    { "multiplicative", oem::DisturbanceMode::multiplicative },
};

namespace YAML {

auto convert<oem::DisturbanceMode>::decode(const Node& node,
                                           oem::DisturbanceMode& rhs) -> bool
{
    try {
        rhs = disturbance_mode_to_enum.at(oem::lower(node.as<std::string>()));
    } catch (const std::out_of_range&) {
        throw oem::ConfigurationError { "unknown disturbance mode: "
                                        + node.as<std::string>() };
    }
    return true;
}

} // namespace YAML

namespace oem {

auto operator<<(YAML::Emitter& out,
                const DisturbanceMode mode) -> YAML::Emitter&
{
    const auto it { std::ranges::find_if(
      disturbance_mode_to_enum,
      [mode](const auto& item) { return item.second == mode; }) };
    out << it->first;
    return out;
}

} // namespace oem
