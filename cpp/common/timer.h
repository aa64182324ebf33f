// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Wall clock timer. The retrieval uses it for its time budget.

#pragma once

#include <chrono>

namespace oem {

class Timer
{
private:
    std::chrono::time_point<std::chrono::high_resolution_clock> wall_timestamp;
    double total_wall_time {};
    bool running { false };

public:
    Timer() = default;
    auto start() -> void;
    auto stop() -> void;
    // Return total wall time of all completed start/stop intervals
    [[nodiscard]] auto time() const -> double;
    // Total wall time including the interval currently running
    [[nodiscard]] auto elapsed() const -> double;
};

} // namespace oem
