// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "timer.h"

namespace oem {

static auto secondsSince(
  const std::chrono::time_point<std::chrono::high_resolution_clock>& stamp)
  -> double
{
    return std::chrono::duration_cast<std::chrono::duration<double>>(
             std::chrono::high_resolution_clock::now() - stamp)
      .count();
}

auto Timer::start() -> void
{
    wall_timestamp = std::chrono::high_resolution_clock::now();
    running = true;
}

auto Timer::stop() -> void
{
    if (running) {
        total_wall_time += secondsSince(wall_timestamp);
        running = false;
    }
}

[[nodiscard]] auto Timer::time() const -> double
{
    return total_wall_time;
}

[[nodiscard]] auto Timer::elapsed() const -> double
{
    return running ? total_wall_time + secondsSince(wall_timestamp)
                   : total_wall_time;
}

} // namespace oem
