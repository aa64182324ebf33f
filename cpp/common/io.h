// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Functions for formatting the output to stdout and small string
// utilities used by the configuration layer.

#pragma once

#include <spdlog/pattern_formatter.h>
#include <string>

namespace oem {

// Define a new spdlog formatter flag. The primary purpose is to show
// labels such as [warning] for warnings but no label for regular
// (info) messages.
class oem_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Set the default logger pattern and create the "plain" logger used
// for headings. Safe to call more than once.
auto initLogging() -> void;

// Print a heading, e.g.
//
// ######################
// # Retrieval (3 of 7) #
// ######################
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Convert word to lower case
auto lower(const std::string& str) -> std::string;

} // namespace oem
