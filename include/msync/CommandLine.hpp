/**
 * @file CommandLine.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <ostream>
#include <string_view>

// Project Includes
#include <msync/SyncRequest.hpp>

namespace msync
{
struct CommandLine
{
    bool           showHelp = false;
    SyncParameters parameters;
};

/**
 * @brief Build the run's parameters from argv
 *
 * Settings are layered: built-in defaults, then the `--config` file, then
 * the environment, then the remaining command line options. `interactive`
 * decides the default verbosity.
 *
 * @throws usage_exception on malformed arguments
 * @throws configuration_exception when the config file cannot be used
 */
[[nodiscard]]
auto parse_command_line(int argc, char* argv[], bool interactive)
    -> CommandLine;

auto print_usage(std::ostream& stream, std::string_view programName) -> void;

struct usage_exception : configuration_exception
{
    using configuration_exception::configuration_exception;
};
} // namespace msync
