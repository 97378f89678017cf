/**
 * @file SyncReport.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace msync
{
enum class SyncMode : std::uint8_t
{
    NONE,
    FULL,
    PARTIAL,
};

[[nodiscard]]
constexpr auto to_string(const SyncMode mode) -> std::string_view
{
    switch (mode)
    {
    case SyncMode::FULL:
        return "full";
    case SyncMode::PARTIAL:
        return "partial";
    case SyncMode::NONE:
        break;
    }

    return "none";
}

struct SyncReport
{
    std::string          instanceId;
    std::string          destination;
    // Empty when no upstream could be selected
    std::string          upstream;
    SyncMode             mode             = SyncMode::NONE;
    // What the process should exit with
    int                  exitCode         = 0;
    // What rsync actually returned, before partial transfers are remapped
    int                  transferExitCode = 0;
    bool                 lockAcquired     = false;
    std::chrono::seconds elapsed { 0 };
    // Warning timeout in effect, including any start delay
    std::chrono::seconds warningTimeout { 0 };
};
} // namespace msync
