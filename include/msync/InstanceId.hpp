/**
 * @file InstanceId.hpp
 * @brief Derives the name used to scope a run's lock file and scratch
 * directory
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <string>
#include <string_view>

namespace msync
{
// Used when the destination collapses to nothing (e.g. `/`)
constexpr std::string_view FALLBACK_INSTANCE_ID = "root";

/**
 * @brief Map a destination directory to a filesystem-safe identifier
 *
 * The destination is made absolute and lexically normalized. Leading and
 * trailing slashes are trimmed and the remaining slashes become `-`. Any byte
 * that could be confused with that replacement (including `-` itself) or that
 * is unsafe in a file name is written as `\xNN`, so two different normalized
 * destinations never produce the same identifier.
 */
[[nodiscard]]
auto derive_instance_id(const std::filesystem::path& destination)
    -> std::string;
} // namespace msync
