/**
 * @file Configuration.hpp
 * @brief Config file and environment handling
 */

#pragma once

// Standard Library Includes
#include <filesystem>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <msync/SyncRequest.hpp>

namespace msync
{
/**
 * @throws configuration_exception when the file cannot be opened or is not
 * valid JSON
 */
[[nodiscard]]
auto load_json_config(const std::filesystem::path& file) -> nlohmann::json;

/**
 * @brief Overlay the settings found in `config` onto `parameters`
 *
 * Keys that are not recognized are ignored with a warning. A value of the
 * wrong type is a `configuration_exception`.
 */
auto apply_json_config(const nlohmann::json& config, SyncParameters& parameters)
    -> void;

// Honors `DRY_RUN=true` by forwarding `--dry-run` to rsync
auto apply_environment(SyncParameters& parameters) -> void;
} // namespace msync
