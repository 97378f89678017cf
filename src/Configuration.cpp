/**
 * @file Configuration.cpp
 * @brief
 */

// Header Being Defined
#include <msync/Configuration.hpp>

// Standard Library Includes
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
const std::set<std::string, std::less<>> KNOWN_KEYS = {
    "sources",
    "destination",
    "last_update_url",
    "last_update_sync",
    "random_delay",
    "warning_timeout",
    "temporary_directory",
    "rsync_options",
    "skip_connection_check",
    "id",
    "notify",
};

auto read_seconds(const nlohmann::json& config, const std::string& key)
    -> std::chrono::seconds
{
    const auto value = config.at(key).get<std::int64_t>();

    if (value < 0)
    {
        throw configuration_exception(
            fmt::format("Config key \"{}\" cannot be negative", key)
        );
    }

    return std::chrono::seconds(value);
}
} // namespace

auto load_json_config(const std::filesystem::path& file) -> nlohmann::json
{
    std::ifstream configFile(file);

    if (!configFile.good())
    {
        std::string errorMessage(BUFSIZ, '\0');

        throw configuration_exception(
            fmt::format(
                "Failed to load config file {}! OS Error: {}",
                file.string(),
                // NOLINTNEXTLINE(*-include-cleaner)
                ::strerror_r(errno, errorMessage.data(), errorMessage.size())
            )
        );
    }

    try
    {
        return nlohmann::json::parse(configFile);
    }
    catch (nlohmann::json::parse_error& pe)
    {
        throw configuration_exception(
            fmt::format(
                "Config file {} is invalid: {}",
                file.string(),
                pe.what()
            )
        );
    }
}

auto apply_json_config(const nlohmann::json& config, SyncParameters& parameters)
    -> void
{
    if (!config.is_object())
    {
        throw configuration_exception("Config must be a JSON object");
    }

    for (const auto& [key, value] : config.items())
    {
        if (!KNOWN_KEYS.contains(key))
        {
            spdlog::warn("Ignoring unknown config key \"{}\"", key);
        }
    }

    try
    {
        if (config.contains("sources"))
        {
            parameters.sources
                = config.at("sources").get<std::vector<std::string>>();
        }

        if (config.contains("destination"))
        {
            parameters.destination
                = config.at("destination").get<std::string>();
        }

        if (config.contains("temporary_directory"))
        {
            parameters.temporaryDirectory
                = config.at("temporary_directory").get<std::string>();
        }

        if (config.contains("last_update_url"))
        {
            parameters.lastUpdateUrl
                = config.at("last_update_url").get<std::string>();
        }

        if (config.contains("last_update_sync"))
        {
            parameters.lastUpdateSync
                = config.at("last_update_sync").get<std::string>();
        }

        if (config.contains("random_delay"))
        {
            parameters.randomDelay = read_seconds(config, "random_delay");
        }

        if (config.contains("warning_timeout"))
        {
            parameters.warningTimeout = read_seconds(config, "warning_timeout");
        }

        if (config.contains("rsync_options"))
        {
            const auto options
                = config.at("rsync_options").get<std::vector<std::string>>();

            parameters.rsyncOptions.insert(
                parameters.rsyncOptions.begin(),
                options.begin(),
                options.end()
            );
        }

        if (config.contains("skip_connection_check"))
        {
            parameters.skipConnectionCheck
                = config.at("skip_connection_check").get<bool>();
        }

        if (config.contains("id"))
        {
            parameters.instanceId = config.at("id").get<std::string>();
        }

        if (config.contains("notify"))
        {
            parameters.notifyEndpoint = config.at("notify").get<std::string>();
        }
    }
    catch (nlohmann::json::type_error& te)
    {
        throw configuration_exception(
            fmt::format("Config has a value of the wrong type: {}", te.what())
        );
    }
}

auto apply_environment(SyncParameters& parameters) -> void
{
    // NOLINTNEXTLINE(*-mt-unsafe)
    const auto* dryRunPtr = std::getenv("DRY_RUN");

    if (dryRunPtr == nullptr)
    {
        return;
    }

    std::string dryRun(dryRunPtr);
    std::transform(
        std::begin(dryRun),
        std::end(dryRun),
        std::begin(dryRun),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); }
    );

    if (dryRun == "TRUE")
    {
        spdlog::info("Dry run enabled. rsync will not modify the destination.");
        parameters.rsyncOptions.emplace_back("--dry-run");
    }
}
} // namespace msync
