/**
 * @file SyncRequest.hpp
 * @brief Immutable description of a single synchronization run
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace msync
{
constexpr std::string_view     DEFAULT_TEMPORARY_DIRECTORY = "/var/tmp";
constexpr std::chrono::seconds DEFAULT_RANDOM_DELAY { 120 };
constexpr std::chrono::seconds DEFAULT_WARNING_TIMEOUT { 3600 };

// Raw settings gathered from the config file, environment and command line
struct SyncParameters
{
    std::vector<std::string>   sources;
    std::filesystem::path      destination;
    std::filesystem::path      temporaryDirectory = DEFAULT_TEMPORARY_DIRECTORY;
    std::optional<std::string> lastUpdateUrl;
    std::optional<std::string> lastUpdateSync;
    std::chrono::seconds       randomDelay    = DEFAULT_RANDOM_DELAY;
    std::chrono::seconds       warningTimeout = DEFAULT_WARNING_TIMEOUT;
    std::vector<std::string>   rsyncOptions;
    bool                       verbose             = false;
    bool                       skipConnectionCheck = false;
    bool                       interactive         = false;
    std::optional<std::string> instanceId;
    std::optional<std::string> notifyEndpoint;
};

class SyncRequest
{
  public: // Constructors
    explicit SyncRequest(SyncParameters parameters);

  public: // Methods
    [[nodiscard]]
    auto get_sources() const -> const std::vector<std::string>&
    {
        return m_Parameters.sources;
    }

    [[nodiscard]]
    auto get_destination() const -> const std::filesystem::path&
    {
        return m_Parameters.destination;
    }

    [[nodiscard]]
    auto get_temporary_directory() const -> const std::filesystem::path&
    {
        return m_Parameters.temporaryDirectory;
    }

    [[nodiscard]]
    auto get_last_update_url() const -> const std::optional<std::string>&
    {
        return m_Parameters.lastUpdateUrl;
    }

    [[nodiscard]]
    auto get_last_update_sync() const -> const std::optional<std::string>&
    {
        return m_Parameters.lastUpdateSync;
    }

    [[nodiscard]]
    auto get_random_delay() const -> std::chrono::seconds
    {
        return m_Parameters.randomDelay;
    }

    [[nodiscard]]
    auto get_warning_timeout() const -> std::chrono::seconds
    {
        return m_Parameters.warningTimeout;
    }

    [[nodiscard]]
    auto get_rsync_options() const -> const std::vector<std::string>&
    {
        return m_Parameters.rsyncOptions;
    }

    [[nodiscard]]
    auto is_verbose() const -> bool
    {
        return m_Parameters.verbose;
    }

    [[nodiscard]]
    auto skip_connection_check() const -> bool
    {
        return m_Parameters.skipConnectionCheck;
    }

    [[nodiscard]]
    auto is_interactive() const -> bool
    {
        return m_Parameters.interactive;
    }

    [[nodiscard]]
    auto get_notify_endpoint() const -> const std::optional<std::string>&
    {
        return m_Parameters.notifyEndpoint;
    }

    [[nodiscard]]
    auto get_instance_id() const -> const std::string&
    {
        return m_InstanceId;
    }

    // <temporary-directory>/msync-<id>.lck
    [[nodiscard]]
    auto get_lock_file() const -> std::filesystem::path;

    // <temporary-directory>/msync-<id>/
    [[nodiscard]]
    auto get_scratch_directory() const -> std::filesystem::path;

  private: // Methods
    auto validate() const -> void;

  private: // Members
    SyncParameters m_Parameters;
    std::string    m_InstanceId;
};

struct configuration_exception : std::runtime_error
{
    using std::runtime_error::runtime_error;
};
} // namespace msync
