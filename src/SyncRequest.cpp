/**
 * @file SyncRequest.cpp
 * @brief
 */

// Header Being Defined
#include <msync/SyncRequest.hpp>

// Standard Library Includes
#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>

// Third Party Includes
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <msync/InstanceId.hpp>

namespace msync
{
namespace
{
auto canonical_form(const std::filesystem::path& path) -> std::filesystem::path
{
    auto normalized = std::filesystem::absolute(path).lexically_normal();

    // "/srv/mirror/" normalizes with an empty trailing filename
    if (!normalized.has_filename() && normalized.has_parent_path()
        && normalized != normalized.root_path())
    {
        normalized = normalized.parent_path();
    }

    return normalized;
}

auto is_within(
    const std::filesystem::path& candidate,
    const std::filesystem::path& directory
) -> bool
{
    const auto candidatePath = canonical_form(candidate);
    const auto directoryPath = canonical_form(directory);

    const auto [directoryEnd, candidateEnd] = std::mismatch(
        directoryPath.begin(),
        directoryPath.end(),
        candidatePath.begin(),
        candidatePath.end()
    );

    return directoryEnd == directoryPath.end();
}
} // namespace

SyncRequest::SyncRequest(SyncParameters parameters)
    : m_Parameters(std::move(parameters))
{
    this->validate();

    // rsync resolves a relative --temp-dir against the destination
    m_Parameters.temporaryDirectory
        = std::filesystem::absolute(m_Parameters.temporaryDirectory)
              .lexically_normal();

    m_InstanceId = m_Parameters.instanceId.has_value()
                     ? m_Parameters.instanceId.value()
                     : derive_instance_id(m_Parameters.destination);

    spdlog::debug(
        "Sync request {}: [{}] -> {}",
        m_InstanceId,
        fmt::join(m_Parameters.sources, ", "),
        m_Parameters.destination.string()
    );
}

auto SyncRequest::validate() const -> void
{
    if (m_Parameters.lastUpdateSync.has_value()
        && !m_Parameters.lastUpdateUrl.has_value())
    {
        throw configuration_exception(
            "--last-update-sync requires --last-update-url to be set"
        );
    }

    if (m_Parameters.sources.empty())
    {
        throw configuration_exception("At least one source is required");
    }

    if (m_Parameters.destination.empty())
    {
        throw configuration_exception("A destination directory is required");
    }

    if (m_Parameters.temporaryDirectory.empty())
    {
        throw configuration_exception(
            "The temporary directory cannot be empty"
        );
    }

    if (m_Parameters.randomDelay.count() < 0
        || m_Parameters.warningTimeout.count() < 0)
    {
        throw configuration_exception(
            "--random-delay and --warning-timeout cannot be negative"
        );
    }

    if (m_Parameters.instanceId.has_value())
    {
        const auto& instanceId = m_Parameters.instanceId.value();

        if (instanceId.empty() || instanceId.find('/') != std::string::npos)
        {
            throw configuration_exception(
                fmt::format("Invalid instance id '{}'", instanceId)
            );
        }
    }

    if (is_within(m_Parameters.temporaryDirectory, m_Parameters.destination))
    {
        throw configuration_exception(
            fmt::format(
                "Temporary directory {} must not be inside the destination {}",
                m_Parameters.temporaryDirectory.string(),
                m_Parameters.destination.string()
            )
        );
    }
}

auto SyncRequest::get_lock_file() const -> std::filesystem::path
{
    return m_Parameters.temporaryDirectory
         / fmt::format("msync-{}.lck", m_InstanceId);
}

auto SyncRequest::get_scratch_directory() const -> std::filesystem::path
{
    return m_Parameters.temporaryDirectory
         / fmt::format("msync-{}", m_InstanceId);
}
} // namespace msync
