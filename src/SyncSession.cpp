/**
 * @file SyncSession.cpp
 * @brief
 */

// Header Being Defined
#include <msync/SyncSession.hpp>

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

// Third Party Includes
#include <spdlog/spdlog.h>

namespace msync
{
SyncSession::SyncSession(
    std::unique_ptr<InstanceLock> lock,
    std::filesystem::path         scratchDirectory,
    const std::chrono::seconds    warningTimeout
)
    : m_Lock(std::move(lock)),
      m_ScratchDirectory(std::move(scratchDirectory)),
      m_WarningTimeout(warningTimeout),
      m_StartTime(std::chrono::steady_clock::now())
{
}

SyncSession::~SyncSession()
{
    const auto syncDuration = this->elapsed();

    if (syncDuration > m_WarningTimeout)
    {
        spdlog::warn(
            "Sync took {} seconds, longer than the warning timeout of {} "
            "seconds",
            syncDuration.count(),
            m_WarningTimeout.count()
        );
    }
    else
    {
        spdlog::debug("Sync took {} seconds", syncDuration.count());
    }

    this->remove_scratch_directory();

    m_Lock.reset();
}

auto SyncSession::prepare_directories(const std::filesystem::path& destination)
    -> void
{
    if (!destination.empty() && !std::filesystem::exists(destination))
    {
        spdlog::info("Creating destination {}", destination.string());
        std::filesystem::create_directories(destination);
    }

    std::filesystem::create_directories(m_ScratchDirectory);
}

auto SyncSession::extend_warning_timeout(const std::chrono::seconds extension)
    -> void
{
    m_WarningTimeout += extension;
}

auto SyncSession::elapsed() const -> std::chrono::seconds
{
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - m_StartTime
    );
}

auto SyncSession::remove_scratch_directory() noexcept -> void
{
    std::error_code errorCode;

    if (!std::filesystem::is_directory(m_ScratchDirectory, errorCode))
    {
        return;
    }

    const bool isEmpty
        = std::filesystem::is_empty(m_ScratchDirectory, errorCode);

    if (errorCode)
    {
        spdlog::warn(
            "Failed to inspect scratch directory {}, leaving it in place: {}",
            m_ScratchDirectory.string(),
            errorCode.message()
        );
        return;
    }

    // Leftovers are kept so a failed transfer can be inspected
    if (!isEmpty)
    {
        spdlog::warn(
            "Scratch directory {} is not empty, leaving it in place",
            m_ScratchDirectory.string()
        );
        return;
    }

    std::filesystem::remove(m_ScratchDirectory, errorCode);

    if (errorCode)
    {
        spdlog::warn(
            "Failed to remove scratch directory {}: {}",
            m_ScratchDirectory.string(),
            errorCode.message()
        );
    }
}
} // namespace msync
