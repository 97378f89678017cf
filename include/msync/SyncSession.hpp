/**
 * @file SyncSession.hpp
 * @brief Resources held for the duration of one run
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <memory>

// Project Includes
#include <msync/InstanceLock.hpp>

namespace msync
{
/**
 * @brief Owns the lock, the scratch directory and the run timer
 *
 * Everything is released exactly once, when the session is destroyed, no
 * matter how the run ended. Cleanup problems are logged and never thrown.
 */
class SyncSession
{
  public: // Constructors
    SyncSession(
        std::unique_ptr<InstanceLock> lock,
        std::filesystem::path         scratchDirectory,
        std::chrono::seconds          warningTimeout
    );
    SyncSession(SyncSession&)                     = delete;
    SyncSession(SyncSession&&)                    = delete;
    auto operator=(SyncSession&) -> SyncSession&  = delete;
    auto operator=(SyncSession&&) -> SyncSession& = delete;

    ~SyncSession();

  public: // Methods
    // Creates the destination and the scratch directory when missing
    auto prepare_directories(const std::filesystem::path& destination) -> void;

    auto extend_warning_timeout(std::chrono::seconds extension) -> void;

    [[nodiscard]]
    auto elapsed() const -> std::chrono::seconds;

    [[nodiscard]]
    auto get_warning_timeout() const -> std::chrono::seconds
    {
        return m_WarningTimeout;
    }

  private: // Methods
    auto remove_scratch_directory() noexcept -> void;

  private: // Members
    std::unique_ptr<InstanceLock>         m_Lock;
    std::filesystem::path                 m_ScratchDirectory;
    std::chrono::seconds                  m_WarningTimeout;
    std::chrono::steady_clock::time_point m_StartTime;
};
} // namespace msync
