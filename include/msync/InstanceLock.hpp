/**
 * @file InstanceLock.hpp
 * @brief Exclusive per-destination lock file
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace msync
{
class InstanceLock
{
  public: // Types
    enum class LockAttempt : std::uint8_t
    {
        ACQUIRED,
        CONTENDED,
        STALE,
    };

  public: // Constructors
    InstanceLock(InstanceLock&)                     = delete;
    InstanceLock(InstanceLock&&)                    = delete;
    auto operator=(InstanceLock&) -> InstanceLock&  = delete;
    auto operator=(InstanceLock&&) -> InstanceLock& = delete;

    // Removes the lock file, then releases the lock
    ~InstanceLock();

  public: // Static Methods
    /**
     * @brief Take a non-blocking exclusive `flock()` on `lockFile`
     *
     * The file is created if it does not exist. A lock won on a file that
     * a previous holder unlinked meanwhile is dropped and retried.
     *
     * @return `nullptr` when another process already holds the lock
     * @throws lock_exception when the file cannot be opened or locked for
     * any other reason
     */
    [[nodiscard]]
    static auto try_acquire(const std::filesystem::path& lockFile)
        -> std::unique_ptr<InstanceLock>;

    /**
     * @brief Take a non-blocking exclusive `flock()` on an open descriptor
     *
     * The descriptor is left open in every case. `STALE` means the lock was
     * taken on a file that has since been unlinked or replaced at `lockFile`,
     * so holding it excludes nobody.
     *
     * @throws lock_exception on unexpected `flock()` or `stat()` failures
     */
    [[nodiscard]]
    static auto lock_descriptor(
        const std::filesystem::path& lockFile,
        int                          fileDescriptor
    ) -> LockAttempt;

  public: // Methods
    [[nodiscard]]
    auto get_path() const -> const std::filesystem::path&
    {
        return m_Path;
    }

  private: // Constructors
    InstanceLock(std::filesystem::path path, int fileDescriptor);

  private: // Members
    std::filesystem::path m_Path;
    int                   m_FileDescriptor;
};

struct lock_exception : std::runtime_error
{
    using std::runtime_error::runtime_error;
};
} // namespace msync
