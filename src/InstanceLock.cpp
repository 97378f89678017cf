/**
 * @file InstanceLock.cpp
 * @brief
 */

// Header Being Defined
#include <msync/InstanceLock.hpp>

// System Includes
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

// Standard Library Includes
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

// Third Party Includes
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
// Bounds the retries when the lock file is replaced between open and flock
constexpr int MAX_LOCK_ATTEMPTS = 8;

auto os_error(const int errorNumber) -> std::string
{
    std::string errorMessage(BUFSIZ, '\0');

    // NOLINTNEXTLINE(*-include-cleaner)
    return ::strerror_r(errorNumber, errorMessage.data(), errorMessage.size());
}
} // namespace

InstanceLock::InstanceLock(std::filesystem::path path, const int fileDescriptor)
    : m_Path(std::move(path)),
      m_FileDescriptor(fileDescriptor)
{
}

InstanceLock::~InstanceLock()
{
    std::error_code errorCode;
    std::filesystem::remove(m_Path, errorCode);

    if (errorCode)
    {
        spdlog::warn(
            "Failed to remove lock file {}: {}",
            m_Path.string(),
            errorCode.message()
        );
    }

    // Closing the descriptor drops the flock()
    ::close(m_FileDescriptor);
    spdlog::debug("Released lock {}", m_Path.string());
}

auto InstanceLock::try_acquire(const std::filesystem::path& lockFile)
    -> std::unique_ptr<InstanceLock>
{
    constexpr ::mode_t LOCK_FILE_MODE = 0644;

    for (int attempt = 0; attempt < MAX_LOCK_ATTEMPTS; ++attempt)
    {
        // O_CLOEXEC keeps rsync from inheriting (and outliving us with) the
        // lock
        const int fileDescriptor = ::open(
            lockFile.c_str(),
            O_RDWR | O_CREAT | O_CLOEXEC,
            LOCK_FILE_MODE
        );

        if (fileDescriptor == -1)
        {
            throw lock_exception(
                fmt::format(
                    "Failed to open lock file {}! OS Error: {}",
                    lockFile.string(),
                    os_error(errno)
                )
            );
        }

        LockAttempt result = LockAttempt::CONTENDED;

        try
        {
            result = InstanceLock::lock_descriptor(lockFile, fileDescriptor);
        }
        catch (lock_exception&)
        {
            ::close(fileDescriptor);
            throw;
        }

        switch (result)
        {
        case LockAttempt::ACQUIRED:
            spdlog::debug("Acquired lock {}", lockFile.string());
            return std::unique_ptr<InstanceLock>(
                new InstanceLock(lockFile, fileDescriptor)
            );
        case LockAttempt::CONTENDED:
            ::close(fileDescriptor);
            spdlog::debug(
                "Lock {} is held by another process",
                lockFile.string()
            );
            return nullptr;
        case LockAttempt::STALE:
            ::close(fileDescriptor);
            spdlog::debug(
                "Lock file {} was replaced while locking it, retrying",
                lockFile.string()
            );
            break;
        }
    }

    spdlog::debug(
        "Lock file {} kept changing, treating it as held",
        lockFile.string()
    );
    return nullptr;
}

auto InstanceLock::lock_descriptor(
    const std::filesystem::path& lockFile,
    const int                    fileDescriptor
) -> LockAttempt
{
    if (::flock(fileDescriptor, LOCK_EX | LOCK_NB) != 0)
    {
        const int lockError = errno;

        if (lockError == EWOULDBLOCK)
        {
            return LockAttempt::CONTENDED;
        }

        throw lock_exception(
            fmt::format(
                "Failed to lock {}! OS Error: {}",
                lockFile.string(),
                os_error(lockError)
            )
        );
    }

    // The previous holder unlinks the file before unlocking it, so the
    // descriptor may name a file that is no longer at `lockFile`
    struct ::stat locked {};
    if (::fstat(fileDescriptor, &locked) != 0)
    {
        throw lock_exception(
            fmt::format(
                "Failed to stat lock file {}! OS Error: {}",
                lockFile.string(),
                os_error(errno)
            )
        );
    }

    struct ::stat current {};
    if (::stat(lockFile.c_str(), &current) != 0)
    {
        if (errno == ENOENT)
        {
            return LockAttempt::STALE;
        }

        throw lock_exception(
            fmt::format(
                "Failed to stat lock file {}! OS Error: {}",
                lockFile.string(),
                os_error(errno)
            )
        );
    }

    if (locked.st_dev != current.st_dev || locked.st_ino != current.st_ino)
    {
        return LockAttempt::STALE;
    }

    return LockAttempt::ACQUIRED;
}
} // namespace msync
