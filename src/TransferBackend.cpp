/**
 * @file TransferBackend.cpp
 * @brief
 */

// Header Being Defined
#include <msync/TransferBackend.hpp>

// System Includes
#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <string>
#include <vector>

// Third Party Includes
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
// See ioprio_set(2); glibc does not export these
constexpr int IOPRIO_WHO_PROCESS  = 1;
constexpr int IOPRIO_CLASS_BE     = 2;
constexpr int IOPRIO_CLASS_SHIFT  = 13;
constexpr int IOPRIO_LOWEST_LEVEL = 7;

// Exit code of a child that could not exec, as reported by most shells
constexpr int EXEC_FAILURE_CODE = 127;

auto os_error() -> std::string
{
    std::string errorMessage(BUFSIZ, '\0');

    // NOLINTNEXTLINE(*-include-cleaner)
    return ::strerror_r(errno, errorMessage.data(), errorMessage.size());
}

// Runs in the child between fork() and exec()
auto cap_io_priority() -> void
{
    const int priority
        = (IOPRIO_CLASS_BE << IOPRIO_CLASS_SHIFT) | IOPRIO_LOWEST_LEVEL;

    if (::syscall(SYS_ioprio_set, IOPRIO_WHO_PROCESS, 0, priority) != 0)
    {
        spdlog::debug("Failed to lower IO priority: {}", os_error());
    }
}

/**
 * @brief fork() and exec() `command`
 *
 * @param outputFd when not -1, the child's stdout and stderr are redirected
 * to it
 * @param unusedFd closed in the child (read end of the capture pipe)
 */
auto spawn(
    const std::vector<std::string>& command,
    const int                       outputFd,
    const int                       unusedFd
) -> ::pid_t
{
    if (command.empty())
    {
        throw process_exception("Refusing to run an empty command");
    }

    spdlog::trace("Running {{ {} }}", fmt::join(command, ", "));

    const ::pid_t pid = ::fork();

    if (pid == 0) // Child Process
    {
        if (unusedFd != -1)
        {
            ::close(unusedFd);
        }

        if (outputFd != -1)
        {
            ::dup2(outputFd, STDOUT_FILENO);
            ::dup2(outputFd, STDERR_FILENO);
            ::close(outputFd);
        }

        cap_io_priority();

        std::vector<std::string> arguments(command);
        std::vector<char*>       argv;
        argv.reserve(arguments.size() + 1);

        std::transform(
            std::begin(arguments),
            std::end(arguments),
            std::back_inserter(argv),
            [](std::string& str) { return std::data(str); }
        );

        // Last item in argv has to be a nullptr
        argv.emplace_back(nullptr);

        ::execvp(argv.at(0), argv.data());

        // If we get here `::execvp()` failed
        const std::string message = fmt::format(
            "msync: failed to execute {}: {}\n",
            command.front(),
            os_error()
        );
        [[maybe_unused]]
        const auto written
            = ::write(STDERR_FILENO, message.data(), message.size());

        ::_exit(EXEC_FAILURE_CODE);
    }

    if (pid == -1)
    {
        throw process_exception(
            fmt::format("Failed to fork {}: {}", command.front(), os_error())
        );
    }

    return pid;
}

auto wait_for(const ::pid_t processID) -> int
{
    int status = 0;

    while (::waitpid(processID, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            throw process_exception(
                fmt::format(
                    "waitpid() failed for process {}: {}",
                    processID,
                    os_error()
                )
            );
        }
    }

    // NOLINTBEGIN(*-include-cleaner)
    if (WIFSIGNALED(status))
    {
        spdlog::warn(
            "Process {} was terminated by signal {}",
            processID,
            WTERMSIG(status)
        );
        return 128 + WTERMSIG(status);
    }

    return WEXITSTATUS(status);
    // NOLINTEND(*-include-cleaner)
}
} // namespace

auto CapturingBackend::execute(const std::vector<std::string>& command)
    -> ProcessResult
{
    std::array<int, 2> outputPipe = { -1, -1 };

    if (::pipe2(outputPipe.data(), O_CLOEXEC) != 0)
    {
        throw process_exception(
            fmt::format("Failed to create output pipe: {}", os_error())
        );
    }

    ::pid_t pid = -1;

    try
    {
        pid = spawn(command, outputPipe.at(1), outputPipe.at(0));
    }
    catch (process_exception&)
    {
        ::close(outputPipe.at(0));
        ::close(outputPipe.at(1));
        throw;
    }

    // Close write end of the pipe in the parent process
    ::close(outputPipe.at(1));

    ProcessResult            result;
    std::array<char, BUFSIZ> buffer {};

    while (true)
    {
        const ::ssize_t bytesRead
            = ::read(outputPipe.at(0), buffer.data(), buffer.size());

        if (bytesRead > 0)
        {
            result.output.append(
                buffer.data(),
                static_cast<std::size_t>(bytesRead)
            );
        }
        else if (bytesRead == 0)
        {
            break;
        }
        else if (errno != EINTR)
        {
            spdlog::error(
                "Failed to read output of process {}: {}",
                pid,
                os_error()
            );
            break;
        }
    }

    ::close(outputPipe.at(0));

    result.exitCode = wait_for(pid);
    return result;
}

auto StreamingBackend::execute(const std::vector<std::string>& command)
    -> ProcessResult
{
    std::fflush(stdout);
    std::fflush(stderr);

    const ::pid_t pid = spawn(command, -1, -1);

    return ProcessResult { .exitCode = wait_for(pid), .output = {} };
}
} // namespace msync
