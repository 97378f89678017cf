/**
 * @file TransferBackend.hpp
 * @brief Strategies for running the transfer engine as a child process
 */

#pragma once

// Standard Library Includes
#include <stdexcept>
#include <string>
#include <vector>

namespace msync
{
struct ProcessResult
{
    int         exitCode = -1;
    std::string output;
};

class TransferBackend
{
  public: // Constructors
    TransferBackend()                                          = default;
    TransferBackend(const TransferBackend&)                    = delete;
    TransferBackend(TransferBackend&&)                         = delete;
    auto operator=(const TransferBackend&) -> TransferBackend& = delete;
    auto operator=(TransferBackend&&) -> TransferBackend&      = delete;

    virtual ~TransferBackend() = default;

  public: // Methods
    /**
     * @brief Run `command` to completion
     *
     * `command[0]` is looked up in `PATH`. A child killed by a signal reports
     * `128 + signal` as its exit code.
     */
    virtual auto execute(const std::vector<std::string>& command)
        -> ProcessResult
        = 0;
};

// Collects the child's combined stdout and stderr into `ProcessResult::output`
class CapturingBackend final : public TransferBackend
{
  public: // Methods
    auto execute(const std::vector<std::string>& command)
        -> ProcessResult override;
};

// Child inherits the terminal; `ProcessResult::output` is always empty
class StreamingBackend final : public TransferBackend
{
  public: // Methods
    auto execute(const std::vector<std::string>& command)
        -> ProcessResult override;
};

struct process_exception : std::runtime_error
{
    using std::runtime_error::runtime_error;
};
} // namespace msync
