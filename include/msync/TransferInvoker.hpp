/**
 * @file TransferInvoker.hpp
 * @brief Composes and runs a single rsync invocation
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project Includes
#include <msync/TransferBackend.hpp>
#include <msync/TransferOutcome.hpp>

namespace msync
{
constexpr std::string_view RSYNC_EXECUTABLE = "rsync";

// rsync: "Partial transfer due to error"
constexpr int RSYNC_PARTIAL_TRANSFER = 23;
// rsync: "Partial transfer due to vanished source files"
constexpr int RSYNC_VANISHED_SOURCE  = 24;

class TransferInvoker
{
  public: // Constructors
    TransferInvoker(
        TransferBackend&      backend,
        std::filesystem::path scratchDirectory,
        bool                  verbose
    );

  public: // Methods
    /**
     * @brief Run rsync from `source` into `destination`
     *
     * Without a destination rsync only lists `source`, which is how upstreams
     * are probed. Options in `extraOptions` come after the baseline ones and
     * therefore take precedence over them.
     */
    [[nodiscard]]
    auto invoke(
        const std::string&                          source,
        const std::optional<std::filesystem::path>& destination,
        const std::vector<std::string>&             extraOptions
    ) const -> TransferOutcome;

    [[nodiscard]]
    auto compose_command(
        const std::string&                          source,
        const std::optional<std::filesystem::path>& destination,
        const std::vector<std::string>&             extraOptions
    ) const -> std::vector<std::string>;

  public: // Static Methods
    [[nodiscard]]
    static auto classify(int exitCode) -> TransferClassification;

  private: // Members
    TransferBackend&      m_Backend;
    std::filesystem::path m_ScratchDirectory;
    bool                  m_Verbose;
};
} // namespace msync
