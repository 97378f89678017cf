/**
 * @file UpstreamProber.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <optional>
#include <string>
#include <vector>

// Project Includes
#include <msync/TransferInvoker.hpp>

namespace msync
{
class UpstreamProber
{
  public: // Constructors
    explicit UpstreamProber(const TransferInvoker& invoker);

  public: // Methods
    /**
     * @brief Find the first reachable upstream
     *
     * Candidates are listed one at a time, in order, with short connection and
     * idle timeouts. Probing stops at the first candidate that answers.
     *
     * @return the reachable candidate, or `std::nullopt` when none answered
     */
    [[nodiscard]]
    auto probe(
        const std::vector<std::string>& candidates,
        const std::vector<std::string>& options
    ) const -> std::optional<std::string>;

  private: // Members
    const TransferInvoker& m_Invoker;
};
} // namespace msync
