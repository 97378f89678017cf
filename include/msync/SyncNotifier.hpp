/**
 * @file SyncNotifier.hpp
 * @brief Reports finished runs to a listener over ZeroMQ
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <msync/SyncReport.hpp>

namespace msync
{
class SyncNotifier
{
  public: // Constructors
    explicit SyncNotifier(
        std::string               endpoint,
        std::chrono::milliseconds timeout = std::chrono::seconds(5)
    );

  public: // Methods
    /**
     * @brief Send `report` as JSON on a REQ socket and wait for the reply
     *
     * Failures are logged; they never affect the outcome of the sync.
     *
     * @return whether the listener acknowledged the report
     */
    auto publish(const SyncReport& report) const -> bool;

  public: // Static Methods
    [[nodiscard]]
    static auto to_json(const SyncReport& report) -> nlohmann::json;

  private: // Members
    std::string               m_Endpoint;
    std::chrono::milliseconds m_Timeout;
};
} // namespace msync
