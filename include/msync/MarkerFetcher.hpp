/**
 * @file MarkerFetcher.hpp
 * @brief Retrieval of the remote marker file
 */

#pragma once

// Standard Library Includes
#include <optional>
#include <string>

namespace msync
{
class MarkerFetcher
{
  public: // Constructors
    MarkerFetcher()                                        = default;
    MarkerFetcher(const MarkerFetcher&)                    = delete;
    MarkerFetcher(MarkerFetcher&&)                         = delete;
    auto operator=(const MarkerFetcher&) -> MarkerFetcher& = delete;
    auto operator=(MarkerFetcher&&) -> MarkerFetcher&      = delete;

    virtual ~MarkerFetcher() = default;

  public: // Methods
    // Never throws; a failed fetch is `std::nullopt`
    [[nodiscard]]
    virtual auto fetch(const std::string& url) -> std::optional<std::string>
        = 0;
};

class CurlMarkerFetcher final : public MarkerFetcher
{
  public: // Methods
    [[nodiscard]]
    auto fetch(const std::string& url) -> std::optional<std::string> override;
};
} // namespace msync
