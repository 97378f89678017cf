/**
 * @file StalenessChecker.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Project Includes
#include <msync/MarkerFetcher.hpp>

namespace msync
{
class StalenessChecker
{
  public: // Constructors
    explicit StalenessChecker(MarkerFetcher& fetcher);

  public: // Methods
    /**
     * @brief Decide whether syncing only `markerSyncPath` is enough
     *
     * True only when a marker URL is configured, its basename exists inside
     * `destination` and the remote copy matches the local one line by line,
     * ignoring whitespace within each line. A marker that cannot be fetched
     * counts as changed.
     */
    [[nodiscard]]
    auto should_partial_sync(
        const std::optional<std::string>& markerUrl,
        const std::optional<std::string>& markerSyncPath,
        const std::filesystem::path&      destination
    ) const -> bool;

  public: // Static Methods
    [[nodiscard]]
    static auto local_marker_path(
        std::string_view             markerUrl,
        const std::filesystem::path& destination
    ) -> std::filesystem::path;

    [[nodiscard]]
    static auto equal_ignoring_whitespace(
        std::string_view lhs,
        std::string_view rhs
    ) -> bool;

  private: // Members
    MarkerFetcher& m_Fetcher;
};
} // namespace msync
