/**
 * @file StalenessChecker.cpp
 * @brief
 */

// Header Being Defined
#include <msync/StalenessChecker.hpp>

// Standard Library Includes
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// Third Party Includes
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
// Splits `text` into lines with every whitespace character dropped. A final
// newline does not start another line.
auto stripped_lines(const std::string_view text) -> std::vector<std::string>
{
    std::vector<std::string> lines;
    std::string              current;
    bool                     lineOpen = false;

    for (const char character : text)
    {
        if (character == '\n')
        {
            lines.push_back(std::move(current));
            current.clear();
            lineOpen = false;
            continue;
        }

        lineOpen = true;
        if (std::isspace(static_cast<unsigned char>(character)) == 0)
        {
            current.push_back(character);
        }
    }

    if (lineOpen)
    {
        lines.push_back(std::move(current));
    }

    return lines;
}
} // namespace

StalenessChecker::StalenessChecker(MarkerFetcher& fetcher)
    : m_Fetcher(fetcher)
{
}

auto StalenessChecker::local_marker_path(
    const std::string_view       markerUrl,
    const std::filesystem::path& destination
) -> std::filesystem::path
{
    // Same result as basename(1), trailing slashes included
    const auto end = markerUrl.find_last_not_of('/');
    if (end == std::string_view::npos)
    {
        return destination;
    }

    const std::string_view trimmed  = markerUrl.substr(0, end + 1);
    const auto             start    = trimmed.find_last_of('/');
    const std::string_view basename = (start == std::string_view::npos)
                                        ? trimmed
                                        : trimmed.substr(start + 1);

    return destination / std::string(basename);
}

auto StalenessChecker::equal_ignoring_whitespace(
    const std::string_view lhs,
    const std::string_view rhs
) -> bool
{
    return stripped_lines(lhs) == stripped_lines(rhs);
}

auto StalenessChecker::should_partial_sync(
    const std::optional<std::string>& markerUrl,
    const std::optional<std::string>& markerSyncPath,
    const std::filesystem::path&      destination
) const -> bool
{
    if (!markerUrl.has_value())
    {
        return false;
    }

    const auto localMarker
        = StalenessChecker::local_marker_path(markerUrl.value(), destination);

    std::error_code errorCode;
    if (!std::filesystem::is_regular_file(localMarker, errorCode))
    {
        spdlog::debug(
            "Local marker {} does not exist, full sync required",
            localMarker.string()
        );
        return false;
    }

    std::ifstream localMarkerStream(localMarker, std::ios::binary);
    if (!localMarkerStream.good())
    {
        spdlog::warn("Failed to read local marker {}", localMarker.string());
        return false;
    }

    const std::string localContent(
        (std::istreambuf_iterator<char>(localMarkerStream)),
        std::istreambuf_iterator<char>()
    );

    const auto remoteContent = m_Fetcher.fetch(markerUrl.value());
    if (!remoteContent.has_value())
    {
        return false;
    }

    if (!StalenessChecker::equal_ignoring_whitespace(
            remoteContent.value(),
            localContent
        ))
    {
        spdlog::info(
            "Marker {} has changed since the last sync",
            markerUrl.value()
        );
        return false;
    }

    spdlog::info(
        "Marker {} is unchanged, syncing only '{}'",
        markerUrl.value(),
        markerSyncPath.value_or("")
    );

    return true;
}
} // namespace msync
