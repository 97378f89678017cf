/**
 * @file CurlMarkerFetcher.cpp
 * @brief
 */

// Header Being Defined
#include <msync/MarkerFetcher.hpp>

// Standard Library Includes
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// Third Party Includes
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
constexpr long CONNECT_TIMEOUT_SECONDS = 10L;
constexpr long TOTAL_TIMEOUT_SECONDS   = 30L;

auto write_callback(
    char*             data,
    const std::size_t size,
    const std::size_t count,
    void*             userdata
) -> std::size_t
{
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * count);
    return size * count;
}

struct CurlDeleter
{
    auto operator()(CURL* handle) const -> void
    {
        curl_easy_cleanup(handle);
    }
};
} // namespace

auto CurlMarkerFetcher::fetch(const std::string& url)
    -> std::optional<std::string>
{
    const std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());

    if (!curl)
    {
        spdlog::error("cURL failed to initialize");
        return std::nullopt;
    }

    std::string body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(
        curl.get(),
        CURLOPT_CONNECTTIMEOUT,
        CONNECT_TIMEOUT_SECONDS
    );
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, TOTAL_TIMEOUT_SECONDS);

    const CURLcode result = curl_easy_perform(curl.get());

    if (result != CURLE_OK)
    {
        spdlog::warn(
            "Failed to fetch marker {}: {}",
            url,
            curl_easy_strerror(result)
        );
        return std::nullopt;
    }

    spdlog::trace("Fetched {} bytes from {}", body.size(), url);

    return body;
}
} // namespace msync
