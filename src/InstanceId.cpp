/**
 * @file InstanceId.cpp
 * @brief
 */

// Header Being Defined
#include <msync/InstanceId.hpp>

// Standard Library Includes
#include <cctype>
#include <filesystem>
#include <string>

// Third Party Includes
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
auto is_safe_character(const unsigned char character) -> bool
{
    return std::isalnum(character) != 0 || character == '_'
        || character == '.' || character == ':' || character == '@'
        || character == '+' || character == '=';
}
} // namespace

auto derive_instance_id(const std::filesystem::path& destination)
    -> std::string
{
    if (destination.empty())
    {
        return std::string(FALLBACK_INSTANCE_ID);
    }

    const std::string normalized
        = std::filesystem::absolute(destination).lexically_normal().string();

    const auto first = normalized.find_first_not_of('/');
    if (first == std::string::npos)
    {
        return std::string(FALLBACK_INSTANCE_ID);
    }

    const auto        last    = normalized.find_last_not_of('/');
    const std::string trimmed = normalized.substr(first, last - first + 1);

    std::string instanceId;
    instanceId.reserve(trimmed.size());

    for (const char character : trimmed)
    {
        const auto byte = static_cast<unsigned char>(character);

        if (character == '/')
        {
            instanceId.push_back('-');
        }
        else if (is_safe_character(byte))
        {
            instanceId.push_back(character);
        }
        else
        {
            instanceId.append(fmt::format("\\x{:02x}", byte));
        }
    }

    spdlog::trace(
        "Derived instance id {} from destination {}",
        instanceId,
        destination.string()
    );

    return instanceId;
}
} // namespace msync
