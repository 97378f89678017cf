/**
 * @file TransferInvoker.cpp
 * @brief
 */

// Header Being Defined
#include <msync/TransferInvoker.hpp>

// Standard Library Includes
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Third Party Includes
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace msync
{
namespace
{
using namespace std::string_view_literals;

constexpr std::array BASELINE_OPTIONS = {
    "--recursive"sv,
    "--links"sv,
    "--perms"sv,
    "--times"sv,
    "--hard-links"sv,
    "--sparse"sv,
    "--safe-links"sv,
    // Removed files go away only once every new file has landed
    "--delete-delay"sv,
    "--delay-updates"sv,
    "--contimeout=60"sv,
    "--timeout=600"sv,
};

constexpr std::array VERBOSE_OPTIONS = {
    "--progress"sv,
    "--stats"sv,
    "--human-readable"sv,
};
} // namespace

TransferInvoker::TransferInvoker(
    TransferBackend&      backend,
    std::filesystem::path scratchDirectory,
    const bool            verbose
)
    : m_Backend(backend),
      m_ScratchDirectory(std::move(scratchDirectory)),
      m_Verbose(verbose)
{
}

auto TransferInvoker::compose_command(
    const std::string&                          source,
    const std::optional<std::filesystem::path>& destination,
    const std::vector<std::string>&             extraOptions
) const -> std::vector<std::string>
{
    std::vector<std::string> command = { std::string(RSYNC_EXECUTABLE) };

    for (const auto option : BASELINE_OPTIONS)
    {
        command.emplace_back(option);
    }

    command.emplace_back(
        fmt::format("--temp-dir={}", m_ScratchDirectory.string())
    );

    if (m_Verbose)
    {
        for (const auto option : VERBOSE_OPTIONS)
        {
            command.emplace_back(option);
        }
    }

    command.insert(command.end(), extraOptions.begin(), extraOptions.end());

    command.emplace_back(source);

    if (destination.has_value())
    {
        command.emplace_back(destination->string());
    }

    return command;
}

auto TransferInvoker::classify(const int exitCode) -> TransferClassification
{
    switch (exitCode)
    {
    case 0:
        return TransferClassification::FULL_SUCCESS;

    case RSYNC_PARTIAL_TRANSFER:
    case RSYNC_VANISHED_SOURCE:
        return TransferClassification::PARTIAL_SUCCESS;

    default:
        return TransferClassification::FAILURE;
    }
}

auto TransferInvoker::invoke(
    const std::string&                          source,
    const std::optional<std::filesystem::path>& destination,
    const std::vector<std::string>&             extraOptions
) const -> TransferOutcome
{
    const auto command
        = this->compose_command(source, destination, extraOptions);

    spdlog::debug("Sync Command: {{ {} }}", fmt::join(command, " "));

    auto result = m_Backend.execute(command);

    TransferOutcome outcome {
        .exitCode       = result.exitCode,
        .classification = TransferInvoker::classify(result.exitCode),
        .output         = {},
    };

    switch (outcome.classification)
    {
    case TransferClassification::FULL_SUCCESS:
        spdlog::trace("rsync from {} finished cleanly", source);
        break;

    case TransferClassification::PARTIAL_SUCCESS:
        spdlog::debug(
            "rsync from {} finished with partial transfer code {}",
            source,
            outcome.exitCode
        );
        break;

    case TransferClassification::FAILURE:
        outcome.output = std::move(result.output);
        break;
    }

    return outcome;
}
} // namespace msync
