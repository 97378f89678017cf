/**
 * @file UpstreamProber.cpp
 * @brief
 */

// Header Being Defined
#include <msync/UpstreamProber.hpp>

// Standard Library Includes
#include <optional>
#include <string>
#include <vector>

// Third Party Includes
#include <spdlog/spdlog.h>

namespace msync
{
UpstreamProber::UpstreamProber(const TransferInvoker& invoker)
    : m_Invoker(invoker)
{
}

auto UpstreamProber::probe(
    const std::vector<std::string>& candidates,
    const std::vector<std::string>& options
) const -> std::optional<std::string>
{
    // Appended last so they override the baseline transfer timeouts
    std::vector<std::string> probeOptions(options);
    probeOptions.emplace_back("--contimeout=10");
    probeOptions.emplace_back("--timeout=30");

    for (const auto& candidate : candidates)
    {
        spdlog::debug("Probing upstream {}", candidate);

        const auto outcome
            = m_Invoker.invoke(candidate, std::nullopt, probeOptions);

        if (outcome.succeeded())
        {
            spdlog::info("Using upstream {}", candidate);
            return candidate;
        }

        spdlog::warn(
            "Upstream {} is unreachable (rsync exit code {})",
            candidate,
            outcome.exitCode
        );
        spdlog::debug("Probe output for {}:\n{}", candidate, outcome.output);
    }

    return std::nullopt;
}
} // namespace msync
