/**
 * @file RunCoordinator.cpp
 * @brief
 */

// Header Being Defined
#include <msync/RunCoordinator.hpp>

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <utility>

// Third Party Includes
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <msync/InstanceLock.hpp>

namespace msync
{
RunCoordinator::RunCoordinator(
    const SyncRequest& request,
    TransferBackend&   backend,
    MarkerFetcher&     fetcher,
    DelayPicker        delayPicker,
    Sleeper            sleeper
)
    : m_Request(request),
      m_Invoker(backend, request.get_scratch_directory(), request.is_verbose()),
      m_Prober(m_Invoker),
      m_StalenessChecker(fetcher),
      m_DelayPicker(std::move(delayPicker)),
      m_Sleeper(std::move(sleeper))
{
}

auto RunCoordinator::run() -> SyncReport
{
    SyncReport report {
        .instanceId  = m_Request.get_instance_id(),
        .destination = m_Request.get_destination().string(),
    };

    std::filesystem::create_directories(m_Request.get_temporary_directory());

    auto lock = InstanceLock::try_acquire(m_Request.get_lock_file());

    if (!lock)
    {
        spdlog::debug(
            "A sync for {} is already running, nothing to do",
            report.destination
        );
        return report;
    }

    report.lockAcquired = true;

    SyncSession session(
        std::move(lock),
        m_Request.get_scratch_directory(),
        m_Request.get_warning_timeout()
    );

    this->synchronize(session, report);

    report.elapsed        = session.elapsed();
    report.warningTimeout = session.get_warning_timeout();
    return report;
}

auto RunCoordinator::synchronize(SyncSession& session, SyncReport& report)
    -> void
{
    const auto& destination = m_Request.get_destination();

    session.prepare_directories(destination);

    if (const auto delay = this->pick_start_delay(); delay.count() > 0)
    {
        session.extend_warning_timeout(delay);

        spdlog::info("Waiting {} seconds before syncing", delay.count());
        m_Sleeper(delay);
    }

    const auto upstream = this->select_upstream();

    if (!upstream.has_value())
    {
        spdlog::error(
            "None of the upstreams [{}] are reachable",
            fmt::join(m_Request.get_sources(), ", ")
        );
        report.exitCode = 1;
        return;
    }

    report.upstream = upstream.value();
    report.mode     = SyncMode::FULL;

    std::string source = upstream.value();

    if (m_StalenessChecker.should_partial_sync(
            m_Request.get_last_update_url(),
            m_Request.get_last_update_sync(),
            destination
        ))
    {
        source += m_Request.get_last_update_sync().value_or("");
        report.mode = SyncMode::PARTIAL;
    }

    spdlog::info(
        "Starting {} sync from {} into {}",
        to_string(report.mode),
        source,
        destination.string()
    );

    const auto outcome = m_Invoker.invoke(
        source,
        destination,
        m_Request.get_rsync_options()
    );

    report.transferExitCode = outcome.exitCode;
    report.exitCode         = outcome.process_exit_code();

    if (!outcome.succeeded())
    {
        spdlog::error(
            "Sync from {} failed! rsync exit code: {}",
            source,
            outcome.exitCode
        );

        if (!outcome.output.empty())
        {
            std::cerr << outcome.output << std::flush;
        }

        return;
    }

    if (outcome.classification == TransferClassification::PARTIAL_SUCCESS)
    {
        spdlog::debug(
            "Sync from {} was incomplete (rsync exit code {}), treating as "
            "success",
            source,
            outcome.exitCode
        );
    }

    spdlog::info("Successfully synced {}", destination.string());
}

auto RunCoordinator::select_upstream() const -> std::optional<std::string>
{
    const auto& sources = m_Request.get_sources();

    if (m_Request.skip_connection_check())
    {
        spdlog::debug("Skipping connection check, using {}", sources.front());
        return sources.front();
    }

    return m_Prober.probe(sources, m_Request.get_rsync_options());
}

auto RunCoordinator::pick_start_delay() const -> std::chrono::seconds
{
    const auto bound = m_Request.get_random_delay();

    if (m_Request.is_interactive() || bound.count() <= 1)
    {
        return std::chrono::seconds(0);
    }

    return m_DelayPicker(bound);
}

auto RunCoordinator::random_start_delay(const std::chrono::seconds bound)
    -> std::chrono::seconds
{
    if (bound.count() <= 1)
    {
        return std::chrono::seconds(0);
    }

    static std::random_device randomDevice;
    static std::mt19937       randomGenerator(randomDevice());

    std::uniform_int_distribution<std::chrono::seconds::rep> distribution(
        0,
        bound.count() - 1
    );

    return std::chrono::seconds(distribution(randomGenerator));
}

auto RunCoordinator::sleep(const std::chrono::seconds delay) -> void
{
    std::this_thread::sleep_for(delay);
}
} // namespace msync
