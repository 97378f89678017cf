/**
 * @file RunCoordinator.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <functional>
#include <optional>
#include <string>

// Project Includes
#include <msync/MarkerFetcher.hpp>
#include <msync/StalenessChecker.hpp>
#include <msync/SyncReport.hpp>
#include <msync/SyncRequest.hpp>
#include <msync/SyncSession.hpp>
#include <msync/TransferBackend.hpp>
#include <msync/TransferInvoker.hpp>
#include <msync/UpstreamProber.hpp>

namespace msync
{
class RunCoordinator
{
  public: // Types
    // Given a bound above one second, picks a delay below it
    using DelayPicker
        = std::function<std::chrono::seconds(std::chrono::seconds bound)>;
    using Sleeper = std::function<void(std::chrono::seconds delay)>;

  public: // Constructors
    RunCoordinator(
        const SyncRequest& request,
        TransferBackend&   backend,
        MarkerFetcher&     fetcher,
        DelayPicker        delayPicker = &RunCoordinator::random_start_delay,
        Sleeper            sleeper     = &RunCoordinator::sleep
    );
    RunCoordinator(RunCoordinator&)                     = delete;
    RunCoordinator(RunCoordinator&&)                    = delete;
    auto operator=(RunCoordinator&) -> RunCoordinator&  = delete;
    auto operator=(RunCoordinator&&) -> RunCoordinator& = delete;

    ~RunCoordinator() = default;

  public: // Methods
    /**
     * @brief Perform one synchronization
     *
     * Returns immediately with a zero exit code when another run already
     * holds the lock for the same destination.
     */
    auto run() -> SyncReport;

  public: // Static Methods
    // Uniform in [0, bound) whole seconds
    [[nodiscard]]
    static auto random_start_delay(std::chrono::seconds bound)
        -> std::chrono::seconds;

    static auto sleep(std::chrono::seconds delay) -> void;

  private: // Methods
    [[nodiscard]]
    auto select_upstream() const -> std::optional<std::string>;

    // Zero when interactive or when the bound is one second or less
    [[nodiscard]]
    auto pick_start_delay() const -> std::chrono::seconds;

    auto synchronize(SyncSession& session, SyncReport& report) -> void;

  private: // Members
    const SyncRequest& m_Request;
    TransferInvoker    m_Invoker;
    UpstreamProber     m_Prober;
    StalenessChecker   m_StalenessChecker;
    DelayPicker        m_DelayPicker;
    Sleeper            m_Sleeper;
};
} // namespace msync
