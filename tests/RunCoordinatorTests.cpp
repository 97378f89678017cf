/**
 * @file RunCoordinatorTests.cpp
 * @brief
 */

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Third Party Includes
#include <gtest/gtest.h>

// Project Includes
#include <msync/InstanceLock.hpp>
#include <msync/RunCoordinator.hpp>
#include <msync/SyncReport.hpp>
#include <msync/SyncRequest.hpp>
#include <msync/TransferBackend.hpp>

#include "TestUtilities.hpp"

namespace msync
{
namespace
{
const std::string UPSTREAM_1 = "rsync://u1.example.org/ruby/";
const std::string UPSTREAM_2 = "rsync://u2.example.org/ruby/";
const std::string UPSTREAM_3 = "rsync://u3.example.org/ruby/";
const std::string MARKER_URL = "https://u1.example.org/ruby/TIME";

constexpr int SOCKET_ERROR = 10;
} // namespace

class RunCoordinatorTest : public ::testing::Test
{
  protected:
    RunCoordinatorTest()
    {
        m_Parameters.sources = { UPSTREAM_1, UPSTREAM_2, UPSTREAM_3 };

        m_Parameters.destination        = m_Root.path() / "mirror" / "ruby";
        m_Parameters.temporaryDirectory = m_Root.path() / "tmp";
        m_Parameters.randomDelay        = std::chrono::seconds(0);
        m_Parameters.interactive        = true;
    }

    auto run(test::FakeTransferBackend& backend) -> SyncReport
    {
        const SyncRequest request(m_Parameters);
        RunCoordinator    coordinator(request, backend, m_Fetcher);
        return coordinator.run();
    }

    // Runs non-interactively, recording every requested sleep
    auto run_unattended(
        test::FakeTransferBackend&         backend,
        RunCoordinator::DelayPicker        delayPicker,
        std::vector<std::chrono::seconds>& sleeps
    ) -> SyncReport
    {
        m_Parameters.interactive = false;

        const SyncRequest request(m_Parameters);
        RunCoordinator    coordinator(
            request,
            backend,
            m_Fetcher,
            std::move(delayPicker),
            [&sleeps](const std::chrono::seconds delay)
            { sleeps.push_back(delay); }
        );
        return coordinator.run();
    }

    [[nodiscard]]
    auto request() const -> SyncRequest
    {
        return SyncRequest(m_Parameters);
    }

    // Probes of `down` fail to connect, transfers answer `transferExitCode`
    static auto responder(std::set<std::string> down, int transferExitCode = 0)
        -> test::FakeTransferBackend::Responder
    {
        return [down = std::move(down),
                transferExitCode](const std::vector<std::string>& command)
        {
            if (test::FakeTransferBackend::is_probe(command))
            {
                const bool isDown = down.contains(command.back());
                return ProcessResult { .exitCode = isDown ? SOCKET_ERROR : 0,
                                       .output   = {} };
            }

            return ProcessResult { .exitCode = transferExitCode,
                                   .output   = "transfer output" };
        };
    }

    test::TemporaryDirectory m_Root;
    test::FakeMarkerFetcher  m_Fetcher;
    SyncParameters           m_Parameters;
};

TEST_F(RunCoordinatorTest, FullSyncFromFirstReachableUpstream)
{
    test::FakeTransferBackend backend(responder({}));

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_TRUE(report.lockAcquired);
    EXPECT_EQ(report.mode, SyncMode::FULL);
    EXPECT_EQ(report.upstream, UPSTREAM_1);
    EXPECT_EQ(
        backend.probed_sources(),
        std::vector<std::string> { UPSTREAM_1 }
    );
    EXPECT_EQ(
        backend.transferred_sources(),
        std::vector<std::string> { UPSTREAM_1 }
    );
    EXPECT_EQ(
        backend.commands().back().back(),
        m_Parameters.destination.string()
    );
}

TEST_F(RunCoordinatorTest, CleansUpLockAndScratchDirectory)
{
    test::FakeTransferBackend backend(responder({}));
    const auto                expected = this->request();

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_TRUE(std::filesystem::is_directory(m_Parameters.destination));
    EXPECT_FALSE(std::filesystem::exists(expected.get_lock_file()));
    EXPECT_FALSE(std::filesystem::exists(expected.get_scratch_directory()));
}

TEST_F(RunCoordinatorTest, FallsBackToNextReachableUpstream)
{
    test::FakeTransferBackend backend(responder({ UPSTREAM_1 }));

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_EQ(report.upstream, UPSTREAM_2);
    EXPECT_EQ(
        backend.probed_sources(),
        (std::vector<std::string> { UPSTREAM_1, UPSTREAM_2 })
    );
    EXPECT_EQ(
        backend.transferred_sources(),
        std::vector<std::string> { UPSTREAM_2 }
    );
}

TEST_F(RunCoordinatorTest, NoReachableUpstreamFailsWithoutTransfer)
{
    test::FakeTransferBackend backend(
        responder({ UPSTREAM_1, UPSTREAM_2, UPSTREAM_3 })
    );
    const auto expected = this->request();

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 1);
    EXPECT_EQ(report.mode, SyncMode::NONE);
    EXPECT_TRUE(report.upstream.empty());
    EXPECT_EQ(backend.probed_sources().size(), 3U);
    EXPECT_TRUE(backend.transferred_sources().empty());
    EXPECT_FALSE(std::filesystem::exists(expected.get_lock_file()));
}

TEST_F(RunCoordinatorTest, SkippingConnectionCheckUsesFirstSourceOnly)
{
    m_Parameters.skipConnectionCheck = true;
    test::FakeTransferBackend backend(responder({}, SOCKET_ERROR));

    const auto report = this->run(backend);

    EXPECT_TRUE(backend.probed_sources().empty());
    EXPECT_EQ(
        backend.transferred_sources(),
        std::vector<std::string> { UPSTREAM_1 }
    );
    EXPECT_EQ(report.exitCode, SOCKET_ERROR);
}

TEST_F(RunCoordinatorTest, UnchangedMarkerSyncsOnlyTheSuffix)
{
    m_Parameters.lastUpdateUrl  = MARKER_URL;
    m_Parameters.lastUpdateSync = "recent/";
    test::write_file(m_Parameters.destination / "TIME", "1700000000\n");
    m_Fetcher.set_content("1700000000\n");
    test::FakeTransferBackend backend(responder({}));

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_EQ(report.mode, SyncMode::PARTIAL);
    EXPECT_EQ(report.upstream, UPSTREAM_1);
    EXPECT_EQ(
        backend.transferred_sources(),
        std::vector<std::string> { UPSTREAM_1 + "recent/" }
    );
}

TEST_F(RunCoordinatorTest, MissingLocalMarkerForcesFullSync)
{
    m_Parameters.lastUpdateUrl  = MARKER_URL;
    m_Parameters.lastUpdateSync = "recent/";
    m_Fetcher.set_content("1700000000\n");
    test::FakeTransferBackend backend(responder({}));

    const auto report = this->run(backend);

    EXPECT_EQ(report.mode, SyncMode::FULL);
    EXPECT_EQ(
        backend.transferred_sources(),
        std::vector<std::string> { UPSTREAM_1 }
    );
}

TEST_F(RunCoordinatorTest, ChangedMarkerForcesFullSync)
{
    m_Parameters.lastUpdateUrl  = MARKER_URL;
    m_Parameters.lastUpdateSync = "recent/";
    test::write_file(m_Parameters.destination / "TIME", "1700000000\n");
    m_Fetcher.set_content("1700003600\n");
    test::FakeTransferBackend backend(responder({}));

    const auto report = this->run(backend);

    EXPECT_EQ(report.mode, SyncMode::FULL);
    EXPECT_EQ(
        backend.transferred_sources(),
        std::vector<std::string> { UPSTREAM_1 }
    );
}

TEST_F(RunCoordinatorTest, UnreachableMarkerForcesFullSync)
{
    m_Parameters.lastUpdateUrl  = MARKER_URL;
    m_Parameters.lastUpdateSync = "recent/";
    test::write_file(m_Parameters.destination / "TIME", "1700000000\n");
    m_Fetcher.set_content(std::nullopt);
    test::FakeTransferBackend backend(responder({}));

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_EQ(report.mode, SyncMode::FULL);
    EXPECT_EQ(m_Fetcher.fetched_urls().size(), 1U);
}

TEST_F(RunCoordinatorTest, HeldLockExitsSuccessfullyWithoutWork)
{
    const auto request = this->request();
    std::filesystem::create_directories(request.get_temporary_directory());

    const auto heldLock = InstanceLock::try_acquire(request.get_lock_file());
    ASSERT_NE(heldLock, nullptr);

    test::FakeTransferBackend backend(responder({}));
    const auto                report = this->run(backend);

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_FALSE(report.lockAcquired);
    EXPECT_TRUE(backend.commands().empty());
    EXPECT_FALSE(std::filesystem::exists(request.get_scratch_directory()));
    EXPECT_TRUE(std::filesystem::exists(request.get_lock_file()));
}

TEST_F(RunCoordinatorTest, NonEmptyScratchDirectoryIsLeftInPlace)
{
    const auto                request = this->request();
    test::FakeTransferBackend backend(
        [scratch = request.get_scratch_directory()](
            const std::vector<std::string>& command
        )
        {
            if (!test::FakeTransferBackend::is_probe(command))
            {
                test::write_file(scratch / ".partial", "half a file");
                return ProcessResult { .exitCode = 11, .output = {} };
            }

            return ProcessResult { .exitCode = 0, .output = {} };
        }
    );

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, 11);
    EXPECT_TRUE(std::filesystem::exists(request.get_scratch_directory()));
    EXPECT_FALSE(std::filesystem::exists(request.get_lock_file()));
}

TEST_F(RunCoordinatorTest, RepeatedRunsBehaveTheSame)
{
    m_Parameters.lastUpdateUrl  = MARKER_URL;
    m_Parameters.lastUpdateSync = "recent/";
    test::write_file(m_Parameters.destination / "TIME", "1700000000\n");
    m_Fetcher.set_content("1700000000\n");
    test::FakeTransferBackend backend(responder({}));

    const auto first  = this->run(backend);
    const auto second = this->run(backend);

    EXPECT_EQ(first.exitCode, 0);
    EXPECT_EQ(second.exitCode, first.exitCode);
    EXPECT_EQ(second.mode, first.mode);
    EXPECT_TRUE(second.lockAcquired);
    EXPECT_EQ(
        backend.transferred_sources(),
        (std::vector<std::string> { UPSTREAM_1 + "recent/",
                                    UPSTREAM_1 + "recent/" })
    );
}

TEST_F(RunCoordinatorTest, BackendFaultStillReleasesLock)
{
    test::FakeTransferBackend backend(
        [](const auto&) -> ProcessResult
        { throw process_exception("fork() failed"); }
    );
    const auto request = this->request();

    EXPECT_THROW(static_cast<void>(this->run(backend)), process_exception);

    EXPECT_FALSE(std::filesystem::exists(request.get_lock_file()));
    EXPECT_FALSE(std::filesystem::exists(request.get_scratch_directory()));
    EXPECT_NE(InstanceLock::try_acquire(request.get_lock_file()), nullptr);
}

TEST_F(RunCoordinatorTest, TinyDelayBoundsNeverWait)
{
    for (const auto bound : { 0, 1 })
    {
        m_Parameters.randomDelay = std::chrono::seconds(bound);
        test::FakeTransferBackend         backend(responder({}));
        std::vector<std::chrono::seconds> sleeps;
        bool                              picked = false;

        const auto report = this->run_unattended(
            backend,
            [&picked](const std::chrono::seconds)
            {
                picked = true;
                return std::chrono::seconds(0);
            },
            sleeps
        );

        EXPECT_EQ(report.exitCode, 0) << "bound " << bound;
        EXPECT_FALSE(picked) << "bound " << bound;
        EXPECT_TRUE(sleeps.empty()) << "bound " << bound;
        EXPECT_EQ(report.warningTimeout, m_Parameters.warningTimeout);
    }
}

TEST_F(RunCoordinatorTest, StartDelayIsSleptAndExtendsWarningTimeout)
{
    m_Parameters.randomDelay    = std::chrono::seconds(30);
    m_Parameters.warningTimeout = std::chrono::seconds(600);
    test::FakeTransferBackend         backend(responder({}));
    std::vector<std::chrono::seconds> sleeps;

    const auto report = this->run_unattended(
        backend,
        [](const std::chrono::seconds bound)
        { return bound - std::chrono::seconds(1); },
        sleeps
    );

    EXPECT_EQ(report.exitCode, 0);
    ASSERT_EQ(sleeps.size(), 1U);
    EXPECT_EQ(sleeps.front(), std::chrono::seconds(29));
    EXPECT_EQ(report.warningTimeout, std::chrono::seconds(629));
}

TEST_F(RunCoordinatorTest, InteractiveRunsNeverWait)
{
    m_Parameters.randomDelay = std::chrono::seconds(30);
    bool picked              = false;
    bool slept               = false;

    const SyncRequest         request(m_Parameters);
    test::FakeTransferBackend backend(responder({}));
    RunCoordinator            coordinator(
        request,
        backend,
        m_Fetcher,
        [&picked](const std::chrono::seconds)
        {
            picked = true;
            return std::chrono::seconds(5);
        },
        [&slept](const std::chrono::seconds) { slept = true; }
    );

    const auto report = coordinator.run();

    EXPECT_EQ(report.exitCode, 0);
    EXPECT_FALSE(picked);
    EXPECT_FALSE(slept);
}

TEST(RandomStartDelayTest, StaysBelowBound)
{
    EXPECT_EQ(
        RunCoordinator::random_start_delay(std::chrono::seconds(0)),
        std::chrono::seconds(0)
    );
    EXPECT_EQ(
        RunCoordinator::random_start_delay(std::chrono::seconds(1)),
        std::chrono::seconds(0)
    );

    for (int sample = 0; sample < 200; ++sample)
    {
        const auto delay
            = RunCoordinator::random_start_delay(std::chrono::seconds(3));

        EXPECT_GE(delay, std::chrono::seconds(0));
        EXPECT_LT(delay, std::chrono::seconds(3));
    }
}

class RunCoordinatorExitCodeTest
    : public RunCoordinatorTest,
      public ::testing::WithParamInterface<std::pair<int, int>>
{
};

TEST_P(RunCoordinatorExitCodeTest, MapsTransferExitCode)
{
    const auto [transferExitCode, expectedExitCode] = GetParam();
    test::FakeTransferBackend backend(responder({}, transferExitCode));

    const auto report = this->run(backend);

    EXPECT_EQ(report.exitCode, expectedExitCode);
    EXPECT_EQ(report.transferExitCode, transferExitCode);
}

INSTANTIATE_TEST_SUITE_P(
    RsyncExitCodes,
    RunCoordinatorExitCodeTest,
    ::testing::Values(
        std::make_pair(0, 0),
        std::make_pair(23, 0),
        std::make_pair(24, 0),
        std::make_pair(11, 11),
        std::make_pair(30, 30)
    )
);
} // namespace msync
