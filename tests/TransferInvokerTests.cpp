/**
 * @file TransferInvokerTests.cpp
 * @brief
 */

// Standard Library Includes
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

// Third Party Includes
#include <gtest/gtest.h>

// Project Includes
#include <msync/TransferInvoker.hpp>

#include "TestUtilities.hpp"

namespace msync
{
namespace
{
auto contains(const std::vector<std::string>& command, const std::string& arg)
    -> bool
{
    return std::find(command.begin(), command.end(), arg) != command.end();
}

auto position_of(
    const std::vector<std::string>& command,
    const std::string&              arg
) -> std::ptrdiff_t
{
    return std::distance(
        command.begin(),
        std::find(command.begin(), command.end(), arg)
    );
}
} // namespace

TEST(TransferInvokerTest, ComposesBaselineCommand)
{
    test::FakeTransferBackend backend;
    const TransferInvoker     invoker(backend, "/var/tmp/msync-x", false);

    const auto command = invoker.compose_command(
        "rsync://mirror.example.org/ruby/",
        std::filesystem::path("/srv/ruby"),
        {}
    );

    ASSERT_GE(command.size(), 3U);
    EXPECT_EQ(command.front(), "rsync");

    for (const auto* option :
         { "--recursive",
           "--links",
           "--perms",
           "--times",
           "--hard-links",
           "--sparse",
           "--safe-links",
           "--delete-delay",
           "--delay-updates",
           "--contimeout=60",
           "--timeout=600",
           "--temp-dir=/var/tmp/msync-x" })
    {
        EXPECT_TRUE(contains(command, option)) << option;
    }

    EXPECT_FALSE(contains(command, "--progress"));
    EXPECT_EQ(
        command.at(command.size() - 2),
        "rsync://mirror.example.org/ruby/"
    );
    EXPECT_EQ(command.back(), "/srv/ruby");
}

TEST(TransferInvokerTest, VerboseAddsProgressAndStatistics)
{
    test::FakeTransferBackend backend;
    const TransferInvoker     invoker(backend, "/var/tmp/msync-x", true);

    const auto command
        = invoker.compose_command("rsync://host/m/", std::nullopt, {});

    EXPECT_TRUE(contains(command, "--progress"));
    EXPECT_TRUE(contains(command, "--stats"));
}

TEST(TransferInvokerTest, ExtraOptionsFollowBaselineOptions)
{
    test::FakeTransferBackend backend;
    const TransferInvoker     invoker(backend, "/var/tmp/msync-x", false);

    const auto command = invoker.compose_command(
        "rsync://host/m/",
        std::filesystem::path("/srv/m"),
        { "--timeout=30", "--exclude=*.iso" }
    );

    EXPECT_GT(
        position_of(command, "--timeout=30"),
        position_of(command, "--timeout=600")
    );
    EXPECT_LT(
        position_of(command, "--exclude=*.iso"),
        position_of(command, "rsync://host/m/")
    );
}

TEST(TransferInvokerTest, OmittedDestinationEndsWithSource)
{
    test::FakeTransferBackend backend;
    const TransferInvoker     invoker(backend, "/var/tmp/msync-x", false);

    const auto command
        = invoker.compose_command("rsync://host/m/", std::nullopt, {});

    EXPECT_EQ(command.back(), "rsync://host/m/");
}

TEST(TransferInvokerTest, ClassifiesExitCodes)
{
    EXPECT_EQ(
        TransferInvoker::classify(0),
        TransferClassification::FULL_SUCCESS
    );
    EXPECT_EQ(
        TransferInvoker::classify(23),
        TransferClassification::PARTIAL_SUCCESS
    );
    EXPECT_EQ(
        TransferInvoker::classify(24),
        TransferClassification::PARTIAL_SUCCESS
    );
    EXPECT_EQ(TransferInvoker::classify(11), TransferClassification::FAILURE);
    EXPECT_EQ(TransferInvoker::classify(127), TransferClassification::FAILURE);
}

TEST(TransferInvokerTest, PartialTransferIsRemappedButKeepsOriginalCode)
{
    test::FakeTransferBackend backend(
        [](const auto&)
        { return ProcessResult { .exitCode = 24, .output = "file vanished" }; }
    );
    const TransferInvoker invoker(backend, "/var/tmp/msync-x", false);

    const auto outcome = invoker.invoke(
        "rsync://host/m/",
        std::filesystem::path("/srv/m"),
        {}
    );

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.exitCode, 24);
    EXPECT_EQ(outcome.process_exit_code(), 0);
    EXPECT_TRUE(outcome.output.empty());
}

TEST(TransferInvokerTest, FailureSurfacesCapturedOutput)
{
    test::FakeTransferBackend backend(
        [](const auto&)
        {
            return ProcessResult { .exitCode = 11,
                                   .output   = "rsync: write failed" };
        }
    );
    const TransferInvoker invoker(backend, "/var/tmp/msync-x", false);

    const auto outcome = invoker.invoke(
        "rsync://host/m/",
        std::filesystem::path("/srv/m"),
        {}
    );

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.process_exit_code(), 11);
    EXPECT_EQ(outcome.output, "rsync: write failed");
}
} // namespace msync
