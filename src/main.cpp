/**
 * @file main.cpp
 * @brief
 */

// System Includes
#include <unistd.h>

// Standard Library Includes
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <utility>

// Third Party Includes
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <msync/CommandLine.hpp>
#include <msync/MarkerFetcher.hpp>
#include <msync/RunCoordinator.hpp>
#include <msync/SyncNotifier.hpp>
#include <msync/SyncRequest.hpp>
#include <msync/TransferBackend.hpp>

auto main(int argc, char* argv[]) -> int
{
    // stdout belongs to rsync when streaming
    spdlog::set_default_logger(spdlog::stderr_color_mt("msync"));
    spdlog::cfg::load_env_levels();

    const auto programName
        = std::filesystem::path(argc > 0 ? argv[0] : "msync")
              .filename()
              .string();

    try
    {
        const bool interactive = ::isatty(STDOUT_FILENO) == 1;

        auto commandLine = msync::parse_command_line(argc, argv, interactive);

        if (commandLine.showHelp)
        {
            msync::print_usage(std::cout, programName);
            return EXIT_SUCCESS;
        }

        spdlog::set_level(
            commandLine.parameters.verbose ? spdlog::level::debug
                                           : spdlog::level::info
        );
        // SPDLOG_LEVEL wins over --verbose
        spdlog::cfg::load_env_levels();

        const msync::SyncRequest request(std::move(commandLine.parameters));

        std::unique_ptr<msync::TransferBackend> backend;
        if (request.is_verbose())
        {
            backend = std::make_unique<msync::StreamingBackend>();
        }
        else
        {
            backend = std::make_unique<msync::CapturingBackend>();
        }

        msync::CurlMarkerFetcher fetcher;
        msync::RunCoordinator    coordinator(request, *backend, fetcher);

        const auto report = coordinator.run();

        if (report.lockAcquired && request.get_notify_endpoint().has_value())
        {
            msync::SyncNotifier(request.get_notify_endpoint().value())
                .publish(report);
        }

        return report.exitCode;
    }
    catch (msync::usage_exception& ue)
    {
        spdlog::error("{}", ue.what());
        msync::print_usage(std::cerr, programName);
        return EXIT_FAILURE;
    }
    catch (std::exception& e)
    {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
}
