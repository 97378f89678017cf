/**
 * @file CommandLine.cpp
 * @brief
 */

// Header Being Defined
#include <msync/CommandLine.hpp>

// System Includes
#include <getopt.h>

// Standard Library Includes
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// Third Party Includes
#include <spdlog/fmt/fmt.h>

// Project Includes
#include <msync/Configuration.hpp>

namespace msync
{
namespace
{
enum LongOption : int
{
    SKIP_CONNECTION_CHECK = 256,
    LAST_UPDATE_URL,
    LAST_UPDATE_SYNC,
    RANDOM_DELAY,
    TEMPORARY_DIRECTORY,
    WARNING_TIMEOUT,
    RSYNC_OPTION,
    INSTANCE_ID,
    NOTIFY,
};

// NOLINTBEGIN(*-avoid-c-arrays)
constexpr ::option LONG_OPTIONS[] = {
    { "verbose", no_argument, nullptr, 'v' },
    { "quiet", no_argument, nullptr, 'q' },
    { "dry-run", no_argument, nullptr, 'n' },
    { "help", no_argument, nullptr, 'h' },
    { "config", required_argument, nullptr, 'c' },
    { "skip-connection-check", no_argument, nullptr, SKIP_CONNECTION_CHECK },
    { "last-update-url", required_argument, nullptr, LAST_UPDATE_URL },
    { "last-update-sync", required_argument, nullptr, LAST_UPDATE_SYNC },
    { "random-delay", required_argument, nullptr, RANDOM_DELAY },
    { "temporary-directory", required_argument, nullptr, TEMPORARY_DIRECTORY },
    { "warning-timeout", required_argument, nullptr, WARNING_TIMEOUT },
    { "rsync-option", required_argument, nullptr, RSYNC_OPTION },
    { "id", required_argument, nullptr, INSTANCE_ID },
    { "notify", required_argument, nullptr, NOTIFY },
    { nullptr, 0, nullptr, 0 },
};
// NOLINTEND(*-avoid-c-arrays)

// Leading ':' makes getopt report a missing argument as ':'
constexpr auto SHORT_OPTIONS = ":vqnhc:";

// Everything given on the command line, applied after the config file
struct Overrides
{
    bool                                help = false;
    std::optional<bool>                 verbose;
    bool                                dryRun              = false;
    bool                                skipConnectionCheck = false;
    std::optional<std::string>          configFile;
    std::optional<std::string>          lastUpdateUrl;
    std::optional<std::string>          lastUpdateSync;
    std::optional<std::chrono::seconds> randomDelay;
    std::optional<std::string>          temporaryDirectory;
    std::optional<std::chrono::seconds> warningTimeout;
    std::vector<std::string>            rsyncOptions;
    std::optional<std::string>          instanceId;
    std::optional<std::string>          notifyEndpoint;
    std::vector<std::string>            positionals;
};

auto parse_seconds(const std::string_view option, const std::string_view value)
    -> std::chrono::seconds
{
    std::int64_t seconds = 0;

    const auto [end, error]
        = std::from_chars(value.data(), value.data() + value.size(), seconds);

    if (error != std::errc() || end != value.data() + value.size()
        || seconds < 0)
    {
        throw usage_exception(
            fmt::format(
                "--{} expects a non-negative number of seconds, got '{}'",
                option,
                value
            )
        );
    }

    return std::chrono::seconds(seconds);
}

auto collect_overrides(int argc, char* argv[]) -> Overrides
{
    Overrides overrides;

    // Zero forces glibc to fully reinitialize its scanning state
    optind = 0;
    opterr = 0;

    int opt = 0;
    while (
        (opt = ::getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr))
        != -1
    )
    {
        switch (opt)
        {
        case 'v':
            overrides.verbose = true;
            break;
        case 'q':
            overrides.verbose = false;
            break;
        case 'n':
            overrides.dryRun = true;
            break;
        case 'h':
            overrides.help = true;
            return overrides;
        case 'c':
            overrides.configFile = optarg;
            break;
        case SKIP_CONNECTION_CHECK:
            overrides.skipConnectionCheck = true;
            break;
        case LAST_UPDATE_URL:
            overrides.lastUpdateUrl = optarg;
            break;
        case LAST_UPDATE_SYNC:
            overrides.lastUpdateSync = optarg;
            break;
        case RANDOM_DELAY:
            overrides.randomDelay = parse_seconds("random-delay", optarg);
            break;
        case TEMPORARY_DIRECTORY:
            overrides.temporaryDirectory = optarg;
            break;
        case WARNING_TIMEOUT:
            overrides.warningTimeout = parse_seconds("warning-timeout", optarg);
            break;
        case RSYNC_OPTION:
            overrides.rsyncOptions.emplace_back(optarg);
            break;
        case INSTANCE_ID:
            overrides.instanceId = optarg;
            break;
        case NOTIFY:
            overrides.notifyEndpoint = optarg;
            break;
        case ':':
            throw usage_exception(
                fmt::format("Option {} requires an argument", argv[optind - 1])
            );
        default:
            if (optopt != 0)
            {
                throw usage_exception(
                    fmt::format("Unknown option -{}", static_cast<char>(optopt))
                );
            }

            throw usage_exception(
                fmt::format("Unknown option {}", argv[optind - 1])
            );
        }
    }

    for (int index = optind; index < argc; ++index)
    {
        overrides.positionals.emplace_back(argv[index]);
    }

    return overrides;
}
} // namespace

auto parse_command_line(int argc, char* argv[], const bool interactive)
    -> CommandLine
{
    CommandLine commandLine;
    auto&       parameters = commandLine.parameters;

    const auto overrides = collect_overrides(argc, argv);

    if (overrides.help)
    {
        commandLine.showHelp = true;
        return commandLine;
    }

    parameters.interactive = interactive;
    parameters.verbose     = interactive;

    if (overrides.configFile.has_value())
    {
        apply_json_config(
            load_json_config(overrides.configFile.value()),
            parameters
        );
    }

    apply_environment(parameters);

    if (overrides.verbose.has_value())
    {
        parameters.verbose = overrides.verbose.value();
    }

    if (overrides.dryRun)
    {
        parameters.rsyncOptions.emplace_back("--dry-run");
    }

    parameters.skipConnectionCheck
        = parameters.skipConnectionCheck || overrides.skipConnectionCheck;

    if (overrides.lastUpdateUrl.has_value())
    {
        parameters.lastUpdateUrl = overrides.lastUpdateUrl;
    }

    if (overrides.lastUpdateSync.has_value())
    {
        parameters.lastUpdateSync = overrides.lastUpdateSync;
    }

    if (overrides.randomDelay.has_value())
    {
        parameters.randomDelay = overrides.randomDelay.value();
    }

    if (overrides.temporaryDirectory.has_value())
    {
        parameters.temporaryDirectory = overrides.temporaryDirectory.value();
    }

    if (overrides.warningTimeout.has_value())
    {
        parameters.warningTimeout = overrides.warningTimeout.value();
    }

    parameters.rsyncOptions.insert(
        parameters.rsyncOptions.end(),
        overrides.rsyncOptions.begin(),
        overrides.rsyncOptions.end()
    );

    if (overrides.instanceId.has_value())
    {
        parameters.instanceId = overrides.instanceId;
    }

    if (overrides.notifyEndpoint.has_value())
    {
        parameters.notifyEndpoint = overrides.notifyEndpoint;
    }

    const auto& positionals = overrides.positionals;

    if (positionals.size() == 1)
    {
        throw usage_exception(
            "Expected at least one source followed by a destination"
        );
    }

    if (positionals.size() >= 2)
    {
        parameters.sources.assign(positionals.begin(), positionals.end() - 1);
        parameters.destination = positionals.back();
    }
    else if (parameters.sources.empty() || parameters.destination.empty())
    {
        throw usage_exception("No sources or destination given");
    }

    return commandLine;
}

auto print_usage(std::ostream& stream, const std::string_view programName)
    -> void
{
    stream << "Usage: " << programName
           << " [options] <source>... <destination>\n"
              "\n"
              "Mirror the first reachable rsync source into destination.\n"
              "\n"
              "Options:\n"
              "  -v, --verbose                  stream rsync output and "
              "progress\n"
              "  -q, --quiet                    capture rsync output, show it "
              "only on failure\n"
              "  -n, --dry-run                  pass --dry-run to rsync\n"
              "  -c, --config <file>            read settings from a JSON "
              "file\n"
              "      --skip-connection-check    use the first source without "
              "probing\n"
              "      --last-update-url <url>    marker file compared with the "
              "local copy\n"
              "      --last-update-sync <path>  suffix synced when the marker "
              "is unchanged\n"
              "      --random-delay <seconds>   upper bound of the start "
              "delay (default "
           << DEFAULT_RANDOM_DELAY.count()
           << ")\n"
              "      --temporary-directory <p>  lock and scratch location "
              "(default "
           << DEFAULT_TEMPORARY_DIRECTORY
           << ")\n"
              "      --warning-timeout <secs>   warn when a sync runs longer "
              "(default "
           << DEFAULT_WARNING_TIMEOUT.count()
           << ")\n"
              "      --rsync-option <option>    extra rsync option, "
              "repeatable\n"
              "      --id <name>                override the instance id\n"
              "      --notify <endpoint>        send a ZeroMQ report when "
              "done\n"
              "  -h, --help                     show this help\n";
}
} // namespace msync
