// decopy: copy one directory's contents into several destinations, with a
// live box-drawn progress display.

#include "BoxLayout.h"
#include "Config.h"
#include "CopyQueue.h"
#include "CopyWorker.h"
#include "Exceptions.h"
#include "ILogger.h"
#include "ProgressChannel.h"
#include "TreeCopier.h"
#include "UserInterface.h"
#include "Utils.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#ifndef DECOPY_VERSION
#define DECOPY_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using namespace decopy;

namespace {

enum ExitCode : int {
    kExitSuccess = 0,               // also used when the user answers [N]
    kExitDestinationsFailed = 1,
    kExitArgumentError = 2,
    kExitSourceUnreadable = 3,
    kExitRenderError = 4,
    kExitConfigError = 5,
    kExitInternalError = 70,
    kExitInterrupted = 130,
};

std::atomic<bool> g_interrupted{false};

void onInterrupt(int)
{
    g_interrupted.store(true);
}

struct Options {
    std::string source;
    std::vector<std::string> destinations;
    std::optional<fs::path> config_path;
    bool yes = false;
    bool verbose = false;
    bool no_color = false;
    bool save_config = false;
    bool help = false;
    bool version = false;
};

void printUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [OPTIONS] <source> <destination>...\n"
              << "\nCopies the contents of <source> into every <destination>, in order.\n"
              << "\nOptions:\n"
              << "  -y, --yes             Skip the confirmation prompt\n"
              << "  -v, --verbose         Print debug messages\n"
              << "      --no-color        Disable colours\n"
              << "      --config <path>   Use this config file instead of the default\n"
              << "      --save-config     Write the effective configuration and exit if no paths are given\n"
              << "  -h, --help            Show this help message\n"
              << "      --version         Print the version\n"
              << "\nExamples:\n"
              << "  " << argv0 << " build /mnt/usb1 /mnt/usb2\n"
              << "  " << argv0 << " -y ./dist /srv/www /srv/backup\n";
}

Options parseArguments(int argc, char* argv[])
{
    Options opts;
    bool positional_only = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (positional_only || arg.empty() || arg[0] != '-' || arg == "-") {
            if (opts.source.empty()) {
                opts.source = arg;
            } else {
                opts.destinations.push_back(arg);
            }
        } else if (arg == "--") {
            positional_only = true;
        } else if (arg == "--yes" || arg == "-y") {
            opts.yes = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                throw ArgumentException("--config needs a path");
            }
            opts.config_path = fs::path(argv[++i]);
        } else if (arg == "--save-config") {
            opts.save_config = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else {
            throw ArgumentException("Unknown option `" + arg + "`");
        }
    }

    return opts;
}

bool confirm(std::istream& in)
{
    std::string answer;
    if (!std::getline(in, answer)) {
        return false;
    }
    answer = toLower(trim(answer));
    return answer == "y" || answer == "yes";
}

void printPreview(const CopyQueue& queue, const Config& config, ILogger& logger)
{
    if (config.preview_entries == 0) {
        return;
    }

    SourcePreview preview = queue.previewSource(config.preview_entries);

    logger.info("Copying from `" + queue.source().string() + "`:");
    for (const auto& name : preview.names) {
        std::cout << "  " << styled(name, sgr::kDarkGrey, config.color) << "\n";
    }
    if (preview.hidden > 0) {
        std::cout << "  ... +" << preview.hidden << " more ...\n";
    }
    std::cout.flush();
}

int runDeployment(const CopyQueue& queue, const Config& config, ILogger& logger)
{
    UserInterface ui(std::cout, config.color);
    ui.withPreCopy(queue).render();

    // Lists the source, so an unreadable one stops us before the prompt
    printPreview(queue, config, logger);

    if (!config.assume_yes) {
        std::cout << "Does everything look correct? "
                  << "(You can disable this prompt with the `-y` flag) [y/N] " << std::flush;
        if (!confirm(std::cin)) {
            logger.info("Aborting copy...");
            return kExitSuccess;
        }
    }

    std::signal(SIGINT, onInterrupt);

    FilesystemCopier copier(config.chunk_size);
    auto channel = std::make_shared<ProgressChannel>(config.channel_capacity);

    std::jthread worker([&](std::stop_token stop) {
        runCopyWorker(queue, copier, logger, *channel, stop);
    });

    // Signal handlers may only touch the flag; turn it into a stop request here
    std::jthread watcher([&worker](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_interrupted.load()) {
                worker.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    ui.withCopying(channel, queue).render();

    worker.join();
    watcher.request_stop();
    watcher.join();

    CopyReport report = *ui.report();
    logger.debug(std::to_string(channel->coalesced()) + " progress updates coalesced");

    ui.withCompleted(queue, report).render();

    if (report.cancelled) {
        return kExitInterrupted;
    }
    return report.allSucceeded() ? kExitSuccess : kExitDestinationsFailed;
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    try {
        opts = parseArguments(argc, argv);
    } catch (const ArgumentException& e) {
        std::cerr << formatLogLine(std::string("error: ") + e.what(), false) << "\n";
        printUsage(argv[0]);
        return kExitArgumentError;
    }

    if (opts.help) {
        printUsage(argv[0]);
        return kExitSuccess;
    }
    if (opts.version) {
        std::cout << "decopy " << DECOPY_VERSION << "\n";
        return kExitSuccess;
    }

    // Load configuration (from file + env vars); a broken file falls back to defaults
    Config config;
    fs::path config_path;
    try {
        config_path = opts.config_path ? *opts.config_path : defaultConfigPath();
        config = loadConfig(config_path);
    } catch (const DecopyException& e) {
        std::cerr << formatLogLine(std::string("warning: failed to load config: ") + e.what(),
                                   false) << "\n";
    }

    // CLI flags beat config file and environment
    if (opts.yes) config.assume_yes = true;
    if (opts.verbose) config.verbose = true;
    if (opts.no_color) config.color = false;

    ConsoleLogger logger(std::cerr, config.verbose, config.color);

    try {
        validateConfig(config);

        if (opts.save_config) {
            if (config_path.empty()) {
                throw ConfigException("No config path available to save to");
            }
            saveConfig(config, config_path);
            logger.info("Saved configuration to `" + config_path.string() + "`");
            if (opts.source.empty()) {
                return kExitSuccess;
            }
        }
    } catch (const ConfigException& e) {
        logger.error(e.what());
        return kExitConfigError;
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        logger.error("Failed to get current directory: " + ec.message());
        return kExitInternalError;
    }

    try {
        CopyQueue queue = CopyQueue::fromArguments(cwd, opts.source, opts.destinations);
        return runDeployment(queue, config, logger);
    } catch (const ArgumentException& e) {
        logger.error(e.what());
        printUsage(argv[0]);
        return kExitArgumentError;
    } catch (const SourceUnreadableException& e) {
        logger.error(e.what());
        return kExitSourceUnreadable;
    } catch (const RenderIOException& e) {
        // stdout is gone; stderr is all that is left
        std::cerr << "decopy: " << e.what() << "\n";
        return kExitRenderError;
    } catch (const std::exception& e) {
        logger.error(std::string("Unexpected error: ") + e.what());
        return kExitInternalError;
    }
}
