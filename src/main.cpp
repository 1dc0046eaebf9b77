// main file for pi-hole synchronization

#include <atomic>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "configuration.hpp"
#include "metrics_collector.hpp"
#include "sync_errors.hpp"
#include "sync_manager.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SYNC_FAILED = 1;
constexpr int EXIT_BAD_CONFIG = 2;

struct Options {
    std::string configPath = DEFAULT_CONFIG_PATH;
    std::string logLevel = "info";
    std::string logFile;
    bool once = false;
    bool initialSync = true;
};

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void setupLogging(const Options& options) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!options.logFile.empty()) {
        try {
            const std::filesystem::path logPath(options.logFile);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.logFile,
                5 * 1024 * 1024, // 5MB max file size
                3);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            std::cerr << "Failed to initialize file logging: " << e.what() << std::endl;
            std::cerr << "Continuing with console logging only" << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("pihole_sync", sinks.begin(), sinks.end());
    logger->set_level(parseLevel(options.logLevel));
    spdlog::set_default_logger(logger);
}

/// @return nullopt when --help was printed
std::optional<Options> parseArguments(int argc, char* argv[]) {
    cxxopts::Options parser("pihole-sync", "Replicate a main Pi-hole's configuration to secondaries");
    parser.add_options()
        ("c,config", "Path to configuration file",
         cxxopts::value<std::string>()->default_value(DEFAULT_CONFIG_PATH))
        ("l,log-level", "Log level (trace, debug, info, warn, error)",
         cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Log file path", cxxopts::value<std::string>())
        ("once", "Run a single sync cycle and exit", cxxopts::value<bool>()->default_value("false"))
        ("no-initial-sync", "Do not sync before the first trigger",
         cxxopts::value<bool>()->default_value("false"))
        ("command", "Command to run (sync)", cxxopts::value<std::string>()->default_value("sync"))
        ("h,help", "Print usage");
    parser.parse_positional({"command"});
    parser.positional_help("sync");

    const auto result = parser.parse(argc, argv);
    if (result.count("help")) {
        std::cout << parser.help() << std::endl;
        return std::nullopt;
    }

    const auto command = result["command"].as<std::string>();
    if (command != "sync") {
        throw ConfigurationError("unknown command '" + command + "'");
    }

    Options options;
    options.configPath = result["config"].as<std::string>();
    options.logLevel = result["log-level"].as<std::string>();
    if (result.count("log-file")) {
        options.logFile = result["log-file"].as<std::string>();
    }
    options.once = result["once"].as<bool>();
    options.initialSync = !result["no-initial-sync"].as<bool>();
    return options;
}

/// Waits for SIGINT/SIGTERM on its own thread. The signals must already be
/// blocked in every thread.
class SignalWaiter {
public:
    SignalWaiter(const sigset_t& signals, std::function<void(int)> onSignal)
        : m_signals(signals), m_onSignal(std::move(onSignal)), m_thread([this] { wait(); }) {}

    ~SignalWaiter() {
        m_finished = true;
        pthread_kill(m_thread.native_handle(), SIGTERM);
        m_thread.join();
    }

    SignalWaiter(const SignalWaiter&) = delete;
    SignalWaiter& operator=(const SignalWaiter&) = delete;

private:
    void wait() {
        int signal = 0;
        if (sigwait(&m_signals, &signal) == 0 && !m_finished) {
            m_onSignal(signal);
        }
    }

    sigset_t m_signals;
    std::function<void(int)> m_onSignal;
    std::atomic<bool> m_finished{false};
    std::thread m_thread;
};

} // namespace

int main(int argc, char* argv[]) {
    std::optional<Options> options;
    try {
        options = parseArguments(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing command line options: " << e.what() << std::endl;
        return EXIT_BAD_CONFIG;
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_BAD_CONFIG;
    }
    if (!options) {
        return EXIT_OK;
    }

    setupLogging(*options);

    std::shared_ptr<Configuration> config;
    try {
        config = std::make_shared<Configuration>(Configuration::loadFile(options->configPath));
    } catch (const SyncError& e) {
        // ConfigurationError and FilterConfigError
        spdlog::error("Invalid configuration: {}", e.what());
        return EXIT_BAD_CONFIG;
    }
    spdlog::info("Loaded {} with {} secondaries", options->configPath, config->secondaries.size());

    // Block the shutdown signals before any thread exists so that only the
    // waiter below receives them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    int exitCode = EXIT_OK;
    try {
        SyncManager sync_manager{config, std::make_unique<MetricsCollector>()};

        SignalWaiter waiter(signals, [&sync_manager](int signal) {
            spdlog::info("Received signal {}, initiating shutdown...", signal == SIGINT ? "SIGINT" : "SIGTERM");
            sync_manager.stop();
        });

        if (options->once) {
            const CycleResult result = sync_manager.runOnce();
            exitCode = result.ok() ? EXIT_OK : EXIT_SYNC_FAILED;
        } else {
            spdlog::info("Sync trigger mode: {}", toString(config->sync.triggerMode));
            sync_manager.run(options->initialSync);
        }
    } catch (const ConfigurationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return EXIT_BAD_CONFIG;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_SYNC_FAILED;
    }

    spdlog::info("pihole-sync exiting with code {}", exitCode);
    return exitCode;
}
