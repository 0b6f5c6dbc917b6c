#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_map>
#include "Config.h"
#include "Constants.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PathUtils.h"
#include "SyncServer.h"
#include "Version.h"

using namespace BlockSync;

namespace {

volatile std::sig_atomic_t signalReceived = 0;
volatile std::sig_atomic_t receivedSignalNum = 0;
std::atomic<bool> stopRequested{false};

void signalHandler(int signal) {
    receivedSignalNum = signal;
    signalReceived = 1;
}

bool isNumber(const std::string& value) {
    if (value.empty()) return false;
    for (char c : value) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool isPositiveInRange(const std::string& value, unsigned long max) {
    if (!isNumber(value) || value.size() > 10) return false;
    unsigned long n = std::stoul(value);
    return n > 0 && n <= max;
}

const std::unordered_map<std::string, Config::Validator>& configSchema() {
    static const std::unordered_map<std::string, Config::Validator> schema = {
        {"listen_port", [](const std::string&, const std::string& v) { return isPositiveInRange(v, 65535); }},
        {"block_size", [](const std::string&, const std::string& v) {
            return isPositiveInRange(v, bsync::config::MAX_BLOCK_SIZE);
        }},
        {"backlog", [](const std::string&, const std::string& v) { return isPositiveInRange(v, 65535); }},
        {"log_level", [](const std::string&, const std::string& v) { return parseLogLevel(v).has_value(); }},
        {"root_directory", [](const std::string&, const std::string& v) { return !v.empty(); }},
    };
    return schema;
}

void writeTemplateConfig(const std::filesystem::path& path) {
    std::ofstream templateFile(path);
    if (!templateFile.is_open()) {
        return;
    }
    templateFile << "# BlockSync daemon configuration\n";
    templateFile << "listen_address=127.0.0.1\n";
    templateFile << "listen_port=" << bsync::config::DEFAULT_TCP_PORT << "\n";
    templateFile << "root_directory=~/BlockSync\n";
    templateFile << "block_size=" << bsync::config::DELTA_BLOCK_SIZE << "\n";
    templateFile << "backlog=" << bsync::config::TCP_BACKLOG << "\n";
    templateFile << "log_level=info\n";
    templateFile << "# log_file=~/.local/share/blocksync/blocksync.log\n";
}

void printUsage(const char* argv0) {
    std::cout << "BlockSync Daemon - block-level file synchronization server" << std::endl;
    std::cout << "\nUsage: " << argv0 << " [OPTIONS]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <FILE>        Configuration file (default: $XDG_CONFIG_HOME/blocksync/blocksync.conf)" << std::endl;
    std::cout << "  --port <PORT>          TCP port to listen on (default: " << bsync::config::DEFAULT_TCP_PORT << ")" << std::endl;
    std::cout << "  --root <PATH>          Directory served to clients" << std::endl;
    std::cout << "  --block-size <BYTES>   Block size for signatures (default: " << bsync::config::DELTA_BLOCK_SIZE << ")" << std::endl;
    std::cout << "  --log-level <LEVEL>    debug, info, warn or error" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
}

void runConsole() {
    std::string line;
    while (!stopRequested && std::getline(std::cin, line)) {
        if (line == "exit" || line == "quit") {
            stopRequested = true;
        } else if (line == "stats") {
            std::cout << MetricsCollector::instance().getMetricsSummary() << std::flush;
        } else if (line == "version") {
            std::cout << "BlockSync " << Version::toString() << std::endl;
        } else if (!line.empty()) {
            std::cout << "Unknown command: " << line << " (exit, quit, stats, version)" << std::endl;
        }
    }
}

}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::INFO);
    logger.setMaxFileSize(bsync::config::MAX_LOG_FILE_SIZE_MB);
    logger.setComponent("Daemon");

    // Command line values override the configuration file
    std::string configPath;
    std::string portArg;
    std::string rootArg;
    std::string blockSizeArg;
    std::string logLevelArg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            portArg = argv[++i];
        } else if (arg == "--root" && i + 1 < argc) {
            rootArg = argv[++i];
        } else if (arg == "--block-size" && i + 1 < argc) {
            blockSizeArg = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevelArg = argv[++i];
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    Config fileConfig;
    try {
        if (configPath.empty()) {
            auto configDir = PathUtils::getConfigDir();
            PathUtils::ensureDirectory(configDir);
            auto defaultPath = configDir / "blocksync.conf";
            if (!std::filesystem::exists(defaultPath)) {
                writeTemplateConfig(defaultPath);
                logger.info("Created configuration template at " + defaultPath.string(), "Daemon");
            }
            configPath = defaultPath.string();
        }
    } catch (const std::exception& e) {
        logger.error(std::string("Cannot prepare configuration directory: ") + e.what(), "Daemon");
        return 1;
    }

    if (!fileConfig.loadFromFile(configPath)) {
        logger.error("Failed to load config file: " + configPath, "Daemon");
        return 1;
    }
    logger.info("Loaded configuration from " + configPath, "Daemon");

    if (!portArg.empty()) fileConfig.set("listen_port", portArg);
    if (!rootArg.empty()) fileConfig.set("root_directory", rootArg);
    if (!blockSizeArg.empty()) fileConfig.set("block_size", blockSizeArg);
    if (!logLevelArg.empty()) fileConfig.set("log_level", logLevelArg);

    std::string failedKey;
    if (!fileConfig.validate(configSchema(), &failedKey)) {
        logger.error("Invalid value for " + failedKey + ": '" + fileConfig.get(failedKey) + "'", "Daemon");
        return 1;
    }
    if (!fileConfig.hasKey("root_directory")) {
        logger.error("root_directory is not configured (use --root or the config file)", "Daemon");
        return 1;
    }

    if (auto level = parseLogLevel(fileConfig.get("log_level", "info"))) {
        logger.setLevel(*level);
    }
    std::string logFile = PathUtils::expandHome(fileConfig.get("log_file"));
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }

    ServerOptions options;
    options.listenAddress = fileConfig.get("listen_address", options.listenAddress);
    options.port = static_cast<uint16_t>(fileConfig.getInt("listen_port", bsync::config::DEFAULT_TCP_PORT));
    options.rootDirectory = PathUtils::expandHome(fileConfig.get("root_directory"));
    options.blockSize = static_cast<uint32_t>(fileConfig.getSize("block_size", bsync::config::DELTA_BLOCK_SIZE));
    options.backlog = fileConfig.getInt("backlog", bsync::config::TCP_BACKLOG);

    logger.info("=== BlockSync Daemon " + Version::toString() + " Starting ===", "Daemon");

    SyncServer server(options);
    if (auto started = server.start(); !started) {
        logger.critical("Failed to start server: " + started.error().message, "Daemon");
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "BlockSync daemon running on port " << server.port()
              << ". Commands: exit, quit, stats, version" << std::endl;

    // getline cannot be interrupted, so the console thread is not joined
    std::thread(runConsole).detach();

    while (!stopRequested && !signalReceived) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (signalReceived) {
        logger.info("Received signal " + std::to_string(static_cast<int>(receivedSignalNum)) + ", initiating shutdown",
                    "Daemon");
    }
    stopRequested = true;

    server.stop();
    logger.info("=== BlockSync Daemon Stopped ===", "Daemon");
    return 0;
}
