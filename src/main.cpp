/**
 * fastget - parallel ranged HTTP downloader
 *
 * Main entry point for the command-line tool.
 * Loads configuration, initializes logging and runs one download or mirror.
 *
 * @version 1.0.0
 */

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadEngine.hpp"
#include "core/mirror/DirectoryMirror.hpp"
#include "utils/HttpClient.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using fastget::core::Config;
using fastget::core::Logger;
using fastget::core::LogLevel;
using fastget::utils::StringUtils;

namespace {

struct CommandLine {
    std::vector<std::string> positional;
    std::optional<int> threads;
    std::string configPath;
    bool mirror{false};
    bool debug{false};
};

void printUsage(const char* program) {
    std::cout << "fastget - parallel ranged HTTP downloader\n"
              << "\nUsage: " << program << " [options] <url> [path]\n"
              << "\nWith only <url> the resource is written to stdout.\n"
              << "\nOptions:\n"
              << "  -t, --threads N    Number of parallel range requests (0-255)\n"
              << "  -m, --mirror       Mirror a directory listing into <path>\n"
              << "  -c, --config FILE  Load configuration from FILE\n"
              << "  -d, --debug        Enable debug logging\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version information\n"
              << std::endl;
}

/**
 * Parse a worker count argument; accepts 0..255
 */
std::optional<int> parseThreads(const std::string& value) {
    auto parsed = StringUtils::parseUInt64(StringUtils::trim(value));
    if (!parsed || *parsed > static_cast<uint64_t>(fastget::core::downloader::kMaxWorkers)) {
        return std::nullopt;
    }
    return static_cast<int>(*parsed);
}

/**
 * Load the config file, creating the default one on first run
 */
bool loadConfiguration(const std::string& explicitPath) {
    auto& config = Config::instance();

    if (!explicitPath.empty()) {
        if (!config.load(explicitPath)) {
            std::cerr << "fastget: " << config.lastError() << std::endl;
            return false;
        }
        return true;
    }

    fs::path configPath = fastget::utils::PathUtils::getConfigPath();
    std::error_code ec;
    if (fs::exists(configPath, ec)) {
        if (!config.load(configPath.string())) {
            std::cerr << "fastget: " << config.lastError() << std::endl;
            return false;
        }
    } else {
        config.setDefaults();
        // A read-only home is not fatal; the defaults still apply
        if (!config.save(configPath.string())) {
            std::cerr << "fastget: cannot create " << configPath.string() << ": "
                      << config.lastError() << std::endl;
        }
    }
    return true;
}

void initializeLogging(bool debugMode) {
    auto& config = Config::instance();

    LogLevel level = debugMode
        ? LogLevel::Debug
        : Logger::levelFromString(config.get<std::string>("logging.level", "info"));

    std::string logDir = config.get<std::string>("logging.directory", "");
    if (logDir.empty()) {
        logDir = fastget::utils::PathUtils::getLogsPath().string();
    }

    Logger::instance().initialize(level, logDir);
}

fastget::core::downloader::EngineOptions engineOptionsFromConfig() {
    auto& config = Config::instance();

    fastget::core::downloader::EngineOptions options;
    options.http.userAgent = config.get<std::string>("http.userAgent", "fastget/1.0");
    options.http.timeoutSeconds = config.get<int>("http.timeoutSeconds", 0);
    options.http.connectTimeoutSeconds = config.get<int>("http.connectTimeoutSeconds", 0);
    options.http.verifySSL = config.get<bool>("http.verifySSL", true);
    options.writeBlockSize = config.get<size_t>("download.writeBlockSize", 64 * 1024);
    options.unknownLengthReserve = config.get<size_t>("download.unknownLengthReserve", 16 * 1024 * 1024);
    if (options.writeBlockSize == 0) {
        options.writeBlockSize = 64 * 1024;
    }
    return options;
}

int run(const CommandLine& cmd) {
    namespace dl = fastget::core::downloader;

    auto& config = Config::instance();
    const int workers = cmd.threads ? *cmd.threads : config.get<int>("download.workers", 1);
    const std::string& url = cmd.positional[0];

    dl::EngineOptions options = engineOptionsFromConfig();
    fastget::utils::HttpClient::instance().setDefaultOptions(options.http);
    dl::DownloadEngine engine(fastget::utils::HttpClient::instance(), options);

    if (cmd.mirror) {
        fs::path destination = cmd.positional.size() > 1 ? fs::path(cmd.positional[1]) : fs::path(".");
        fastget::core::mirror::MirrorOptions mirrorOptions;
        mirrorOptions.maxDepth = config.get<int>("mirror.maxDepth", 8);

        fastget::core::mirror::DirectoryMirror mirror(engine, mirrorOptions);
        auto result = mirror.mirror(url, destination);
        if (!result.ok()) {
            FASTGET_LOG_ERROR("Mirror failed: {}", result.error.describe());
            return 1;
        }
    } else if (cmd.positional.size() > 1) {
        dl::DownloadError error = engine.fetchToFile(url, cmd.positional[1], workers);
        if (error) {
            return 1;
        }
    } else {
        dl::MemoryDownload download = engine.fetchToMemory(url, workers);
        if (!download.ok()) {
            return 1;
        }

        if (!download.data.empty()) {
            size_t written = std::fwrite(download.data.data(), 1, download.data.size(), stdout);
            if (written != download.data.size()) {
                FASTGET_LOG_ERROR("Failed to write {} bytes to stdout", download.data.size());
                return 1;
            }
        }
        if (std::fflush(stdout) != 0) {
            FASTGET_LOG_ERROR("Failed to flush stdout");
            return 1;
        }
    }

    FASTGET_LOG_INFO("Success!");
    return 0;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cmd;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            cmd.debug = true;
        } else if (arg == "--mirror" || arg == "-m") {
            cmd.mirror = true;
        } else if (arg == "--threads" || arg == "-t") {
            if (i + 1 >= argc) {
                std::cerr << "fastget: " << arg << " needs a value" << std::endl;
                return 1;
            }
            cmd.threads = parseThreads(argv[++i]);
            if (!cmd.threads) {
                std::cerr << "fastget: invalid thread count '" << argv[i]
                          << "' (expected 0-255)" << std::endl;
                return 1;
            }
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "fastget: " << arg << " needs a value" << std::endl;
                return 1;
            }
            cmd.configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "fastget v1.0.0\n"
                      << "Built with cpr, spdlog and nlohmann::json\n"
                      << std::endl;
            return 0;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "fastget: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            cmd.positional.push_back(arg);
        }
    }

    if (cmd.positional.empty() || cmd.positional.size() > 2) {
        printUsage(argv[0]);
        return 1;
    }

    if (!loadConfiguration(cmd.configPath)) {
        return 1;
    }

    initializeLogging(cmd.debug);
    auto& logger = Logger::instance();
    logger.debug("fastget v1.0.0 starting");

    if (!fastget::utils::CurlGlobalInit::init()) {
        logger.critical("Failed to initialize libcurl");
        return 1;
    }

    int status = 1;
    try {
        status = run(cmd);
    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        status = 1;
    }

    fastget::utils::CurlGlobalInit::cleanup();
    logger.flush();
    return status;
}
