/**
 * ftpget - retrieve one file over FTP
 *
 * Command line front-end. Starts a background transfer and acts as its
 * foreground caller: polls progress, prints it, and turns SIGINT/SIGTERM
 * into an abort request.
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/ftp/CurlFtpClient.hpp"
#include "core/transfer/Transfer.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using ftpget::core::Config;
using ftpget::core::Logger;
using ftpget::core::LogLevel;
using ftpget::core::transfer::Transfer;
using ftpget::core::transfer::TransferRequest;
using ftpget::core::transfer::TransferState;
using ftpget::utils::StringUtils;

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitDone = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitAborted = 130;

// 0 selects the default chunk size
constexpr int64_t kMaxChunkSize = 64 * 1024 * 1024;

volatile std::sig_atomic_t g_interrupted = 0;

/**
 * Signal handler: only records the request, the poll loop acts on it
 */
void signalHandler(int) {
    g_interrupted = 1;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

struct CommandLine {
    std::vector<std::string> positional;
    std::optional<bool> binary;
    std::optional<bool> overwrite;
    std::optional<bool> createDir;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> label;
    std::optional<std::string> configPath;
    std::optional<uint16_t> port;
    bool debug{false};
};

void printUsage(const char* program) {
    std::cout << "ftpget - retrieve one file over FTP\n"
              << "\nUsage: " << program << " [options] <host> <remote-path> <local-path>\n"
              << "\nOptions:\n"
              << "  -a, --ascii          Transfer in ASCII mode (default binary)\n"
              << "  -o, --overwrite      Replace an existing local file\n"
              << "      --no-create-dir  Fail if the local directory is missing\n"
              << "  -u, --user NAME      Login name (default anonymous)\n"
              << "  -p, --password PASS  Password\n"
              << "  -P, --port PORT      Control port (default 21)\n"
              << "  -l, --label TEXT     Text shown while downloading\n"
              << "  -c, --config FILE    Configuration file\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Parse argv; returns an exit code when the program should stop right away
 */
std::optional<int> parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto nextValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return kExitDone;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "ftpget v" << kVersion << "\n"
                      << "Built with libcurl " << curl_version_info(CURLVERSION_NOW)->version
                      << std::endl;
            return kExitDone;
        } else if (arg == "--debug" || arg == "-d") {
            cmd.debug = true;
        } else if (arg == "--ascii" || arg == "-a") {
            cmd.binary = false;
        } else if (arg == "--overwrite" || arg == "-o") {
            cmd.overwrite = true;
        } else if (arg == "--no-create-dir") {
            cmd.createDir = false;
        } else if (arg == "--user" || arg == "-u") {
            if (!nextValue(value)) return kExitUsage;
            cmd.username = value;
        } else if (arg == "--password" || arg == "-p") {
            if (!nextValue(value)) return kExitUsage;
            cmd.password = value;
        } else if (arg == "--label" || arg == "-l") {
            if (!nextValue(value)) return kExitUsage;
            cmd.label = value;
        } else if (arg == "--config" || arg == "-c") {
            if (!nextValue(value)) return kExitUsage;
            cmd.configPath = value;
        } else if (arg == "--port" || arg == "-P") {
            if (!nextValue(value)) return kExitUsage;
            auto port = StringUtils::parseLong(value);
            if (!port || *port <= 0 || *port > 65535) {
                std::cerr << "Invalid port: " << value << "\n";
                return kExitUsage;
            }
            cmd.port = static_cast<uint16_t>(*port);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return kExitUsage;
        } else {
            cmd.positional.push_back(arg);
        }
    }

    if (cmd.positional.size() != 3) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    return std::nullopt;
}

/**
 * Load the configuration file named on the command line, or the default
 * one when it exists
 */
bool loadConfiguration(const CommandLine& cmd) {
    auto& config = Config::instance();

    if (cmd.configPath) {
        if (!config.load(*cmd.configPath)) {
            std::cerr << "Cannot read configuration " << *cmd.configPath << "\n";
            return false;
        }
        return true;
    }

    const fs::path defaultPath = ftpget::utils::PathUtils::getConfigPath();
    std::error_code ec;
    if (fs::exists(defaultPath, ec) && !config.load(defaultPath.string())) {
        std::cerr << "Ignoring unreadable configuration " << defaultPath.string() << "\n";
    }
    return true;
}

/**
 * Build the request from the command line over the configuration
 * @throws std::out_of_range for a configured port or chunk size out of range
 */
TransferRequest buildRequest(const CommandLine& cmd) {
    auto& config = Config::instance();

    TransferRequest request;
    request.host = cmd.positional[0];
    request.remotePath = cmd.positional[1];
    request.localPath = cmd.positional[2];
    request.port = cmd.port ? *cmd.port
                            : static_cast<uint16_t>(config.getInRange("ftp.port", 21, 1, 65535));
    request.isBinary = cmd.binary.value_or(config.get<bool>("transfer.binary", true));
    request.overwrite = cmd.overwrite.value_or(config.get<bool>("transfer.overwrite", false));
    request.createDir = cmd.createDir.value_or(config.get<bool>("transfer.createDir", true));
    request.displayLabel = cmd.label;
    request.username = cmd.username ? cmd.username
                                    : std::optional<std::string>(config.get<std::string>("ftp.username"));
    request.password = cmd.password ? cmd.password
                                    : std::optional<std::string>(config.get<std::string>("ftp.password"));
    request.chunkSize = static_cast<std::size_t>(config.getInRange(
        "transfer.chunkSize", static_cast<int64_t>(Transfer::kDefaultChunkSize),
        0, kMaxChunkSize));
    return request;
}

std::string progressLine(const Transfer& transfer) {
    const auto state = transfer.state();
    const auto bytesRead = transfer.bytesRead();
    const auto totalBytes = transfer.totalBytes();

    std::string line = transfer.displayLabel() + "  " +
        StringUtils::padRight(std::string(toString(state)),
                              ftpget::core::transfer::kMaxStateNameLength) +
        "  " + StringUtils::formatBytes(bytesRead);

    if (totalBytes) {
        line += " / " + StringUtils::formatBytes(*totalBytes);
        if (*totalBytes > 0) {
            line += " (" + StringUtils::formatPercentage(
                static_cast<double>(bytesRead) / static_cast<double>(*totalBytes)) + ")";
        }
    }
    return line;
}

} // namespace

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (auto exitCode = parseCommandLine(argc, argv, cmd)) {
        return *exitCode;
    }

    if (!loadConfiguration(cmd)) {
        return kExitUsage;
    }

    auto& config = Config::instance();
    auto& logger = Logger::instance();
    logger.initialize(
        cmd.debug ? LogLevel::Debug : Logger::parseLevel(config.get<std::string>("logging.level", "info")),
        config.get<std::string>("logging.directory", "")
    );
    logger.debug("ftpget v{} starting", kVersion);

    setupSignalHandlers();

    const long connectTimeout = config.get<long>("ftp.connectTimeoutSeconds", 30);
    const auto pollInterval = std::chrono::milliseconds(config.get<int>("ui.pollIntervalMs", 200));

    TransferRequest request;
    try {
        request = buildRequest(cmd);
    } catch (const std::out_of_range& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return kExitUsage;
    }

    try {
        ftpget::core::transfer::TransferDependencies dependencies;
        dependencies.ftpClientFactory = [connectTimeout] {
            return std::make_unique<ftpget::core::ftp::CurlFtpClient>(connectTimeout);
        };

        Transfer transfer(std::move(request), true, std::move(dependencies));

        while (!transfer.waitForCompletion(pollInterval)) {
            if (g_interrupted && transfer.isAbortable()) {
                transfer.abort();
            }
            std::cout << "\r" << progressLine(transfer) << std::flush;
        }
        std::cout << "\r" << progressLine(transfer) << std::endl;

        switch (transfer.state()) {
            case TransferState::Done:
                return kExitDone;
            case TransferState::Aborted:
                return kExitAborted;
            default:
                if (auto cause = transfer.failureCause()) {
                    std::cerr << toString(cause->kind) << ": " << cause->message << std::endl;
                }
                return kExitFailed;
        }

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        return kExitFailed;
    }
}
