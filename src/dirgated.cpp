// DIRGATE - Gateway Daemon
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Serves one root directory over JSON-RPC.

#include "dirgate/gateway/gateway.h"
#include "dirgate/gateway/options.h"
#include "dirgate/rpc/commands.h"
#include "dirgate/rpc/server.h"
#include "dirgate/security/rate_limiter.h"
#include "dirgate/util/config.h"
#include "dirgate/util/fs.h"
#include "dirgate/util/logging.h"
#include "dirgate/util/threadpool.h"
#include "dirgate/util/time.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace dirgate {

constexpr const char* VERSION = "1.0.0";

namespace defaults {
    constexpr int64_t SWEEP_INTERVAL_SECONDS = 300;
    constexpr int64_t RPC_THREADS = 4;
}

// ============================================================================
// Signal Handling
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};

extern "C" void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Help / Version
// ============================================================================

void PrintHelp() {
    std::cout << "Usage: dirgated [options]\n\n";
    std::cout << "General Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -printconfig               Print a sample configuration file\n";
    std::cout << "  -conf=FILE                 Config file (default: " << util::DEFAULT_CONFIG_FILENAME << ")\n";
    std::cout << "\nGateway Options:\n";
    std::cout << "  -root=DIR                  Directory served to clients (default: .)\n";
    std::cout << "  -maxfilesize=N             Largest accepted upload, k/m/g suffixes (default: 10m)\n";
    std::cout << "  -maxpathlength=N           Longest accepted path (default: 260)\n";
    std::cout << "  -maxtermlength=N           Longest accepted search term (default: 100)\n";
    std::cout << "  -allowedext=LIST           Comma-separated upload extensions (default: any)\n";
    std::cout << "  -ratewindow=MINUTES        Rate limit window (default: 15)\n";
    std::cout << "  -ratemax=N                 Requests per window and operation (default: 100)\n";
    std::cout << "  -sweepinterval=SECONDS     Idle rate limit cleanup period (default: 300)\n";
    std::cout << "  -searchmaxresults=N        Search result cap (default: 10000)\n";
    std::cout << "  -searchmaxdepth=N          Search depth limit (default: 20)\n";
    std::cout << "  -searchtimeout=SECONDS     Search time budget (default: 30)\n";
    std::cout << "\nRPC Options:\n";
    std::cout << "  -bind=ADDR                 Listen address (default: 127.0.0.1)\n";
    std::cout << "  -port=PORT                 Listen port (default: " << rpc::DEFAULT_RPC_PORT << ")\n";
    std::cout << "  -threads=N                 Worker threads (default: 4)\n";
    std::cout << "  -trustproxy=0/1            Identify callers by X-Forwarded-For (default: 0)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -debug=CATEGORY            Only log these categories (can repeat)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -logfile=FILE              Also log to a rotating file\n";
    std::cout << "  -printtoconsole=0/1        Print to console (default: 1)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "dirgate daemon v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 DIRGATE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Daemon Initialization
// ============================================================================

/// Parse the command line and config file; false if startup must stop
bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        std::cerr << "Error: " << cmdResult.errorMessage << "\n";
        return false;
    }
    if (!cmdResult.warnings.empty()) {
        for (const auto& warning : cmdResult.warnings) {
            std::cerr << "Error: " << warning << "\n";
        }
        return false;
    }

    std::string confPath = config.GetPath(util::ConfigKeys::CONF);
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        confPath = util::DEFAULT_CONFIG_FILENAME;
    }

    if (util::fs::Exists(confPath)) {
        auto fileResult = config.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error in " << fileResult.errorFile;
            if (fileResult.errorLine > 0) {
                std::cerr << ":" << fileResult.errorLine;
            }
            std::cerr << ": " << fileResult.errorMessage << "\n";
            return false;
        }
        for (const auto& warning : fileResult.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }
    } else if (explicitConf) {
        std::cerr << "Error: config file not found: " << confPath << "\n";
        return false;
    }

    for (const auto& key : util::ConfigKeys::All()) {
        config.AllowKey(key);
    }
    config.AllowKey("help");
    config.AllowKey("version");
    config.AllowKey("printconfig");

    auto problems = config.Validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return false;
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useColors = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = level;
        fileConfig.rotate = true;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_WARN(util::LogCategory::DEFAULT) << "Cannot open log file " << logFile;
        }
    }

    // Bare -debug and -nodebug leave every category enabled
    std::vector<std::string> categories;
    for (const auto& category : config.GetList(util::ConfigKeys::DEBUG)) {
        if (category != "0" && category != "1") {
            categories.push_back(category);
        }
    }
    if (!categories.empty()) {
        logger.DisableAllCategories();
        for (const auto& category : categories) {
            logger.EnableCategory(category);
        }
    }
}

rpc::RPCServerConfig MakeServerConfig(const util::ConfigManager& config,
                                      const gateway::GatewayOptions& options) {
    rpc::RPCServerConfig serverConfig;
    serverConfig.bindAddress = config.GetString(util::ConfigKeys::BIND, "127.0.0.1");

    uint64_t port = config.GetUInt(util::ConfigKeys::PORT, rpc::DEFAULT_RPC_PORT);
    if (port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(port));
    }
    serverConfig.port = static_cast<uint16_t>(port);

    int64_t threads = config.GetInt(util::ConfigKeys::THREADS, defaults::RPC_THREADS);
    if (threads < 1) {
        throw std::invalid_argument("threads must be at least 1");
    }
    serverConfig.threadPoolSize = static_cast<size_t>(threads);
    serverConfig.maxRequestSize = rpc::MaxRequestSizeFor(options.maxFileSize);
    serverConfig.trustProxy = config.GetBool(util::ConfigKeys::TRUSTPROXY, false);
    return serverConfig;
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }

    if (config.GetBool("help", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (config.GetBool("printconfig", false)) {
        std::cout << util::ConfigManager::GenerateSampleConfig();
        return 0;
    }

    SetupLogging(config);

    gateway::GatewayOptions options;
    try {
        options = gateway::GatewayOptions::FromConfig(config);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid configuration: " << e.what();
        return 1;
    }

    util::fs::Path root = util::fs::Path(options.root).IsAbsolute()
        ? util::fs::Path(options.root)
        : util::fs::CurrentPath() / options.root;
    root = root.Normalize();
    if (!util::fs::IsDirectory(root)) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Root directory does not exist: " << root.String();
        return 1;
    }
    options.root = root.String();

    rpc::RPCServerConfig serverConfig;
    try {
        serverConfig = MakeServerConfig(config, options);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid configuration: " << e.what();
        return 1;
    }

    int64_t sweepSeconds = config.GetInt(util::ConfigKeys::SWEEPINTERVAL,
                                         defaults::SWEEP_INTERVAL_SECONDS);
    if (sweepSeconds < 1) {
        LOG_ERROR(util::LogCategory::CONFIG) << "sweepinterval must be at least 1 second";
        return 1;
    }

    SetupSignalHandlers();

    security::RateLimiter limiter(options.RateLimiterConfig());
    gateway::Gateway fileGateway(options, limiter);

    rpc::RPCServer server(serverConfig);
    rpc::RPCCommandTable commands(fileGateway);
    commands.RegisterCommands(server);

    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = 1;
    poolConfig.name = "maintenance";
    util::ThreadPool maintenancePool(poolConfig);
    util::Scheduler scheduler(maintenancePool);
    scheduler.Start();
    scheduler.SchedulePeriodic(std::chrono::seconds(sweepSeconds),
                               std::chrono::seconds(sweepSeconds),
                               [&limiter]() {
        size_t removed = limiter.Sweep();
        if (removed > 0) {
            LOG_DEBUG(util::LogCategory::SECURITY) << "Rate limiter sweep removed "
                << removed << " idle windows";
        }
    });

    if (!server.Start()) {
        scheduler.Stop();
        maintenancePool.Shutdown();
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "dirgate v" << VERSION << " serving "
        << options.root;

    while (!g_shutdownRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown requested after "
        << util::FormatDuration(util::Seconds(server.GetUptime())) << ", "
        << server.TotalRequests() << " requests served";
    server.Stop();
    scheduler.Stop();
    maintenancePool.Shutdown();
    util::Logger::Instance().Flush();
    return 0;
}

} // namespace dirgate

int main(int argc, char* argv[]) {
    try {
        return dirgate::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
