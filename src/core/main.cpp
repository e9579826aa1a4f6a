#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

#include "core/ConfigManager.h"
#include "core/Capabilities.h"
#include "gateway/GatewayAggregator.h"
#include "session/SessionManager.h"
#include "tools/BuiltinTools.h"
#include "tools/ToolRegistry.h"
#include "transport/SseTransport.h"
#include "transport/StdioTransport.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
void printUsage() {
    std::cerr << "Usage: switchboard [options]\n"
              << "  --config <path>        configuration file (default: ./config.json if present)\n"
              << "  --transport <kind>     stdio | sse\n"
              << "  --host <addr>          bind address for sse\n"
              << "  --port <n>             bind port for sse\n"
              << "  --log-level <level>    DEBUG | INFO | WARNING | ERROR\n"
              << "  -h, --help             show this help\n";
}

struct CliOptions {
    std::string configPath;
    std::string transport;
    std::string host;
    int port = -1;
    std::string logLevel;
    bool help = false;
};

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("Missing value for " + arg);
            return argv[++i];
        };
        if (arg == "-h" || arg == "--help") {
            cli.help = true;
        } else if (arg == "--config") {
            cli.configPath = value();
        } else if (arg == "--transport") {
            cli.transport = value();
        } else if (arg == "--host") {
            cli.host = value();
        } else if (arg == "--port") {
            std::string v = value();
            try {
                cli.port = std::stoi(v);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid port: " + v);
            }
        } else if (arg == "--log-level") {
            cli.logLevel = value();
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }
    return cli;
}
} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    Config cfg;
    try {
        cli = parseArgs(argc, argv);
        if (cli.help) {
            printUsage();
            return 0;
        }

        std::string configPath = cli.configPath;
        if (configPath.empty() && fs::exists(fs::u8path("config.json"))) {
            configPath = "config.json";
        }
        if (!configPath.empty()) {
            cfg = Config::load(configPath);
        }

        if (!cli.transport.empty()) cfg.server.transport = cli.transport;
        if (!cli.host.empty()) cfg.server.host = cli.host;
        if (cli.port >= 0) cfg.server.port = cli.port;
        if (!cli.logLevel.empty()) cfg.logging.level = cli.logLevel;
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "switchboard: " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    Logger& logger = Logger::getInstance();
    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(cfg.logging.level, level)) {
        std::cerr << "switchboard: unknown log level " << cfg.logging.level << std::endl;
        return 1;
    }
    logger.setLevel(level);
    logger.setLogFile(cfg.logging.file);

    // Signals are taken by one dedicated thread; every thread started below inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        ServerCapabilities capabilities = ServerCapabilities::fromConfig(cfg);

        std::unique_ptr<ToolRegistry> registry;
        std::unique_ptr<GatewayAggregator> gateway;
        IToolCatalog* catalog = nullptr;
        if (cfg.gateway.backends.empty()) {
            registry = std::make_unique<ToolRegistry>(BuiltinTools::all(capabilities), capabilities,
                                                      cfg.performance.workerThreads);
            catalog = registry.get();
            logger.info("Serving " + std::to_string(registry->getToolCount()) + " local tools");
        } else {
            gateway = std::make_unique<GatewayAggregator>(cfg.gateway.backends, capabilities,
                                                          GatewayOptions::fromConfig(cfg));
            gateway->start();
            catalog = gateway.get();
            logger.info("Gateway mode with " + std::to_string(cfg.gateway.backends.size()) + " backends");
        }

        SessionManager sessions(*catalog, capabilities, SessionOptions::fromConfig(cfg));

        std::unique_ptr<ITransport> transport;
        if (cfg.server.transport == "sse") {
            transport = std::make_unique<SseTransport>(sessions, SseOptions::fromConfig(cfg));
        } else {
            transport = std::make_unique<StdioTransport>(sessions);
        }

        if (!transport->start()) {
            logger.error("Failed to start " + transport->name() + " transport");
            if (gateway) gateway->stop();
            return 1;
        }
        logger.info(capabilities.serverName + " " + capabilities.serverVersion + " ready on " + transport->name());

        std::atomic<bool> signalled{false};
        std::atomic<bool> finished{false};
        std::thread signalThread([&transport, &logger, &signalled, &finished, signals]() {
            int sig = 0;
            if (sigwait(&signals, &sig) == 0 && !finished.load()) {
                signalled.store(true);
                logger.info("Received signal " + std::to_string(sig) + ", shutting down");
                transport->stop();
            }
        });

        transport->run();

        // A stdio session can end on its own; wake the signal thread in that case.
        finished.store(true);
        if (!signalled.load()) pthread_kill(signalThread.native_handle(), SIGTERM);
        signalThread.join();

        sessions.shutdown();
        if (gateway) gateway->stop();
        logger.info("Shutdown complete");
    } catch (const std::exception& e) {
        logger.error("FATAL ERROR: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
