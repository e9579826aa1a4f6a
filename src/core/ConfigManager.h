#pragma once
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Server {
        std::string name = "switchboard";
        std::string version = "1.0.0";
        std::string transport = "stdio";  // "stdio" or "sse"
        std::string host = "0.0.0.0";
        int port = 3020;
    } server;

    struct Logging {
        std::string level = "INFO";
        std::string file;
    } logging;

    struct SSE {
        std::string endpoint = "/sse";
        std::string messageEndpoint = "/messages";
        std::string healthEndpoint = "/health";
        double keepaliveInterval = 15.0;  // seconds, 0.1 - 30
        int maxConnections = 100;
        size_t maxQueueSize = 1000;
        std::vector<std::string> corsOrigins{"*"};
        std::vector<std::string> corsMethods{"GET", "POST", "OPTIONS"};
        std::vector<std::string> corsHeaders{"Content-Type", "Accept", "Cache-Control"};
        int corsMaxAge = 86400;
        int maxWriteFailures = 3;
    } sse;

    struct Performance {
        double toolTimeout = 30.0;  // seconds
        size_t maxInFlight = 16;    // per session
        size_t workerThreads = 8;
        double drainGrace = 5.0;    // seconds
        double idleTimeout = 0.0;   // seconds, 0 disables
    } performance;

    struct Protocol {
        std::vector<std::string> supportedVersions{"2025-06-18", "2025-03-26", "2024-11-05", "1.0"};
    } protocol;

    struct BackendConfig {
        std::string name;
        // process-spawned
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        // network-attached
        std::string url;
        std::string endpoint = "/sse";

        bool isNetwork() const { return !url.empty(); }
    };

    struct Gateway {
        double reconnectInterval = 5.0;  // seconds
        std::vector<BackendConfig> backends;
    } gateway;

    static constexpr size_t kMaxArgs = 64;
    static constexpr size_t kMaxArgLength = 512;
    static constexpr size_t kMaxBackends = 64;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        Config cfg;
        try {
            if (j.contains("server")) {
                const auto& s = j["server"];
                cfg.server.name = s.value("name", cfg.server.name);
                cfg.server.version = s.value("version", cfg.server.version);
                cfg.server.transport = s.value("transport", cfg.server.transport);
                cfg.server.host = s.value("host", cfg.server.host);
                cfg.server.port = s.value("port", cfg.server.port);
            }

            if (j.contains("logging")) {
                const auto& l = j["logging"];
                cfg.logging.level = l.value("level", cfg.logging.level);
                cfg.logging.file = l.value("file", cfg.logging.file);
            }

            if (j.contains("sse")) {
                const auto& s = j["sse"];
                cfg.sse.endpoint = s.value("endpoint", cfg.sse.endpoint);
                cfg.sse.messageEndpoint = s.value("message_endpoint", cfg.sse.messageEndpoint);
                cfg.sse.healthEndpoint = s.value("health_endpoint", cfg.sse.healthEndpoint);
                cfg.sse.keepaliveInterval = s.value("keepalive_interval", cfg.sse.keepaliveInterval);
                cfg.sse.maxConnections = s.value("max_connections", cfg.sse.maxConnections);
                cfg.sse.maxQueueSize = s.value("max_queue_size", cfg.sse.maxQueueSize);
                cfg.sse.corsOrigins = s.value("cors_origins", cfg.sse.corsOrigins);
                cfg.sse.corsMethods = s.value("cors_methods", cfg.sse.corsMethods);
                cfg.sse.corsHeaders = s.value("cors_headers", cfg.sse.corsHeaders);
                cfg.sse.corsMaxAge = s.value("cors_max_age", cfg.sse.corsMaxAge);
                cfg.sse.maxWriteFailures = s.value("max_write_failures", cfg.sse.maxWriteFailures);
            }

            if (j.contains("performance")) {
                const auto& p = j["performance"];
                cfg.performance.toolTimeout = p.value("tool_timeout", cfg.performance.toolTimeout);
                cfg.performance.maxInFlight = p.value("max_in_flight", cfg.performance.maxInFlight);
                cfg.performance.workerThreads = p.value("worker_threads", cfg.performance.workerThreads);
                cfg.performance.drainGrace = p.value("drain_grace", cfg.performance.drainGrace);
                cfg.performance.idleTimeout = p.value("idle_timeout", cfg.performance.idleTimeout);
            }

            if (j.contains("protocol")) {
                cfg.protocol.supportedVersions =
                    j["protocol"].value("supported_versions", cfg.protocol.supportedVersions);
            }

            if (j.contains("gateway")) {
                const auto& g = j["gateway"];
                cfg.gateway.reconnectInterval = g.value("reconnect_interval", cfg.gateway.reconnectInterval);
                if (g.contains("backends")) {
                    for (const auto& item : g["backends"]) {
                        BackendConfig backend;
                        backend.name = item.value("name", "");
                        backend.command = item.value("command", "");
                        backend.args = item.value("args", std::vector<std::string>{});
                        backend.env = item.value("env", std::map<std::string, std::string>{});
                        backend.url = item.value("url", "");
                        backend.endpoint = item.value("endpoint", backend.endpoint);
                        cfg.gateway.backends.push_back(std::move(backend));
                    }
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        cfg.validate();
        return cfg;
    }

    void validate() const {
        if (server.transport != "stdio" && server.transport != "sse") {
            throw std::runtime_error("server.transport must be \"stdio\" or \"sse\", got \"" + server.transport + "\"");
        }
        if (server.port < 0 || server.port > 65535) {
            throw std::runtime_error("server.port out of range: " + std::to_string(server.port));
        }
        if (sse.keepaliveInterval < 0.1 || sse.keepaliveInterval > 30.0) {
            throw std::runtime_error("sse.keepalive_interval must be within 0.1 and 30 seconds");
        }
        if (sse.maxConnections <= 0) {
            throw std::runtime_error("sse.max_connections must be positive");
        }
        if (sse.maxQueueSize == 0) {
            throw std::runtime_error("sse.max_queue_size must be positive");
        }
        if (sse.maxWriteFailures <= 0) {
            throw std::runtime_error("sse.max_write_failures must be positive");
        }
        if (performance.toolTimeout <= 0.0) {
            throw std::runtime_error("performance.tool_timeout must be positive");
        }
        if (performance.maxInFlight == 0) {
            throw std::runtime_error("performance.max_in_flight must be positive");
        }
        if (performance.workerThreads == 0) {
            throw std::runtime_error("performance.worker_threads must be positive");
        }
        if (performance.drainGrace < 0.0 || performance.idleTimeout < 0.0) {
            throw std::runtime_error("performance.drain_grace and performance.idle_timeout must not be negative");
        }
        if (protocol.supportedVersions.empty()) {
            throw std::runtime_error("protocol.supported_versions must not be empty");
        }
        if (gateway.reconnectInterval <= 0.0) {
            throw std::runtime_error("gateway.reconnect_interval must be positive");
        }
        if (gateway.backends.size() > kMaxBackends) {
            throw std::runtime_error("Too many gateway backends");
        }

        std::vector<std::string> seen;
        for (const auto& backend : gateway.backends) {
            if (backend.name.empty() || backend.name.find('.') != std::string::npos) {
                throw std::runtime_error("Backend name must be non-empty and contain no '.': \"" + backend.name + "\"");
            }
            for (const auto& other : seen) {
                if (other == backend.name) {
                    throw std::runtime_error("Duplicate backend name: " + backend.name);
                }
            }
            seen.push_back(backend.name);

            if (backend.isNetwork()) {
                if (backend.url.rfind("http://", 0) != 0 && backend.url.rfind("https://", 0) != 0) {
                    throw std::runtime_error("Invalid URL for backend " + backend.name);
                }
                continue;
            }
            if (!isSafeArg(backend.command)) {
                throw std::runtime_error("Unsafe or missing command for backend " + backend.name);
            }
            if (backend.args.size() > kMaxArgs) {
                throw std::runtime_error("Too many args for backend " + backend.name);
            }
            for (const auto& arg : backend.args) {
                if (!isSafeArg(arg)) {
                    throw std::runtime_error("Unsafe arg for backend " + backend.name);
                }
            }
        }
    }

    static bool isSafeArg(const std::string& arg) {
        if (arg.empty() || arg.size() > kMaxArgLength) return false;
        return arg.find('\0') == std::string::npos &&
               arg.find('\n') == std::string::npos &&
               arg.find('\r') == std::string::npos;
    }
};
