#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "gateway/IBackendClient.h"
#include "tools/ToolRegistry.h"
#include "core/Capabilities.h"
#include "core/ConfigManager.h"

struct GatewayOptions {
    std::chrono::milliseconds reconnectInterval{5000};
    std::chrono::milliseconds requestTimeout{10000};  // handshake and tools/list
    size_t workerThreads = 4;                         // for the gateway's own tools

    static GatewayOptions fromConfig(const Config& cfg);
};

using BackendFactory = std::function<std::unique_ptr<IBackendClient>(const Config::BackendConfig&)>;

/**
 * @brief One catalog over many backends.
 *
 * Listing merges the gateway's own tools with every connected backend's
 * tools in configuration order; on a name clash the earlier entry wins and
 * the later one is only reachable as "<backend>.<tool>". Backends that are
 * down are left out of the listing and retried by the refresh task on a
 * fixed interval.
 *
 * The refresh task is the only writer. It publishes an immutable Snapshot
 * through an atomic shared_ptr swap, so readers never lock.
 */
class GatewayAggregator : public IToolCatalog {
public:
    GatewayAggregator(std::vector<Config::BackendConfig> backends, const ServerCapabilities& capabilities,
                      GatewayOptions options, BackendFactory factory = nullptr);
    ~GatewayAggregator() override;

    GatewayAggregator(const GatewayAggregator&) = delete;
    GatewayAggregator& operator=(const GatewayAggregator&) = delete;

    // First refresh pass in the caller's thread, then the background task.
    void start();
    void stop();

    // One synchronous refresh pass.
    void refresh();

    std::vector<ToolDescriptor> listTools() const override;
    InvocationOutcome invoke(const std::string& name, const nlohmann::json& arguments,
                             const CallContext& ctx) override;
    uint64_t generation() const override { return generationCounter.load(); }

    // Status rows in configuration order.
    nlohmann::json listServers() const;
    std::optional<nlohmann::json> getServerInfo(const std::string& name) const;

    static std::unique_ptr<IBackendClient> makeDefaultClient(const Config::BackendConfig& config,
                                                             const ServerCapabilities& capabilities);

private:
    struct Route {
        std::string backend;
        std::string toolName;  // name as the backend knows it
        ToolDescriptor descriptor;
        std::shared_ptr<IBackendClient> client;
    };

    struct BackendStatus {
        std::string name;
        std::string kind;
        std::string target;
        bool connected = false;
        size_t toolCount = 0;
        std::string error;
        nlohmann::json serverInfo = nlohmann::json::object();
        std::vector<std::string> tools;
    };

    struct Snapshot {
        std::vector<ToolDescriptor> tools;  // merged listing, winners only
        std::unordered_map<std::string, Route> byName;
        std::unordered_map<std::string, Route> byQualifiedName;
        std::vector<BackendStatus> backends;
    };

    struct Slot {
        Config::BackendConfig config;
        std::shared_ptr<IBackendClient> client;
        std::vector<ToolDescriptor> tools;
        std::chrono::steady_clock::time_point lastAttempt;
        bool attempted = false;
        bool reportedDown = false;
        std::string error;
    };

    void refreshSlot(Slot& slot);
    std::shared_ptr<Snapshot> buildSnapshot();
    std::shared_ptr<const Snapshot> current() const;
    void refreshLoop();

    std::vector<ToolDefinition> gatewayTools();

    const ServerCapabilities& capabilities;
    const GatewayOptions options;
    BackendFactory factory;
    std::unique_ptr<ToolRegistry> local;

    std::mutex refreshMutex;
    std::vector<Slot> slots;

    std::shared_ptr<const Snapshot> snapshot;
    std::atomic<uint64_t> generationCounter{0};
    std::vector<std::string> lastNames;
    std::vector<std::string> lastCollisions;

    std::mutex stopMutex;
    std::condition_variable stopCv;
    bool stopRequested = false;
    std::thread refreshThread;
};
