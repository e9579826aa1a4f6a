#include "gateway/GatewayAggregator.h"
#include "gateway/StdioBackendClient.h"
#include "gateway/SseBackendClient.h"
#include "tools/BuiltinTools.h"
#include "utils/Logger.h"
#include <algorithm>
#include <set>

namespace {
std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}
} // namespace

GatewayOptions GatewayOptions::fromConfig(const Config& cfg) {
    GatewayOptions o;
    o.reconnectInterval = toMillis(cfg.gateway.reconnectInterval);
    o.requestTimeout = std::min(toMillis(cfg.performance.toolTimeout), std::chrono::milliseconds(10000));
    o.workerThreads = cfg.performance.workerThreads;
    return o;
}

std::unique_ptr<IBackendClient> GatewayAggregator::makeDefaultClient(const Config::BackendConfig& config,
                                                                     const ServerCapabilities& capabilities) {
    BackendOptions options;
    options.name = config.name;
    options.protocolVersion = capabilities.protocolVersions.front();
    options.clientName = capabilities.serverName;
    options.clientVersion = capabilities.serverVersion;
    if (config.isNetwork()) {
        return std::make_unique<SseBackendClient>(config, options);
    }
    return std::make_unique<StdioBackendClient>(config, options);
}

GatewayAggregator::GatewayAggregator(std::vector<Config::BackendConfig> backends,
                                     const ServerCapabilities& capabilities, GatewayOptions options,
                                     BackendFactory factory)
    : capabilities(capabilities), options(options), factory(std::move(factory)) {
    if (!this->factory) {
        this->factory = [&capabilities](const Config::BackendConfig& config) {
            return makeDefaultClient(config, capabilities);
        };
    }
    for (auto& config : backends) {
        Slot slot;
        slot.config = std::move(config);
        slots.push_back(std::move(slot));
    }
    local = std::make_unique<ToolRegistry>(gatewayTools(), capabilities, options.workerThreads);
    std::atomic_store(&snapshot, std::shared_ptr<const Snapshot>(buildSnapshot()));
}

GatewayAggregator::~GatewayAggregator() {
    stop();
    std::lock_guard<std::mutex> lock(refreshMutex);
    for (auto& slot : slots) {
        if (slot.client) slot.client->close();
    }
}

std::vector<ToolDefinition> GatewayAggregator::gatewayTools() {
    std::vector<ToolDefinition> defs;
    defs.push_back(BuiltinTools::healthCheck(capabilities));

    ToolDefinition listServersTool;
    listServersTool.descriptor.name = "list_servers";
    listServersTool.descriptor.description = "List the backend servers behind this gateway with their connection state";
    listServersTool.descriptor.inputSchema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"additionalProperties", false}
    };
    listServersTool.handler = [this](const nlohmann::json&, const CallContext&) {
        return ToolResult::text(listServers().dump(2));
    };
    defs.push_back(std::move(listServersTool));

    ToolDefinition serverInfoTool;
    serverInfoTool.descriptor.name = "get_server_info";
    serverInfoTool.descriptor.description = "Show configuration, state and tools of one backend server";
    serverInfoTool.descriptor.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"server_name", {{"type", "string"}, {"minLength", 1}, {"description", "Backend name"}}}
        }},
        {"required", {"server_name"}},
        {"additionalProperties", false}
    };
    serverInfoTool.handler = [this](const nlohmann::json& args, const CallContext&) {
        std::string name = args["server_name"].get<std::string>();
        auto info = getServerInfo(name);
        if (!info) {
            return ToolResult::text("Server " + name + " not found", true);
        }
        return ToolResult::text(info->dump(2));
    };
    defs.push_back(std::move(serverInfoTool));

    return defs;
}

void GatewayAggregator::start() {
    refresh();
    {
        std::lock_guard<std::mutex> lock(stopMutex);
        stopRequested = false;
    }
    refreshThread = std::thread(&GatewayAggregator::refreshLoop, this);
}

void GatewayAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex);
        stopRequested = true;
    }
    stopCv.notify_all();
    if (refreshThread.joinable()) refreshThread.join();
}

void GatewayAggregator::refreshLoop() {
    std::unique_lock<std::mutex> lock(stopMutex);
    while (!stopCv.wait_for(lock, options.reconnectInterval, [this] { return stopRequested; })) {
        lock.unlock();
        try {
            refresh();
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("Gateway refresh failed: ") + e.what());
        }
        lock.lock();
    }
}

void GatewayAggregator::refreshSlot(Slot& slot) {
    auto now = std::chrono::steady_clock::now();

    if (slot.client && !slot.client->isConnected()) {
        slot.error = slot.client->lastError();
        slot.client->close();
        slot.client.reset();
        slot.tools.clear();
    }

    if (!slot.client) {
        if (slot.attempted && now - slot.lastAttempt < options.reconnectInterval) return;
        slot.attempted = true;
        slot.lastAttempt = now;

        std::shared_ptr<IBackendClient> client = factory(slot.config);
        if (!client || !client->connect(options.requestTimeout)) {
            slot.error = client ? client->lastError() : "no client for backend";
            if (client) client->close();
            if (!slot.reportedDown) {
                Logger::getInstance().warn("Backend " + slot.config.name + " unavailable: " + slot.error +
                                           "; retrying every " + std::to_string(options.reconnectInterval.count()) + "ms");
                slot.reportedDown = true;
            }
            return;
        }
        slot.client = client;
        slot.error.clear();
        if (slot.reportedDown) {
            Logger::getInstance().info("Backend " + slot.config.name + " reconnected");
            slot.reportedDown = false;
        }
    }

    auto tools = slot.client->listTools(options.requestTimeout);
    if (!tools) {
        slot.error = slot.client->lastError();
        Logger::getInstance().warn("Backend " + slot.config.name + " failed to list tools: " + slot.error);
        slot.client->close();
        slot.client.reset();
        slot.tools.clear();
        slot.reportedDown = true;
        slot.lastAttempt = now;
        return;
    }
    slot.tools = std::move(*tools);
}

void GatewayAggregator::refresh() {
    std::lock_guard<std::mutex> lock(refreshMutex);
    for (auto& slot : slots) {
        refreshSlot(slot);
    }
    std::atomic_store(&snapshot, std::shared_ptr<const Snapshot>(buildSnapshot()));
}

std::shared_ptr<GatewayAggregator::Snapshot> GatewayAggregator::buildSnapshot() {
    auto snap = std::make_shared<Snapshot>();
    std::set<std::string> taken;
    std::vector<std::string> collisions;

    if (local) {
        for (const auto& descriptor : local->listTools()) {
            snap->tools.push_back(descriptor);
            taken.insert(descriptor.name);
        }
    }

    for (const auto& slot : slots) {
        BackendStatus status;
        status.name = slot.config.name;
        status.kind = slot.config.isNetwork() ? "network" : "process";
        status.target = slot.config.isNetwork() ? slot.config.url + slot.config.endpoint : slot.config.command;
        status.connected = slot.client != nullptr;
        status.error = slot.error;

        if (slot.client) {
            status.serverInfo = slot.client->serverInfo();
            status.toolCount = slot.tools.size();
            for (const auto& tool : slot.tools) {
                status.tools.push_back(tool.name);

                Route route;
                route.backend = slot.config.name;
                route.toolName = tool.name;
                route.descriptor = tool;
                route.descriptor.meta = tool.meta.is_object() ? tool.meta : nlohmann::json::object();
                route.descriptor.meta["backend"] = slot.config.name;
                route.client = slot.client;

                snap->byQualifiedName.emplace(slot.config.name + "." + tool.name, route);

                if (taken.count(tool.name)) {
                    collisions.push_back(slot.config.name + "." + tool.name);
                    continue;
                }
                taken.insert(tool.name);
                snap->tools.push_back(route.descriptor);
                snap->byName.emplace(tool.name, std::move(route));
            }
        }
        snap->backends.push_back(std::move(status));
    }

    std::vector<std::string> names(taken.begin(), taken.end());
    if (names != lastNames) {
        // The constructor publishes the initial listing; only later changes count.
        if (std::atomic_load(&snapshot)) generationCounter.fetch_add(1);
        lastNames = std::move(names);
    }
    if (collisions != lastCollisions) {
        for (const auto& shadowed : collisions) {
            Logger::getInstance().warn("Tool name collision: " + shadowed + " is shadowed by an earlier entry");
        }
        lastCollisions = std::move(collisions);
    }
    return snap;
}

std::shared_ptr<const GatewayAggregator::Snapshot> GatewayAggregator::current() const {
    return std::atomic_load(&snapshot);
}

std::vector<ToolDescriptor> GatewayAggregator::listTools() const {
    return current()->tools;
}

InvocationOutcome GatewayAggregator::invoke(const std::string& name, const nlohmann::json& arguments,
                                            const CallContext& ctx) {
    if (local->hasTool(name)) {
        return local->invoke(name, arguments, ctx);
    }

    auto snap = current();
    const Route* route = nullptr;
    auto it = snap->byName.find(name);
    if (it != snap->byName.end()) {
        route = &it->second;
    } else {
        auto qualified = snap->byQualifiedName.find(name);
        if (qualified != snap->byQualifiedName.end()) route = &qualified->second;
    }
    if (!route) {
        return InvocationOutcome::failure(ErrorCode::ToolNotFound, "Tool not found: " + name, {{"name", name}});
    }

    nlohmann::json effective;
    if (auto error = ToolRegistry::prepareArguments(route->descriptor, arguments, effective)) {
        return InvocationOutcome::failure(error->code, error->message, error->data);
    }
    if (ctx.cancelled()) {
        return InvocationOutcome::failure(ErrorCode::Cancelled, "Call cancelled", {{"tool", name}});
    }
    if (ctx.expired()) {
        return InvocationOutcome::failure(ErrorCode::Timeout, "Tool " + name + " timed out", {{"tool", name}});
    }

    try {
        return route->client->callTool(route->toolName, effective, ctx);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Backend " + route->backend + " call fault tool=" + route->toolName +
                                    " args=" + argumentDigest(effective) + " id=" + correlationKey(ctx.correlationId) +
                                    ": " + e.what());
        return InvocationOutcome::failure(ErrorCode::InternalError, std::string("Internal error: ") + e.what(),
                                          {{"tool", name}, {"backend", route->backend}});
    }
}

nlohmann::json GatewayAggregator::listServers() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& status : current()->backends) {
        nlohmann::json row = {
            {"name", status.name},
            {"kind", status.kind},
            {"target", status.target},
            {"connected", status.connected},
            {"tools", status.toolCount}
        };
        if (!status.error.empty()) row["error"] = status.error;
        rows.push_back(row);
    }
    return rows;
}

std::optional<nlohmann::json> GatewayAggregator::getServerInfo(const std::string& name) const {
    auto snap = current();
    for (const auto& status : snap->backends) {
        if (status.name != name) continue;
        nlohmann::json info = {
            {"name", status.name},
            {"kind", status.kind},
            {"target", status.target},
            {"connected", status.connected},
            {"serverInfo", status.serverInfo},
            {"tools", status.tools}
        };
        if (!status.error.empty()) info["error"] = status.error;
        return info;
    }
    return std::nullopt;
}
