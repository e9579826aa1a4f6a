#include "protocol/ProtocolCore.h"
#include "session/Session.h"
#include "utils/Logger.h"
#include <algorithm>
#include <vector>

namespace {
const std::vector<std::string> kLogLevels = {
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
};

int logLevelIndex(const std::string& level) {
    auto it = std::find(kLogLevels.begin(), kLogLevels.end(), level);
    return it == kLogLevels.end() ? -1 : static_cast<int>(it - kLogLevels.begin());
}

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}
} // namespace

const char* coreStateName(CoreState state) {
    switch (state) {
        case CoreState::Uninitialized: return "uninitialized";
        case CoreState::Initializing: return "initializing";
        case CoreState::Ready: return "ready";
        case CoreState::Draining: return "draining";
        case CoreState::Closed: return "closed";
    }
    return "unknown";
}

CoreOptions CoreOptions::fromConfig(const Config& cfg) {
    CoreOptions o;
    o.toolTimeout = toMillis(cfg.performance.toolTimeout);
    o.maxInFlight = cfg.performance.maxInFlight;
    o.drainGrace = toMillis(cfg.performance.drainGrace);
    return o;
}

ProtocolCore::ProtocolCore(IToolCatalog& catalog, const ServerCapabilities& capabilities, CoreOptions options)
    : catalog(catalog), capabilities(capabilities), options(options) {}

ProtocolCore::~ProtocolCore() {
    // Only reached with live tasks if run() was left by an exception.
    cancelAll(false, "core destroyed");
    waitAll();
}

size_t ProtocolCore::inFlightCount() const {
    std::lock_guard<std::mutex> lock(pendingMutex);
    size_t n = 0;
    for (const auto& [key, call] : pending) {
        if (!call.finished) n++;
    }
    return n;
}

void ProtocolCore::run(Session& s) {
    session = &s;
    lastGeneration = catalog.generation();
    Logger::getInstance().debug("Core run started for session " + s.getId());

    while (true) {
        CoreState current = state.load();
        if (current == CoreState::Draining || current == CoreState::Closed) break;

        auto env = s.input().receiveFor(options.pollInterval);
        if (!env) {
            if (s.input().isDrained()) break;
            checkCatalogChange();
            reapFinished();
            continue;
        }

        s.touch();
        try {
            handle(*env);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Session " + s.getId() + ": failed to handle " + env->method + ": " + e.what());
            if (env->isRequest()) {
                send(makeErrorResponse(env->id, ErrorCode::InternalError, std::string("Internal error: ") + e.what()));
            }
        }
        reapFinished();
    }

    drain();
    Logger::getInstance().debug("Core run finished for session " + s.getId());
}

bool ProtocolCore::send(const Envelope& env) {
    if (!session) return false;
    bool ok = session->output().send(env);
    if (ok) session->touch();
    return ok;
}

void ProtocolCore::handle(const Envelope& env) {
    switch (env.kind) {
        case EnvelopeKind::Request:
            handleRequest(env);
            break;
        case EnvelopeKind::Notification:
            handleNotification(env);
            break;
        case EnvelopeKind::Response:
        case EnvelopeKind::ErrorResponse:
            // The server never issues requests, so there is nothing to correlate.
            Logger::getInstance().debug("Ignoring unsolicited reply id=" + correlationKey(env.id));
            break;
    }
}

void ProtocolCore::handleRequest(const Envelope& env) {
    if (env.method == "ping") {
        send(makeResponse(env.id, nlohmann::json::object()));
        return;
    }

    if (env.method == "initialize") {
        if (state.load() != CoreState::Uninitialized) {
            send(makeErrorResponse(env.id, ErrorCode::InvalidRequest, "Session already initialized"));
            return;
        }
        handleInitialize(env);
        return;
    }

    CoreState current = state.load();
    if (current != CoreState::Ready) {
        std::string message = current == CoreState::Uninitialized ? "Session not initialized"
                                                                    : "Session is shutting down";
        send(makeErrorResponse(env.id, ErrorCode::InvalidRequest, message,
                               {{"state", coreStateName(current)}}));
        return;
    }

    if (env.method == "tools/list") {
        handleListTools(env);
    } else if (env.method == "tools/call") {
        handleCallTool(env);
    } else if (env.method == "logging/setLevel") {
        handleSetLevel(env);
    } else if (env.method == "shutdown") {
        handleShutdown(env);
    } else {
        send(makeErrorResponse(env.id, ErrorCode::MethodNotFound, "Method not found: " + env.method));
    }
}

void ProtocolCore::handleNotification(const Envelope& env) {
    if (env.method == "notifications/cancelled") {
        handleCancelled(env);
    } else if (env.method == "notifications/initialized") {
        Logger::getInstance().debug("Client " + clientName + " confirmed initialization");
    } else {
        Logger::getInstance().debug("Ignoring notification " + env.method);
    }
}

void ProtocolCore::handleInitialize(const Envelope& env) {
    state.store(CoreState::Initializing);

    const nlohmann::json& params = env.payload;
    if (!params.is_object() || !params.contains("protocolVersion") || !params["protocolVersion"].is_string()) {
        state.store(CoreState::Uninitialized);
        send(makeErrorResponse(env.id, ErrorCode::InvalidParams, "initialize requires a protocolVersion string"));
        return;
    }

    std::string requested = params["protocolVersion"].get<std::string>();
    if (!capabilities.supportsVersion(requested)) {
        state.store(CoreState::Uninitialized);
        send(makeErrorResponse(env.id, ErrorCode::InvalidParams, "Unsupported protocol version: " + requested,
                               {{"supported", capabilities.protocolVersions}, {"requested", requested}}));
        return;
    }

    negotiatedVersion = requested;
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        clientName = params["clientInfo"].value("name", "");
    }

    nlohmann::json result = {
        {"protocolVersion", negotiatedVersion},
        {"capabilities", capabilities.toJson()},
        {"serverInfo", {{"name", capabilities.serverName}, {"version", capabilities.serverVersion}}}
    };

    if (send(makeResponse(env.id, result))) {
        state.store(CoreState::Ready);
        Logger::getInstance().info("Session " + session->getId() + " initialized (protocol " + negotiatedVersion +
                                   (clientName.empty() ? "" : ", client " + clientName) + ")");
    } else {
        state.store(CoreState::Draining);
    }
}

void ProtocolCore::handleListTools(const Envelope& env) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : catalog.listTools()) {
        tools.push_back(descriptor.toJson());
    }
    lastGeneration = catalog.generation();
    send(makeResponse(env.id, {{"tools", tools}}));
}

void ProtocolCore::handleCallTool(const Envelope& env) {
    const nlohmann::json& params = env.payload;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        send(makeErrorResponse(env.id, ErrorCode::InvalidParams, "tools/call requires a tool name"));
        return;
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();

    auto timeout = options.toolTimeout;
    if (params.contains("_meta") && params["_meta"].is_object()) {
        const auto& meta = params["_meta"];
        if (meta.contains("timeoutMs") && meta["timeoutMs"].is_number() && meta["timeoutMs"].get<double>() > 0) {
            auto requested = std::chrono::milliseconds(static_cast<long long>(meta["timeoutMs"].get<double>()));
            timeout = std::min(timeout, requested);
        }
    }

    if (!waitForSlot()) {
        send(makeErrorResponse(env.id, ErrorCode::InvalidRequest, "Session is shutting down"));
        return;
    }

    std::string key = correlationKey(env.id);
    CallContext ctx;
    ctx.toolName = name;
    ctx.correlationId = env.id;
    ctx.deadline = std::chrono::steady_clock::now() + timeout;

    std::lock_guard<std::mutex> lock(pendingMutex);
    auto existing = pending.find(key);
    if (existing != pending.end() && existing->second.finished) {
        // Already answered; the id may be reused.
        if (existing->second.done.valid()) existing->second.done.wait();
        pending.erase(existing);
    } else if (existing != pending.end()) {
        // Answering would produce a second reply for this id; the earlier call keeps it.
        Logger::getInstance().warn("Session " + session->getId() + ": dropping tools/call with in-flight id " + key);
        return;
    }

    PendingCall call;
    call.toolName = name;
    call.id = env.id;
    call.cancel = ctx.cancel;
    call.done = std::async(std::launch::async, &ProtocolCore::runCall, this, key, name, std::move(arguments), ctx);
    pending.emplace(key, std::move(call));
}

void ProtocolCore::runCall(const std::string& key, const std::string& toolName, nlohmann::json arguments,
                           CallContext ctx) {
    InvocationOutcome outcome = catalog.invoke(toolName, arguments, ctx);

    Envelope reply;
    if (outcome.ok()) {
        reply = makeResponse(ctx.correlationId, outcome.result->toJson());
    } else {
        reply = makeErrorResponse(ctx.correlationId, outcome.error->code, outcome.error->message, outcome.error->data);
    }

    bool claimed = false;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(key);
        if (it != pending.end() && !it->second.claimed) {
            it->second.claimed = true;
            claimed = true;
        }
    }

    if (claimed) {
        send(reply);
        if (!outcome.ok()) {
            ErrorCode code = outcome.error->code;
            if (code == ErrorCode::Timeout) {
                sendLogMessage("warning", {{"tool", toolName}, {"message", outcome.error->message}});
            } else if (code == ErrorCode::InternalError) {
                sendLogMessage("error", {{"tool", toolName}, {"message", outcome.error->message}});
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(key);
        if (it != pending.end()) it->second.finished = true;
    }
    pendingCv.notify_all();
}

bool ProtocolCore::waitForSlot() {
    reapFinished();
    auto hasSlot = [this] {
        if (session && session->isAborted()) return true;
        size_t running = 0;
        for (const auto& [key, call] : pending) {
            if (!call.finished) running++;
        }
        return running < options.maxInFlight;
    };
    std::unique_lock<std::mutex> lock(pendingMutex);
    // Abort does not signal pendingCv, so poll for it.
    while (!pendingCv.wait_for(lock, options.pollInterval, hasSlot)) {
    }
    return !(session && session->isAborted());
}

void ProtocolCore::handleSetLevel(const Envelope& env) {
    const nlohmann::json& params = env.payload;
    std::string level = params.is_object() ? params.value("level", "") : "";
    int index = logLevelIndex(level);
    if (index < 0) {
        send(makeErrorResponse(env.id, ErrorCode::InvalidParams, "Unknown log level: " + level,
                               {{"levels", kLogLevels}}));
        return;
    }
    clientLogLevel.store(index);
    send(makeResponse(env.id, nlohmann::json::object()));
}

void ProtocolCore::handleShutdown(const Envelope& env) {
    send(makeResponse(env.id, nlohmann::json::object()));
    state.store(CoreState::Draining);
    Logger::getInstance().info("Session " + session->getId() + " requested shutdown");
}

void ProtocolCore::handleCancelled(const Envelope& env) {
    const nlohmann::json& params = env.payload;
    if (!params.is_object() || !params.contains("requestId")) return;

    std::string key = correlationKey(params["requestId"]);
    std::lock_guard<std::mutex> lock(pendingMutex);
    auto it = pending.find(key);
    if (it == pending.end() || it->second.claimed) return;

    // A cancelled request is never answered.
    it->second.claimed = true;
    it->second.cancel->cancel();
    Logger::getInstance().info("Client cancelled " + it->second.toolName + " id=" + key +
                               (params.contains("reason") ? " (" + params["reason"].dump() + ")" : ""));
}

void ProtocolCore::reapFinished() {
    std::vector<std::future<void>> done;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto it = pending.begin(); it != pending.end();) {
            if (it->second.finished) {
                done.push_back(std::move(it->second.done));
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Futures of finished tasks; waiting on them here only covers the task epilogue.
    for (auto& f : done) {
        if (f.valid()) f.wait();
    }
}

void ProtocolCore::checkCatalogChange() {
    if (state.load() != CoreState::Ready) return;
    uint64_t generation = catalog.generation();
    if (generation != lastGeneration) {
        lastGeneration = generation;
        send(makeNotification("notifications/tools/list_changed"));
    }
}

void ProtocolCore::sendLogMessage(const std::string& level, const nlohmann::json& data) {
    int threshold = clientLogLevel.load();
    if (threshold < 0 || logLevelIndex(level) < threshold) return;
    send(makeNotification("notifications/message", {
        {"level", level},
        {"logger", capabilities.serverName},
        {"data", data}
    }));
}

void ProtocolCore::drain() {
    state.store(CoreState::Draining);

    bool aborted = session && session->isAborted();
    if (!aborted && options.drainGrace.count() > 0) {
        std::unique_lock<std::mutex> lock(pendingMutex);
        pendingCv.wait_for(lock, options.drainGrace, [this] {
            for (const auto& [key, call] : pending) {
                if (!call.finished) return false;
            }
            return true;
        });
    }

    cancelAll(true, aborted ? "Session closed" : "Session drained before the call completed");
    waitAll();
    state.store(CoreState::Closed);
}

void ProtocolCore::cancelAll(bool reply, const std::string& reason) {
    std::vector<nlohmann::json> unanswered;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto& [key, call] : pending) {
            if (call.finished) continue;
            call.cancel->cancel();
            if (!call.claimed) {
                call.claimed = true;
                unanswered.push_back(call.id);
            }
        }
    }
    if (!reply) return;
    for (const auto& id : unanswered) {
        send(makeErrorResponse(id, ErrorCode::Cancelled, reason));
    }
}

void ProtocolCore::waitAll() {
    std::vector<std::future<void>> futures;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto& [key, call] : pending) {
            if (call.done.valid()) futures.push_back(std::move(call.done));
        }
    }
    for (auto& f : futures) {
        f.wait();
    }
    std::lock_guard<std::mutex> lock(pendingMutex);
    pending.clear();
}
