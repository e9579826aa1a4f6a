#include "gateway/RpcBackendClient.h"
#include "utils/Logger.h"

namespace {
const std::chrono::milliseconds kWaitSlice{20};
} // namespace

RpcBackendClient::Reply RpcBackendClient::request(const std::string& method, const nlohmann::json& params,
                                                  std::chrono::steady_clock::time_point deadline,
                                                  const std::shared_ptr<CancellationToken>& cancel) {
    nlohmann::json id = nextId.fetch_add(1);
    std::string key = correlationKey(id);
    auto slot = std::make_shared<Slot>();
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending[key] = slot;
    }

    if (!sendEnvelope(makeRequest(id, method, params))) {
        std::lock_guard<std::mutex> lock(mtx);
        pending.erase(key);
        Reply r;
        r.failed = true;
        r.failure = "could not send " + method;
        return r;
    }

    std::unique_lock<std::mutex> lock(mtx);
    while (!slot->reply.delivered && !slot->reply.failed) {
        if (cancel && cancel->isCancelled()) {
            slot->reply.cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            slot->reply.timedOut = true;
            break;
        }
        cv.wait_for(lock, kWaitSlice);
    }
    pending.erase(key);
    Reply result = slot->reply;
    lock.unlock();

    if (result.cancelled || result.timedOut) {
        // Let the backend stop working on it; a late reply is dropped by deliver().
        notify("notifications/cancelled", {{"requestId", id},
                                           {"reason", result.timedOut ? "timeout" : "cancelled"}});
    }
    return result;
}

bool RpcBackendClient::notify(const std::string& method, const nlohmann::json& params) {
    return sendEnvelope(makeNotification(method, params));
}

bool RpcBackendClient::handshake(std::chrono::milliseconds timeout) {
    nlohmann::json params = {
        {"protocolVersion", options.protocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", options.clientName}, {"version", options.clientVersion}}}
    };
    Reply r = request("initialize", params, std::chrono::steady_clock::now() + timeout);
    if (!r.delivered) {
        setLastError(r.timedOut ? "initialize timed out" : "initialize failed: " + r.failure);
        return false;
    }
    if (r.envelope.kind == EnvelopeKind::ErrorResponse) {
        setLastError("initialize rejected: " + r.envelope.payload.value("message", std::string("unknown error")));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        const auto& result = r.envelope.payload;
        info = result.is_object() && result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json::object();
        if (result.is_object() && result.contains("protocolVersion")) {
            info["protocolVersion"] = result["protocolVersion"];
        }
    }
    return notify("notifications/initialized");
}

std::optional<std::vector<ToolDescriptor>> RpcBackendClient::listTools(std::chrono::milliseconds timeout) {
    Reply r = request("tools/list", nlohmann::json::object(), std::chrono::steady_clock::now() + timeout);
    if (!r.delivered) {
        setLastError(r.timedOut ? "tools/list timed out" : "tools/list failed: " + r.failure);
        return std::nullopt;
    }
    if (r.envelope.kind == EnvelopeKind::ErrorResponse) {
        setLastError("tools/list rejected: " + r.envelope.payload.value("message", std::string("unknown error")));
        return std::nullopt;
    }

    std::vector<ToolDescriptor> tools;
    const auto& result = r.envelope.payload;
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        setLastError("tools/list returned no tool array");
        return std::nullopt;
    }
    for (const auto& item : result["tools"]) {
        if (!item.is_object()) continue;
        ToolDescriptor d = ToolDescriptor::fromJson(item);
        if (d.name.empty()) continue;
        tools.push_back(std::move(d));
    }
    return tools;
}

InvocationOutcome RpcBackendClient::callTool(const std::string& name, const nlohmann::json& arguments,
                                             const CallContext& ctx) {
    if (!isConnected()) {
        return InvocationOutcome::failure(ErrorCode::ToolError, "Backend " + options.name + " is not connected",
                                          {{"backend", options.name}, {"tool", name}});
    }

    nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    Reply r = request("tools/call", params, ctx.deadline, ctx.cancel);

    if (r.cancelled) {
        return InvocationOutcome::failure(ErrorCode::Cancelled, "Call cancelled", {{"tool", name}});
    }
    if (r.timedOut) {
        return InvocationOutcome::failure(ErrorCode::Timeout, "Tool " + name + " timed out on backend " + options.name,
                                          {{"backend", options.name}, {"tool", name}});
    }
    if (r.failed) {
        return InvocationOutcome::failure(ErrorCode::ToolError, "Backend " + options.name + " failed: " + r.failure,
                                          {{"backend", options.name}, {"tool", name}});
    }
    if (r.envelope.kind == EnvelopeKind::ErrorResponse) {
        const auto& err = r.envelope.payload;
        nlohmann::json data = {{"backend", options.name}, {"tool", name}, {"backendCode", err.value("code", 0)}};
        if (err.contains("data")) data["backendData"] = err["data"];
        return InvocationOutcome::failure(ErrorCode::ToolError,
                                          "Backend " + options.name + ": " + err.value("message", std::string("error")),
                                          data);
    }
    return InvocationOutcome::success(ToolResult::fromJson(r.envelope.payload));
}

void RpcBackendClient::deliver(const Envelope& envelope) {
    if (!envelope.isReply()) {
        Logger::getInstance().debug("Backend " + options.name + " sent " +
                                    (envelope.method.empty() ? std::string("a message") : envelope.method));
        return;
    }
    std::lock_guard<std::mutex> lock(mtx);
    auto it = pending.find(correlationKey(envelope.id));
    if (it == pending.end()) {
        Logger::getInstance().debug("Backend " + options.name + ": dropping late reply id=" + correlationKey(envelope.id));
        return;
    }
    it->second->reply.delivered = true;
    it->second->reply.envelope = envelope;
    cv.notify_all();
}

void RpcBackendClient::failPending(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto& [key, slot] : pending) {
        if (!slot->reply.delivered) {
            slot->reply.failed = true;
            slot->reply.failure = reason;
        }
    }
    error = reason;
    cv.notify_all();
}

void RpcBackendClient::setLastError(const std::string& e) {
    std::lock_guard<std::mutex> lock(mtx);
    error = e;
}

nlohmann::json RpcBackendClient::serverInfo() const {
    std::lock_guard<std::mutex> lock(mtx);
    return info;
}

std::string RpcBackendClient::lastError() const {
    std::lock_guard<std::mutex> lock(mtx);
    return error;
}
