#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ToolTypes.h"

/**
 * @brief Connection to one upstream server fronted by the gateway.
 */
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    // "process: <command>" or "network: <url>", for status output.
    virtual std::string describe() const = 0;

    // Establish the transport and complete the handshake.
    virtual bool connect(std::chrono::milliseconds timeout) = 0;

    // std::nullopt when the backend could not answer.
    virtual std::optional<std::vector<ToolDescriptor>> listTools(std::chrono::milliseconds timeout) = 0;

    // Blocks until the backend replies, ctx.deadline passes or ctx is cancelled.
    virtual InvocationOutcome callTool(const std::string& name, const nlohmann::json& arguments,
                                       const CallContext& ctx) = 0;

    virtual bool isConnected() const = 0;
    virtual void close() = 0;

    // serverInfo from the backend's handshake response.
    virtual nlohmann::json serverInfo() const { return nlohmann::json::object(); }
    virtual std::string lastError() const { return ""; }
};
