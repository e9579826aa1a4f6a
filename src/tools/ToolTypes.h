#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/Envelope.h"

/**
 * @brief Catalog entry for one tool.
 *
 * inputSchema is a JSON Schema object; defaults are merged under the
 * caller's arguments before validation. meta is published as "_meta"
 * (the gateway stores the owning backend there).
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    nlohmann::json defaults = nlohmann::json::object();
    nlohmann::json meta;

    nlohmann::json toJson() const;
    static ToolDescriptor fromJson(const nlohmann::json& j);
};

/**
 * @brief What a handler returns: a list of typed content blocks.
 *
 * isError marks an application-level failure the caller should see as
 * tool output, as opposed to a protocol error.
 */
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
    bool isError = false;

    static ToolResult text(const std::string& text, bool isError = false);
    nlohmann::json toJson() const;
    static ToolResult fromJson(const nlohmann::json& j);
};

class CancellationToken {
public:
    void cancel() { cancelled.store(true); }
    bool isCancelled() const { return cancelled.load(); }

private:
    std::atomic<bool> cancelled{false};
};

/**
 * @brief Per-invocation context handed to every handler.
 *
 * Long-running handlers should poll shouldStop() and return early; the
 * dispatcher discards whatever they return after the deadline.
 */
struct CallContext {
    std::string toolName;
    nlohmann::json correlationId;
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    std::shared_ptr<CancellationToken> cancel = std::make_shared<CancellationToken>();

    bool cancelled() const { return cancel && cancel->isCancelled(); }
    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
    bool shouldStop() const { return cancelled() || expired(); }
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments, const CallContext& ctx)>;

struct ToolDefinition {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

struct ToolError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    nlohmann::json data;
};

struct InvocationOutcome {
    std::optional<ToolResult> result;
    std::optional<ToolError> error;

    bool ok() const { return result.has_value(); }

    static InvocationOutcome success(ToolResult result);
    static InvocationOutcome failure(ErrorCode code, const std::string& message,
                                     const nlohmann::json& data = nlohmann::json());
};

/**
 * @brief What a Protocol Core run talks to: the local registry or the gateway.
 */
class IToolCatalog {
public:
    virtual ~IToolCatalog() = default;

    virtual std::vector<ToolDescriptor> listTools() const = 0;

    /**
     * @brief Validate and run one tool call under ctx.deadline.
     *
     * Never throws. Validation failures, unknown tools, timeouts,
     * cancellation and handler faults all come back as an error outcome.
     */
    virtual InvocationOutcome invoke(const std::string& name, const nlohmann::json& arguments,
                                     const CallContext& ctx) = 0;

    // Bumped whenever the set of listed tools changes.
    virtual uint64_t generation() const { return 0; }
};

// Short hex digest of the canonical argument JSON, for log lines.
std::string argumentDigest(const nlohmann::json& arguments);
