#include "tools/ToolRegistry.h"
#include "tools/SchemaValidator.h"
#include "utils/Logger.h"
#include <algorithm>
#include <future>
#include <chrono>

namespace {
constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);

std::string describeCall(const std::string& name, const nlohmann::json& args, const CallContext& ctx) {
    return "tool=" + name + " args=" + argumentDigest(args) + " id=" + correlationKey(ctx.correlationId);
}
} // namespace

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> definitions, const ServerCapabilities& capabilities,
                           size_t workerThreads)
    : capabilities(capabilities), pool(std::make_unique<ThreadPool>(workerThreads)) {
    for (auto& def : definitions) {
        if (!def.handler) {
            Logger::getInstance().warn("Tool without handler skipped: " + def.descriptor.name);
            continue;
        }
        std::string name = def.descriptor.name;
        if (tools.count(name)) {
            Logger::getInstance().warn("Duplicate tool registration ignored: " + name);
            continue;
        }
        order.push_back(name);
        tools.emplace(name, std::move(def));
    }
}

std::vector<ToolDescriptor> ToolRegistry::listTools() const {
    std::vector<ToolDescriptor> out;
    out.reserve(order.size());
    for (const auto& name : order) {
        out.push_back(tools.at(name).descriptor);
    }
    return out;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}

const ToolDescriptor* ToolRegistry::findDescriptor(const std::string& name) const {
    auto it = tools.find(name);
    if (it == tools.end()) return nullptr;
    return &it->second.descriptor;
}

std::optional<ToolError> ToolRegistry::prepareArguments(const ToolDescriptor& descriptor,
                                                        const nlohmann::json& arguments,
                                                        nlohmann::json& effective) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return ToolError{ErrorCode::InvalidParams, "Tool arguments must be an object", nlohmann::json()};
    }

    effective = descriptor.defaults.is_object() ? descriptor.defaults : nlohmann::json::object();
    if (arguments.is_object()) {
        effective.update(arguments);
    }

    auto check = SchemaValidator::validate(descriptor.inputSchema, effective);
    if (!check.ok) {
        return ToolError{ErrorCode::ValidationError, check.message,
                         {{"field", check.field}, {"tool", descriptor.name}}};
    }
    return std::nullopt;
}

InvocationOutcome ToolRegistry::invoke(const std::string& name, const nlohmann::json& arguments,
                                       const CallContext& ctx) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return InvocationOutcome::failure(ErrorCode::ToolNotFound, "Tool not found: " + name, {{"name", name}});
    }
    const ToolDefinition& def = it->second;

    nlohmann::json effective;
    if (auto err = prepareArguments(def.descriptor, arguments, effective)) {
        Logger::getInstance().debug("Rejected call " + describeCall(name, arguments, ctx) + ": " + err->message);
        return InvocationOutcome::failure(err->code, err->message, err->data);
    }

    if (ctx.expired()) {
        return InvocationOutcome::failure(ErrorCode::Timeout, "Deadline already passed for tool " + name);
    }

    std::future<ToolResult> future;
    try {
        ToolHandler handler = def.handler;
        future = pool->enqueue([handler, effective, ctx]() {
            // Still queued when the caller gave up; the reply is already sent.
            if (ctx.shouldStop()) return ToolResult();
            return handler(effective, ctx);
        });
    } catch (const std::exception& e) {
        Logger::getInstance().error("Could not schedule " + describeCall(name, effective, ctx) + ": " + e.what());
        return InvocationOutcome::failure(ErrorCode::InternalError, std::string("Could not schedule tool: ") + e.what());
    }

    // Wait in slices so a client cancellation is noticed before the deadline.
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= ctx.deadline) {
            break;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(ctx.deadline - now, kCancelPollInterval);
        if (future.wait_for(slice) == std::future_status::ready) {
            break;
        }
        if (ctx.cancelled()) {
            Logger::getInstance().info("Cancelled " + describeCall(name, effective, ctx));
            return InvocationOutcome::failure(ErrorCode::Cancelled, "Tool call cancelled: " + name);
        }
    }

    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (ctx.cancel) ctx.cancel->cancel();
        Logger::getInstance().warn("Timed out " + describeCall(name, effective, ctx));
        return InvocationOutcome::failure(ErrorCode::Timeout, "Tool " + name + " timed out", {{"tool", name}});
    }

    try {
        return InvocationOutcome::success(future.get());
    } catch (const std::exception& e) {
        Logger::getInstance().error("Handler fault " + describeCall(name, effective, ctx) + ": " + e.what());
        return InvocationOutcome::failure(ErrorCode::InternalError, "Tool " + name + " failed: " + e.what(),
                                          {{"tool", name}});
    } catch (...) {
        Logger::getInstance().error("Handler fault " + describeCall(name, effective, ctx) + ": non-standard exception");
        return InvocationOutcome::failure(ErrorCode::InternalError, "Tool " + name + " failed", {{"tool", name}});
    }
}
