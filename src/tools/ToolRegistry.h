#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ToolTypes.h"
#include "core/Capabilities.h"
#include "utils/ThreadPool.h"

/**
 * @brief Name -> handler dispatch table for locally implemented tools.
 *
 * The table is built once in the constructor and never modified, so
 * listTools() and the lookup in invoke() need no locking. Handlers run on
 * a bounded worker pool; invoke() waits for them up to the call deadline.
 */
class ToolRegistry : public IToolCatalog {
public:
    ToolRegistry(std::vector<ToolDefinition> definitions, const ServerCapabilities& capabilities,
                 size_t workerThreads = 4);
    ~ToolRegistry() override = default;

    std::vector<ToolDescriptor> listTools() const override;

    /**
     * @brief Look up, validate and run a tool.
     *
     * Order of checks: unknown name (ToolNotFound), non-object arguments
     * (InvalidParams), schema violation (ValidationError, handler is not
     * called), then execution. A deadline miss cancels the call token and
     * yields Timeout; a handler exception yields InternalError and is logged
     * with tool name, argument digest and correlation id.
     */
    InvocationOutcome invoke(const std::string& name, const nlohmann::json& arguments,
                             const CallContext& ctx) override;

    bool hasTool(const std::string& name) const;
    const ToolDescriptor* findDescriptor(const std::string& name) const;
    size_t getToolCount() const { return tools.size(); }
    const ServerCapabilities& getCapabilities() const { return capabilities; }

    /**
     * @brief Merge descriptor defaults under arguments and validate the result.
     *
     * Shared with the gateway, which validates before forwarding to a backend.
     * On success 'effective' holds the merged arguments.
     */
    static std::optional<ToolError> prepareArguments(const ToolDescriptor& descriptor,
                                                     const nlohmann::json& arguments,
                                                     nlohmann::json& effective);

private:
    std::unordered_map<std::string, ToolDefinition> tools;
    std::vector<std::string> order;  // registration order, used for listing
    const ServerCapabilities& capabilities;
    std::unique_ptr<ThreadPool> pool;
};
