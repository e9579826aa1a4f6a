#include "tools/BuiltinTools.h"
#include <algorithm>
#include <cctype>

namespace BuiltinTools {

ToolDefinition healthCheck(const ServerCapabilities& capabilities) {
    ToolDefinition def;
    def.descriptor.name = "health_check";
    def.descriptor.description = "Check server health and capabilities";
    def.descriptor.inputSchema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"additionalProperties", false}
    };
    def.handler = [&capabilities](const nlohmann::json&, const CallContext&) {
        std::string versions;
        for (const auto& v : capabilities.protocolVersions) {
            if (!versions.empty()) versions += ", ";
            versions += v;
        }
        std::string features;
        if (capabilities.tools) features += "tools";
        if (capabilities.logging) features += features.empty() ? "logging" : ", logging";

        ToolResult result = ToolResult::text(capabilities.serverName + " is healthy");
        result.content.push_back({
            {"type", "text"},
            {"text", "version " + capabilities.serverVersion + "; capabilities: " + features +
                     "; protocol versions: " + versions}
        });
        return result;
    };
    return def;
}

ToolDefinition echo() {
    ToolDefinition def;
    def.descriptor.name = "echo";
    def.descriptor.description = "Return the given text unchanged, or upper-cased";
    def.descriptor.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "Text to return"}}},
            {"uppercase", {{"type", "boolean"}, {"description", "Upper-case the text"}, {"default", false}}}
        }},
        {"required", {"text"}},
        {"additionalProperties", false}
    };
    def.descriptor.defaults = {{"uppercase", false}};
    def.handler = [](const nlohmann::json& args, const CallContext&) {
        std::string text = args.at("text").get<std::string>();
        if (args.value("uppercase", false)) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        }
        return ToolResult::text(text);
    };
    return def;
}

std::vector<ToolDefinition> all(const ServerCapabilities& capabilities) {
    std::vector<ToolDefinition> defs;
    defs.push_back(healthCheck(capabilities));
    defs.push_back(echo());
    return defs;
}

} // namespace BuiltinTools
