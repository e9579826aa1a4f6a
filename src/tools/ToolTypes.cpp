#include "tools/ToolTypes.h"
#include <cstdio>

nlohmann::json ToolDescriptor::toJson() const {
    nlohmann::json j = {
        {"name", name},
        {"description", description},
        {"inputSchema", inputSchema}
    };
    if (!meta.is_null()) {
        j["_meta"] = meta;
    }
    return j;
}

ToolDescriptor ToolDescriptor::fromJson(const nlohmann::json& j) {
    ToolDescriptor d;
    d.name = j.value("name", "");
    d.description = j.value("description", "");
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        d.inputSchema = j["inputSchema"];
    }
    // Defaults declared in the schema ("default" per property) are lifted out.
    if (d.inputSchema.contains("properties") && d.inputSchema["properties"].is_object()) {
        for (auto it = d.inputSchema["properties"].begin(); it != d.inputSchema["properties"].end(); ++it) {
            if (it.value().is_object() && it.value().contains("default")) {
                d.defaults[it.key()] = it.value()["default"];
            }
        }
    }
    if (j.contains("_meta")) {
        d.meta = j["_meta"];
    }
    return d;
}

ToolResult ToolResult::text(const std::string& text, bool isError) {
    ToolResult r;
    r.content.push_back({{"type", "text"}, {"text", text}});
    r.isError = isError;
    return r;
}

nlohmann::json ToolResult::toJson() const {
    return {
        {"content", content},
        {"isError", isError}
    };
}

ToolResult ToolResult::fromJson(const nlohmann::json& j) {
    ToolResult r;
    if (j.contains("content") && j["content"].is_array()) {
        r.content = j["content"];
    }
    r.isError = j.value("isError", false);
    return r;
}

InvocationOutcome InvocationOutcome::success(ToolResult result) {
    InvocationOutcome o;
    o.result = std::move(result);
    return o;
}

InvocationOutcome InvocationOutcome::failure(ErrorCode code, const std::string& message, const nlohmann::json& data) {
    InvocationOutcome o;
    o.error = ToolError{code, message, data};
    return o;
}

std::string argumentDigest(const nlohmann::json& arguments) {
    // FNV-1a, 64 bit
    std::string canonical = arguments.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : canonical) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}
