#pragma once
#include <vector>
#include "tools/ToolTypes.h"
#include "core/Capabilities.h"

// Tools every server instance exposes regardless of configuration.
namespace BuiltinTools {
    // health_check: reports liveness and the capability record, takes no arguments.
    ToolDefinition healthCheck(const ServerCapabilities& capabilities);

    // echo: returns "text", optionally upper-cased.
    ToolDefinition echo();

    std::vector<ToolDefinition> all(const ServerCapabilities& capabilities);
}
