#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"

/**
 * @brief What this server instance offers, computed once at startup.
 *
 * Passed by const reference to the registry, the gateway and every
 * Protocol Core run; nothing mutates it afterwards.
 */
struct ServerCapabilities {
    std::string serverName = "switchboard";
    std::string serverVersion = "1.0.0";
    std::vector<std::string> protocolVersions{"2025-06-18", "2025-03-26", "2024-11-05", "1.0"};
    bool tools = true;
    bool toolsListChanged = false;
    bool logging = true;

    static ServerCapabilities fromConfig(const Config& cfg) {
        ServerCapabilities caps;
        caps.serverName = cfg.server.name;
        caps.serverVersion = cfg.server.version;
        caps.protocolVersions = cfg.protocol.supportedVersions;
        caps.toolsListChanged = !cfg.gateway.backends.empty();
        return caps;
    }

    bool supportsVersion(const std::string& version) const {
        return std::find(protocolVersions.begin(), protocolVersions.end(), version) != protocolVersions.end();
    }

    // The "capabilities" object of the handshake response.
    nlohmann::json toJson() const {
        nlohmann::json j = nlohmann::json::object();
        if (tools) {
            j["tools"] = {{"listChanged", toolsListChanged}};
        }
        if (logging) {
            j["logging"] = nlohmann::json::object();
        }
        return j;
    }
};
