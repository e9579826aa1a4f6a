#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "protocol/Envelope.h"
#include "tools/ToolTypes.h"
#include "core/Capabilities.h"
#include "core/ConfigManager.h"

class Session;

enum class CoreState {
    Uninitialized,
    Initializing,
    Ready,
    Draining,
    Closed
};

const char* coreStateName(CoreState state);

struct CoreOptions {
    std::chrono::milliseconds toolTimeout{30000};
    size_t maxInFlight = 16;
    std::chrono::milliseconds drainGrace{5000};
    // How often an idle core wakes up to check the catalog generation.
    std::chrono::milliseconds pollInterval{250};

    static CoreOptions fromConfig(const Config& cfg);
};

/**
 * @brief Transport-independent protocol state machine for one session.
 *
 * Uninitialized -> Initializing -> Ready -> Draining -> Closed.
 * run() reads the session input channel until it closes or a shutdown
 * request arrives, answers every request on the output channel and then
 * drains: in-flight calls get the grace period, whatever is still running
 * afterwards is cancelled and answered with a cancellation error.
 *
 * Tool calls execute concurrently (one task each, bounded by maxInFlight);
 * their replies may overtake each other. Each correlation id is answered
 * at most once.
 */
class ProtocolCore {
public:
    ProtocolCore(IToolCatalog& catalog, const ServerCapabilities& capabilities, CoreOptions options);
    ~ProtocolCore();

    ProtocolCore(const ProtocolCore&) = delete;
    ProtocolCore& operator=(const ProtocolCore&) = delete;

    void run(Session& session);

    CoreState getState() const { return state.load(); }
    size_t inFlightCount() const;

private:
    struct PendingCall {
        std::string toolName;
        nlohmann::json id;
        std::shared_ptr<CancellationToken> cancel;
        std::future<void> done;
        bool claimed = false;   // a reply was sent, or the client cancelled
        bool finished = false;  // the task body has returned
    };

    void handle(const Envelope& env);
    void handleRequest(const Envelope& env);
    void handleNotification(const Envelope& env);

    void handleInitialize(const Envelope& env);
    void handleListTools(const Envelope& env);
    void handleCallTool(const Envelope& env);
    void handleSetLevel(const Envelope& env);
    void handleShutdown(const Envelope& env);
    void handleCancelled(const Envelope& env);

    void runCall(const std::string& key, const std::string& toolName, nlohmann::json arguments, CallContext ctx);
    bool waitForSlot();
    void reapFinished();
    void drain();
    void cancelAll(bool reply, const std::string& reason);
    void waitAll();
    void checkCatalogChange();
    void sendLogMessage(const std::string& level, const nlohmann::json& data);
    bool send(const Envelope& env);

    IToolCatalog& catalog;
    const ServerCapabilities& capabilities;
    const CoreOptions options;

    Session* session = nullptr;
    std::atomic<CoreState> state{CoreState::Uninitialized};
    std::string negotiatedVersion;
    std::string clientName;
    std::atomic<int> clientLogLevel{-1};  // -1 until logging/setLevel
    uint64_t lastGeneration = 0;

    mutable std::mutex pendingMutex;
    std::condition_variable pendingCv;
    std::unordered_map<std::string, PendingCall> pending;
};
