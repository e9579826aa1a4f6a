#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "session/Session.h"
#include "protocol/ProtocolCore.h"
#include "tools/ToolTypes.h"
#include "core/Capabilities.h"

struct SessionOptions {
    size_t queueCapacity = 1000;
    std::chrono::milliseconds idleTimeout{0};  // 0 disables
    CoreOptions core;

    static SessionOptions fromConfig(const Config& cfg);
};

/**
 * @brief Owns the Session -> Core-run mapping.
 *
 * open() creates a session with a fresh channel pair and starts one
 * Protocol Core run on its own thread. A run that faults only ends its
 * own session; the catalog and other sessions are untouched. Finished
 * runs are joined lazily (on open(), by the idle monitor and on shutdown).
 */
class SessionManager {
public:
    SessionManager(IToolCatalog& catalog, const ServerCapabilities& capabilities, SessionOptions options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    std::shared_ptr<Session> open(TransportKind kind);
    std::shared_ptr<Session> find(const std::string& id) const;

    // Half-close: the core drains in-flight calls within its grace period.
    void close(const std::string& id);

    // Transport-fatal: pending calls are cancelled immediately.
    void abort(const std::string& id);

    // Sessions whose core run has not finished yet.
    size_t activeCount() const;

    // Closes every session and joins all runs.
    void shutdown();

private:
    struct Entry {
        std::shared_ptr<Session> session;
        std::thread thread;
    };

    void runSession(std::shared_ptr<Session> session);
    void reapFinished();
    void monitorLoop();
    std::string generateSessionId();

    IToolCatalog& catalog;
    const ServerCapabilities& capabilities;
    const SessionOptions options;

    mutable std::mutex mtx;
    std::map<std::string, Entry> sessions;
    bool stopping = false;

    std::mutex monitorMutex;
    std::condition_variable monitorCv;
    std::thread monitor;
};
