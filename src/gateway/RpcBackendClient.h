#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "gateway/IBackendClient.h"
#include "protocol/Envelope.h"

struct BackendOptions {
    std::string name;
    std::string protocolVersion = "2025-06-18";
    std::string clientName = "switchboard";
    std::string clientVersion = "1.0.0";
};

/**
 * @brief Request/reply correlation shared by the process and network backends.
 *
 * Subclasses move bytes; this class numbers requests, parks callers until
 * the matching reply is delivered and maps replies to invocation outcomes.
 */
class RpcBackendClient : public IBackendClient {
public:
    explicit RpcBackendClient(BackendOptions options) : options(std::move(options)) {}

    std::optional<std::vector<ToolDescriptor>> listTools(std::chrono::milliseconds timeout) override;
    InvocationOutcome callTool(const std::string& name, const nlohmann::json& arguments,
                               const CallContext& ctx) override;

    nlohmann::json serverInfo() const override;
    std::string lastError() const override;

protected:
    struct Reply {
        bool delivered = false;
        bool failed = false;   // transport went away before the reply arrived
        bool timedOut = false;
        bool cancelled = false;
        Envelope envelope;
        std::string failure;
    };

    Reply request(const std::string& method, const nlohmann::json& params,
                  std::chrono::steady_clock::time_point deadline,
                  const std::shared_ptr<CancellationToken>& cancel = nullptr);
    bool notify(const std::string& method, const nlohmann::json& params = nlohmann::json::object());

    // initialize + notifications/initialized.
    bool handshake(std::chrono::milliseconds timeout);

    // Called by the subclass reader for every decoded envelope.
    void deliver(const Envelope& envelope);
    // Called when the transport is gone; parked callers fail immediately.
    void failPending(const std::string& reason);
    void setLastError(const std::string& error);

    virtual bool sendEnvelope(const Envelope& envelope) = 0;

    const BackendOptions options;

private:
    struct Slot {
        Reply reply;
    };

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::map<std::string, std::shared_ptr<Slot>> pending;
    std::atomic<int64_t> nextId{1};
    nlohmann::json info = nlohmann::json::object();
    std::string error;
};
