#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "httplib.h"
#include "gateway/RpcBackendClient.h"
#include "core/ConfigManager.h"

/**
 * @brief Backend reached over an event stream: GET for replies, POST for requests.
 *
 * The stream's first "endpoint" event names the URL to post to; replies
 * come back as "message" events.
 */
class SseBackendClient : public RpcBackendClient {
public:
    SseBackendClient(Config::BackendConfig config, BackendOptions options);
    ~SseBackendClient() override;

    std::string describe() const override { return "network: " + config.url + config.endpoint; }
    bool connect(std::chrono::milliseconds timeout) override;
    bool isConnected() const override { return streaming.load(); }
    void close() override;

protected:
    bool sendEnvelope(const Envelope& envelope) override;

private:
    void streamLoop();

    const Config::BackendConfig config;
    std::unique_ptr<httplib::Client> streamClient;
    std::unique_ptr<httplib::Client> postClient;
    std::mutex postMutex;

    std::mutex endpointMutex;
    std::condition_variable endpointCv;
    std::string messagePath;
    bool streamEnded = false;

    std::thread streamThread;
    std::atomic<bool> stopping{false};
    std::atomic<bool> streaming{false};
};
