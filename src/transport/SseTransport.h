#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "httplib.h"
#include "transport/ITransport.h"
#include "core/ConfigManager.h"

class SessionManager;

struct SseOptions {
    std::string serviceName = "switchboard";
    std::string host = "0.0.0.0";
    int port = 3020;  // 0 binds an ephemeral port
    std::string endpoint = "/sse";
    std::string messageEndpoint = "/messages";
    std::string healthEndpoint = "/health";
    std::chrono::milliseconds keepaliveInterval{15000};
    int maxConnections = 100;
    int maxWriteFailures = 3;
    std::vector<std::string> corsOrigins{"*"};
    std::vector<std::string> corsMethods{"GET", "POST", "OPTIONS"};
    std::vector<std::string> corsHeaders{"Content-Type", "Accept", "Cache-Control"};
    int corsMaxAge = 86400;

    static SseOptions fromConfig(const Config& cfg);
};

/**
 * @brief Server-sent-event stream out, HTTP POST in.
 *
 * GET <endpoint> opens a session and streams its output as "message"
 * events; the first event ("endpoint") tells the client where to POST.
 * POST <messageEndpoint>?session_id=<token> injects one envelope into
 * that session's input channel.
 */
class SseTransport : public ITransport {
public:
    SseTransport(SessionManager& sessions, SseOptions options);
    ~SseTransport() override;

    std::string name() const override { return "sse"; }
    bool start() override;
    void run() override;
    void stop() override;

    int getPort() const { return boundPort; }
    int activeConnections() const { return active.load(); }

private:
    struct Stream;

    void setupRoutes();
    void handleStream(const httplib::Request& req, httplib::Response& res);
    void handleMessage(const httplib::Request& req, httplib::Response& res);
    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handlePreflight(const httplib::Request& req, httplib::Response& res);
    bool provide(Stream& stream, httplib::DataSink& sink);
    bool writeFrame(Stream& stream, httplib::DataSink& sink);
    void applyCors(const httplib::Request& req, httplib::Response& res) const;

    SessionManager& sessions;
    const SseOptions options;
    httplib::Server server;
    int boundPort = -1;
    std::atomic<int> active{0};
    std::atomic<bool> stopping{false};
};
