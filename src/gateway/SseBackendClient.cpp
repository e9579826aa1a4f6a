#include "gateway/SseBackendClient.h"
#include "transport/SseEvent.h"
#include "utils/Logger.h"
#include <algorithm>

namespace {
// "http://host:port/messages?session_id=x" -> "/messages?session_id=x"; relative paths pass through.
std::string pathOf(const std::string& endpoint) {
    auto scheme = endpoint.find("://");
    if (scheme == std::string::npos) return endpoint;
    auto slash = endpoint.find('/', scheme + 3);
    return slash == std::string::npos ? "/" : endpoint.substr(slash);
}
} // namespace

SseBackendClient::SseBackendClient(Config::BackendConfig config, BackendOptions options)
    : RpcBackendClient(std::move(options)), config(std::move(config)) {}

SseBackendClient::~SseBackendClient() {
    close();
}

bool SseBackendClient::connect(std::chrono::milliseconds timeout) {
    if (streaming.load()) return true;
    close();

    stopping = false;
    {
        std::lock_guard<std::mutex> lock(endpointMutex);
        messagePath.clear();
        streamEnded = false;
    }

    auto seconds = std::max<long long>(1, std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
    streamClient = std::make_unique<httplib::Client>(config.url);
    streamClient->set_connection_timeout(static_cast<time_t>(seconds), 0);
    // The stream idles between events; keepalives arrive well within this.
    streamClient->set_read_timeout(300, 0);
    postClient = std::make_unique<httplib::Client>(config.url);
    postClient->set_connection_timeout(static_cast<time_t>(seconds), 0);
    postClient->set_read_timeout(static_cast<time_t>(seconds), 0);

    streaming = true;
    streamThread = std::thread(&SseBackendClient::streamLoop, this);

    {
        std::unique_lock<std::mutex> lock(endpointMutex);
        endpointCv.wait_for(lock, timeout, [this] { return !messagePath.empty() || streamEnded; });
        if (messagePath.empty()) {
            lock.unlock();
            setLastError(streamEnded ? "event stream closed before the endpoint event"
                                     : "timed out waiting for the endpoint event");
            Logger::getInstance().warn("Backend " + options.name + ": " + lastError());
            close();
            return false;
        }
    }

    if (!handshake(timeout)) {
        Logger::getInstance().warn("Backend " + options.name + " handshake failed: " + lastError());
        close();
        return false;
    }
    Logger::getInstance().info("Backend " + options.name + " connected (" + describe() + ")");
    return true;
}

void SseBackendClient::close() {
    stopping = true;
    if (streamClient) streamClient->stop();
    if (streamThread.joinable()) streamThread.join();
    streaming = false;
    streamClient.reset();
    {
        std::lock_guard<std::mutex> lock(postMutex);
        postClient.reset();
    }
    failPending("backend stopped");
}

void SseBackendClient::streamLoop() {
    SseParser parser;
    httplib::Headers headers = {{"Accept", "text/event-stream"}};

    auto res = streamClient->Get(config.endpoint, headers, [&](const char* data, size_t length) {
        for (const auto& event : parser.feed(data, length)) {
            if (event.event == "endpoint") {
                std::lock_guard<std::mutex> lock(endpointMutex);
                messagePath = pathOf(event.data);
                endpointCv.notify_all();
            } else if (event.event == "message") {
                DecodeResult decoded = EnvelopeCodec::decode(event.data);
                if (auto* env = std::get_if<Envelope>(&decoded)) {
                    deliver(*env);
                } else {
                    Logger::getInstance().debug("Backend " + options.name + ": skipping undecodable event");
                }
            }
        }
        return !stopping.load();
    });

    if (!stopping.load()) {
        std::string reason = res ? "stream ended with HTTP " + std::to_string(res->status)
                                 : "stream failed: " + httplib::to_string(res.error());
        Logger::getInstance().warn("Backend " + options.name + " " + reason);
        setLastError(reason);
    }

    streaming = false;
    {
        std::lock_guard<std::mutex> lock(endpointMutex);
        streamEnded = true;
    }
    endpointCv.notify_all();
    failPending("event stream closed");
}

bool SseBackendClient::sendEnvelope(const Envelope& envelope) {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(endpointMutex);
        path = messagePath;
    }
    if (path.empty()) return false;

    std::lock_guard<std::mutex> lock(postMutex);
    if (!postClient) return false;
    auto res = postClient->Post(path, EnvelopeCodec::encode(envelope), "application/json");
    if (!res) {
        Logger::getInstance().warn("Backend " + options.name + " POST failed: " + httplib::to_string(res.error()));
        return false;
    }
    if (res->status / 100 != 2) {
        Logger::getInstance().warn("Backend " + options.name + " POST returned HTTP " + std::to_string(res->status));
        return false;
    }
    return true;
}
