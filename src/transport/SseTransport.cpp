#include "transport/SseTransport.h"
#include "transport/SseEvent.h"
#include "transport/FrameWriter.h"
#include "session/SessionManager.h"
#include "protocol/Envelope.h"
#include "utils/Logger.h"
#include <algorithm>
#include <thread>
#include <nlohmann/json.hpp>

namespace {
std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

// Upper bound for one wait on the output channel, so stop() is noticed promptly.
const std::chrono::milliseconds kMaxWait{100};
} // namespace

SseOptions SseOptions::fromConfig(const Config& cfg) {
    SseOptions o;
    o.serviceName = cfg.server.name;
    o.host = cfg.server.host;
    o.port = cfg.server.port;
    o.endpoint = cfg.sse.endpoint;
    o.messageEndpoint = cfg.sse.messageEndpoint;
    o.healthEndpoint = cfg.sse.healthEndpoint;
    o.keepaliveInterval = std::chrono::milliseconds(static_cast<long long>(cfg.sse.keepaliveInterval * 1000.0));
    o.maxConnections = cfg.sse.maxConnections;
    o.maxWriteFailures = cfg.sse.maxWriteFailures;
    o.corsOrigins = cfg.sse.corsOrigins;
    o.corsMethods = cfg.sse.corsMethods;
    o.corsHeaders = cfg.sse.corsHeaders;
    o.corsMaxAge = cfg.sse.corsMaxAge;
    return o;
}

struct SseTransport::Stream {
    explicit Stream(int maxWriteFailures) : writer(maxWriteFailures) {}

    std::shared_ptr<Session> session;
    std::string pending;  // frame that has not been written yet
    FrameWriter writer;
    std::chrono::steady_clock::time_point lastWrite = std::chrono::steady_clock::now();
};

SseTransport::SseTransport(SessionManager& sessions, SseOptions options)
    : sessions(sessions), options(std::move(options)) {
    // Every open stream pins one worker, plus headroom for POSTs and rejections.
    size_t workers = static_cast<size_t>(std::max(this->options.maxConnections, 1)) + 8;
    server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    setupRoutes();
}

SseTransport::~SseTransport() {
    stop();
}

void SseTransport::setupRoutes() {
    server.Get(options.endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handleStream(req, res);
    });
    server.Post(options.messageEndpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handleMessage(req, res);
    });
    server.Get(options.healthEndpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handleHealth(req, res);
    });
    server.Options(options.endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handlePreflight(req, res);
    });
    server.Options(options.messageEndpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handlePreflight(req, res);
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        Logger::getInstance().debug("sse: " + req.remote_addr + " \"" + req.method + " " + req.path + "\" " +
                                    std::to_string(res.status));
    });
}

bool SseTransport::start() {
    if (options.port == 0) {
        boundPort = server.bind_to_any_port(options.host);
    } else if (server.bind_to_port(options.host, options.port)) {
        boundPort = options.port;
    }
    if (boundPort <= 0) {
        Logger::getInstance().error("sse: could not bind " + options.host + ":" + std::to_string(options.port));
        return false;
    }
    Logger::getInstance().info("sse: listening on " + options.host + ":" + std::to_string(boundPort) +
                               " (stream " + options.endpoint + ", messages " + options.messageEndpoint + ")");
    return true;
}

void SseTransport::run() {
    if (!server.listen_after_bind()) {
        if (!stopping.load()) Logger::getInstance().error("sse: server loop ended unexpectedly");
    }
}

void SseTransport::stop() {
    if (stopping.exchange(true)) return;
    server.stop();
}

void SseTransport::applyCors(const httplib::Request& req, httplib::Response& res) const {
    const auto& allowed = options.corsOrigins;
    if (std::find(allowed.begin(), allowed.end(), "*") != allowed.end()) {
        res.set_header("Access-Control-Allow-Origin", "*");
    } else {
        std::string origin = req.get_header_value("Origin");
        if (origin.empty() || std::find(allowed.begin(), allowed.end(), origin) == allowed.end()) return;
        res.set_header("Access-Control-Allow-Origin", origin);
        res.set_header("Vary", "Origin");
    }
    res.set_header("Access-Control-Allow-Methods", join(options.corsMethods, ", "));
    res.set_header("Access-Control-Allow-Headers", join(options.corsHeaders, ", "));
}

void SseTransport::handlePreflight(const httplib::Request& req, httplib::Response& res) {
    applyCors(req, res);
    if (res.has_header("Access-Control-Allow-Origin")) {
        res.set_header("Access-Control-Max-Age", std::to_string(options.corsMaxAge));
    }
    res.status = 204;
}

void SseTransport::handleHealth(const httplib::Request& req, httplib::Response& res) {
    int current = active.load();
    nlohmann::json body = {
        {"status", current < options.maxConnections ? "healthy" : "degraded"},
        {"service", options.serviceName},
        {"active", current},
        {"max", options.maxConnections}
    };
    applyCors(req, res);
    res.status = 200;
    res.set_content(body.dump(), "application/json");
}

void SseTransport::handleStream(const httplib::Request& req, httplib::Response& res) {
    applyCors(req, res);

    if (active.fetch_add(1) >= options.maxConnections || stopping.load()) {
        active.fetch_sub(1);
        Logger::getInstance().warn("sse: connection limit reached, rejecting " + req.remote_addr);
        res.status = 503;
        res.set_header("Retry-After", "1");
        res.set_content("{\"error\":\"Too many connections\"}", "application/json");
        return;
    }

    auto stream = std::make_shared<Stream>(options.maxWriteFailures);
    stream->session = sessions.open(TransportKind::Sse);
    if (!stream->session) {
        active.fetch_sub(1);
        res.status = 503;
        res.set_header("Retry-After", "1");
        res.set_content("{\"error\":\"Server is shutting down\"}", "application/json");
        return;
    }

    SseEvent endpoint;
    endpoint.event = "endpoint";
    endpoint.data = options.messageEndpoint + "?session_id=" + stream->session->getId();
    stream->pending = endpoint.format();

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    Logger::getInstance().info("sse: stream opened for " + req.remote_addr + " session " + stream->session->getId());

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, stream](size_t /*offset*/, httplib::DataSink& sink) {
            return provide(*stream, sink);
        },
        [this, stream](bool success) {
            active.fetch_sub(1);
            auto& session = stream->session;
            if (!session->isFinished()) {
                if (success) {
                    session->closeInput();
                } else {
                    sessions.abort(session->getId());
                }
            }
            Logger::getInstance().info("sse: stream closed for session " + session->getId());
        });
}

bool SseTransport::writeFrame(Stream& stream, httplib::DataSink& sink) {
    FrameWriter::WritableFn writable;
    if (sink.is_writable) writable = [&sink] { return sink.is_writable(); };
    auto status = stream.writer.write(
        stream.pending, [&sink](const char* data, size_t length) { return sink.write(data, length); }, writable);

    switch (status) {
        case FrameWriter::Status::Written:
            stream.pending.clear();
            stream.lastWrite = std::chrono::steady_clock::now();
            return true;
        case FrameWriter::Status::Deferred:
            Logger::getInstance().warn("sse: session " + stream.session->getId() + " not writable (" +
                                       std::to_string(stream.writer.failures()) + "/" +
                                       std::to_string(options.maxWriteFailures) + ")");
            std::this_thread::sleep_for(kMaxWait);
            return true;
        case FrameWriter::Status::Broken:
            break;
    }
    Logger::getInstance().warn("sse: write failed for session " + stream.session->getId() + ", closing stream");
    return false;
}

bool SseTransport::provide(Stream& stream, httplib::DataSink& sink) {
    if (stopping.load()) return false;

    if (!stream.pending.empty()) {
        return writeFrame(stream, sink);
    }

    auto sinceWrite = std::chrono::steady_clock::now() - stream.lastWrite;
    auto untilKeepalive = std::chrono::duration_cast<std::chrono::milliseconds>(options.keepaliveInterval - sinceWrite);
    auto wait = std::max(std::chrono::milliseconds(1), std::min(untilKeepalive, kMaxWait));

    auto env = stream.session->output().receiveFor(wait);
    if (env) {
        SseEvent event;
        event.data = EnvelopeCodec::encode(*env);
        stream.pending = event.format();
    } else if (stream.session->output().isDrained()) {
        // The core run is over; end the response cleanly.
        sink.done();
        return true;
    } else if (std::chrono::steady_clock::now() - stream.lastWrite >= options.keepaliveInterval) {
        SseEvent keepalive;
        keepalive.event = "keepalive";
        keepalive.data = "";
        stream.pending = keepalive.format();
    } else {
        return true;
    }
    return writeFrame(stream, sink);
}

void SseTransport::handleMessage(const httplib::Request& req, httplib::Response& res) {
    applyCors(req, res);

    std::string sessionId = req.has_param("session_id") ? req.get_param_value("session_id") : "";
    std::shared_ptr<Session> session;
    if (!sessionId.empty()) session = sessions.find(sessionId);
    if (!session) {
        res.status = 404;
        res.set_content("{\"error\":\"Session not found\"}", "application/json");
        return;
    }
    session->touch();

    DecodeResult decoded = EnvelopeCodec::decode(req.body);
    if (auto* err = std::get_if<DecodeError>(&decoded)) {
        Logger::getInstance().warn("sse: undecodable message for session " + sessionId + ": " + err->message);
        if (!session->output().trySendFor(EnvelopeCodec::errorFor(*err), kMaxWait)) {
            Logger::getInstance().warn("sse: could not queue parse error for session " + sessionId);
        }
        nlohmann::json body = {{"error", err->message}, {"offset", err->offset}};
        res.status = 400;
        res.set_content(body.dump(), "application/json");
        return;
    }

    if (!session->input().trySendFor(std::get<Envelope>(std::move(decoded)), std::chrono::milliseconds(0))) {
        if (session->input().isClosed()) {
            res.status = 404;
            res.set_content("{\"error\":\"Session closed\"}", "application/json");
        } else {
            res.status = 503;
            res.set_header("Retry-After", "1");
            res.set_content("{\"error\":\"Session input queue is full\"}", "application/json");
        }
        return;
    }

    res.status = 202;
    res.set_content("Accepted", "text/plain");
}
