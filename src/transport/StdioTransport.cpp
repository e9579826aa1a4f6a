#include "transport/StdioTransport.h"
#include "session/SessionManager.h"
#include "protocol/Envelope.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <poll.h>

StdioTransport::StdioTransport(SessionManager& sessions, int readFd, int writeFd)
    : sessions(sessions), readFd(readFd), writeFd(writeFd) {}

StdioTransport::~StdioTransport() {
    stop();
    if (writerThread.joinable()) writerThread.join();
}

bool StdioTransport::start() {
    // A vanished reader must surface as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    session = sessions.open(TransportKind::Stdio);
    if (!session) {
        Logger::getInstance().error("stdio: could not open a session");
        return false;
    }
    writerThread = std::thread(&StdioTransport::writerLoop, this);
    return true;
}

void StdioTransport::run() {
    if (!session) return;
    readerLoop();

    // Input is closed; the core drains and closes the output channel, which ends the writer.
    while (!session->waitFinished(std::chrono::milliseconds(200))) {
        if (stopRequested.load()) session->abort();
    }
    if (writerThread.joinable()) writerThread.join();
    Logger::getInstance().info("stdio: session " + session->getId() + " ended");
}

void StdioTransport::stop() {
    stopRequested.store(true);
    if (session) session->closeInput();
}

void StdioTransport::readerLoop() {
    char buf[4096];
    while (!stopRequested.load() && !session->isFinished()) {
        pollfd pfd{readFd, POLLIN, 0};
        int rc = poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::getInstance().error(std::string("stdio: poll failed: ") + std::strerror(errno));
            session->abort();
            return;
        }
        if (rc == 0) continue;

        ssize_t n = read(readFd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Logger::getInstance().warn(std::string("stdio: read failed: ") + std::strerror(errno));
            session->closeInput();
            return;
        }
        if (n == 0) {
            std::string rest = lines.takeRemainder();
            if (!rest.empty()) handleLine(rest);
            Logger::getInstance().info("stdio: end of input");
            session->closeInput();
            return;
        }

        size_t dropped = lines.overflowed();
        for (const auto& line : lines.append(buf, static_cast<size_t>(n))) {
            handleLine(line);
        }
        if (lines.overflowed() != dropped) {
            Logger::getInstance().warn("stdio: dropped an oversized line");
            session->output().send(makeErrorResponse(nullptr, ErrorCode::ParseError, "Parse error",
                                                     {{"detail", "line too long"}}));
        }
    }
    session->closeInput();
}

void StdioTransport::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t") == std::string::npos) return;

    DecodeResult decoded = EnvelopeCodec::decode(line);
    if (auto* err = std::get_if<DecodeError>(&decoded)) {
        Logger::getInstance().warn("stdio: undecodable line: " + err->message);
        session->output().send(EnvelopeCodec::errorFor(*err));
        return;
    }
    if (!session->input().send(std::get<Envelope>(std::move(decoded)))) {
        Logger::getInstance().debug("stdio: session no longer accepts input");
    }
}

bool StdioTransport::writeAll(const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = write(writeFd, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

void StdioTransport::writerLoop() {
    while (auto env = session->output().receive()) {
        if (!writeAll(EnvelopeCodec::encode(*env) + "\n")) {
            Logger::getInstance().warn(std::string("stdio: write failed: ") + std::strerror(errno));
            session->abort();
            break;
        }
    }
}
