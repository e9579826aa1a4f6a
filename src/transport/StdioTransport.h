#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include "transport/ITransport.h"
#include "transport/LineBuffer.h"

class Session;
class SessionManager;

/**
 * @brief Newline-delimited envelopes over a pair of file descriptors.
 *
 * Exactly one session per transport. stderr is never written here; it
 * belongs to the logger.
 */
class StdioTransport : public ITransport {
public:
    StdioTransport(SessionManager& sessions, int readFd = STDIN_FILENO, int writeFd = STDOUT_FILENO);
    ~StdioTransport() override;

    std::string name() const override { return "stdio"; }
    bool start() override;
    void run() override;
    void stop() override;

    std::shared_ptr<Session> getSession() const { return session; }

private:
    void readerLoop();
    void writerLoop();
    void handleLine(const std::string& line);
    bool writeAll(const std::string& data);

    SessionManager& sessions;
    int readFd;
    int writeFd;
    std::shared_ptr<Session> session;
    std::thread writerThread;
    std::atomic<bool> stopRequested{false};
    LineBuffer lines;
};
