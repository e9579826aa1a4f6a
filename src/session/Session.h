#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include "protocol/Envelope.h"
#include "utils/Channel.h"

enum class TransportKind {
    Stdio,
    Sse
};

const char* transportKindName(TransportKind kind);

/**
 * @brief One client connection bound to exactly one Protocol Core run.
 *
 * The transport feeds decoded envelopes into input() and drains output();
 * the core does the opposite. Channels belong to this session only.
 */
class Session {
public:
    Session(std::string id, TransportKind kind, size_t queueCapacity);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& getId() const { return id; }
    TransportKind getKind() const { return kind; }
    std::chrono::system_clock::time_point getCreatedAt() const { return createdAt; }

    Channel<Envelope>& input() { return inputChannel; }
    Channel<Envelope>& output() { return outputChannel; }

    void touch();
    std::chrono::steady_clock::time_point getLastActivity() const;

    // Graceful half-close: the core stops reading and drains with its grace period.
    void closeInput();

    // Transport-fatal teardown: both channels close, pending calls are cancelled at once.
    void abort();
    bool isAborted() const { return aborted.load(); }

    void markFinished();
    bool isFinished() const;
    bool waitFinished(std::chrono::milliseconds timeout);

private:
    const std::string id;
    const TransportKind kind;
    const std::chrono::system_clock::time_point createdAt;
    std::atomic<std::chrono::steady_clock::rep> lastActivity;
    std::atomic<bool> aborted{false};

    Channel<Envelope> inputChannel;
    Channel<Envelope> outputChannel;

    mutable std::mutex finishMutex;
    std::condition_variable finishCv;
    bool finished = false;
};
