#include "session/Session.h"

const char* transportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse: return "sse";
    }
    return "unknown";
}

Session::Session(std::string id, TransportKind kind, size_t queueCapacity)
    : id(std::move(id)),
      kind(kind),
      createdAt(std::chrono::system_clock::now()),
      lastActivity(std::chrono::steady_clock::now().time_since_epoch().count()),
      inputChannel(queueCapacity),
      outputChannel(queueCapacity) {}

void Session::touch() {
    lastActivity.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

std::chrono::steady_clock::time_point Session::getLastActivity() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(lastActivity.load()));
}

void Session::closeInput() {
    inputChannel.close();
}

void Session::abort() {
    aborted.store(true);
    inputChannel.close();
    outputChannel.close();
}

void Session::markFinished() {
    {
        std::lock_guard<std::mutex> lock(finishMutex);
        finished = true;
    }
    finishCv.notify_all();
}

bool Session::isFinished() const {
    std::lock_guard<std::mutex> lock(finishMutex);
    return finished;
}

bool Session::waitFinished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(finishMutex);
    return finishCv.wait_for(lock, timeout, [this] { return finished; });
}
