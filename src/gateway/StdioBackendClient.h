#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <sys/types.h>
#include "gateway/RpcBackendClient.h"
#include "core/ConfigManager.h"

/**
 * @brief Backend spawned as a child process, newline-delimited JSON on its stdin/stdout.
 *
 * The child's stderr is inherited so its diagnostics end up next to ours.
 * Lines on stdout that are not JSON objects are skipped.
 */
class StdioBackendClient : public RpcBackendClient {
public:
    StdioBackendClient(Config::BackendConfig config, BackendOptions options);
    ~StdioBackendClient() override;

    std::string describe() const override;
    bool connect(std::chrono::milliseconds timeout) override;
    bool isConnected() const override { return running.load(); }
    void close() override;

protected:
    bool sendEnvelope(const Envelope& envelope) override;

private:
    bool startProcess();
    void stopProcess();
    void readerLoop();

    const Config::BackendConfig config;
    pid_t pid = -1;
    int writeFd = -1;
    int readFd = -1;
    std::mutex writeMutex;
    std::thread readerThread;
    std::atomic<bool> stopReader{false};
    std::atomic<bool> running{false};
};
