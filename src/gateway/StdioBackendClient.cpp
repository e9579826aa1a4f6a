#include "gateway/StdioBackendClient.h"
#include "transport/LineBuffer.h"
#include "utils/Logger.h"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

StdioBackendClient::StdioBackendClient(Config::BackendConfig config, BackendOptions options)
    : RpcBackendClient(std::move(options)), config(std::move(config)) {}

StdioBackendClient::~StdioBackendClient() {
    stopProcess();
}

std::string StdioBackendClient::describe() const {
    std::string cmd = config.command;
    for (const auto& arg : config.args) cmd += " " + arg;
    return "process: " + cmd;
}

bool StdioBackendClient::connect(std::chrono::milliseconds timeout) {
    if (running.load()) return true;
    if (!startProcess()) return false;
    if (!handshake(timeout)) {
        Logger::getInstance().warn("Backend " + options.name + " handshake failed: " + lastError());
        stopProcess();
        return false;
    }
    Logger::getInstance().info("Backend " + options.name + " connected (" + describe() + ")");
    return true;
}

void StdioBackendClient::close() {
    stopProcess();
}

bool StdioBackendClient::startProcess() {
    std::signal(SIGPIPE, SIG_IGN);

    int inPipe[2];
    int outPipe[2];
    if (pipe(inPipe) != 0) {
        setLastError(std::string("pipe failed: ") + std::strerror(errno));
        return false;
    }
    if (pipe(outPipe) != 0) {
        setLastError(std::string("pipe failed: ") + std::strerror(errno));
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        return false;
    }

    std::vector<std::string> args;
    args.push_back(config.command);
    args.insert(args.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid = fork();
    if (pid == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        for (const auto& [key, value] : config.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    if (pid < 0) {
        setLastError(std::string("fork failed: ") + std::strerror(errno));
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        pid = -1;
        return false;
    }

    ::close(inPipe[0]);
    ::close(outPipe[1]);
    writeFd = inPipe[1];
    readFd = outPipe[0];
    fcntl(writeFd, F_SETFD, FD_CLOEXEC);
    fcntl(readFd, F_SETFD, FD_CLOEXEC);

    stopReader = false;
    running = true;
    readerThread = std::thread(&StdioBackendClient::readerLoop, this);
    return true;
}

void StdioBackendClient::stopProcess() {
    if (pid <= 0) return;
    stopReader = true;
    running = false;
    {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (writeFd >= 0) ::close(writeFd);
        writeFd = -1;
    }
    if (readerThread.joinable()) readerThread.join();
    if (readFd >= 0) ::close(readFd);
    readFd = -1;

    kill(pid, SIGTERM);
    int status = 0;
    waitpid(pid, &status, 0);
    pid = -1;
    failPending("backend stopped");
}

void StdioBackendClient::readerLoop() {
    LineBuffer lines;
    char buf[4096];
    while (!stopReader) {
        pollfd pfd{readFd, POLLIN, 0};
        int rc = poll(&pfd, 1, 200);
        if (rc < 0 && errno != EINTR) break;
        if (rc <= 0) continue;

        ssize_t n = read(readFd, buf, sizeof(buf));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) break;

        for (const auto& line : lines.append(buf, static_cast<size_t>(n))) {
            size_t first = line.find_first_not_of(" \t");
            if (first == std::string::npos || line[first] != '{') {
                if (first != std::string::npos) {
                    Logger::getInstance().debug("Backend " + options.name + " stdout: " + line);
                }
                continue;
            }
            DecodeResult decoded = EnvelopeCodec::decode(line);
            if (auto* env = std::get_if<Envelope>(&decoded)) {
                deliver(*env);
            } else {
                Logger::getInstance().debug("Backend " + options.name + ": skipping undecodable line");
            }
        }
    }

    if (!stopReader) {
        Logger::getInstance().warn("Backend " + options.name + " closed its output");
    }
    running = false;
    failPending("backend exited");
}

bool StdioBackendClient::sendEnvelope(const Envelope& envelope) {
    std::string line = EnvelopeCodec::encode(envelope) + "\n";
    std::lock_guard<std::mutex> lock(writeMutex);
    if (writeFd < 0) return false;
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = write(writeFd, line.data() + total, line.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}
