#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <vector>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    // Empty path disables file output.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void log(LogLevel level, const std::string& message) {
        LogCallback notify;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (level < minLevel) return;
            // stdout carries protocol frames, diagnostics only ever go to stderr
            printToStderr(level, message);
            notify = callback;
        }
        // Called unlocked so a callback may log itself.
        if (notify) {
            notify(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    static bool parseLevel(const std::string& name, LogLevel& out);
    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    LogCallback callback;
    LogLevel minLevel = LogLevel::INFO;
    std::string logFilePath;
    std::mutex mtx;

    void printToStderr(LogLevel level, const std::string& message);
};
