#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string timestamp() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tmBuf{};
        localtime_r(&now, &tmBuf);
        std::ostringstream ss;
        ss << std::put_time(&tmBuf, "[%Y-%m-%d %H:%M:%S] ");
        return ss.str();
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") { out = LogLevel::DEBUG; return true; }
    if (upper == "INFO") { out = LogLevel::INFO; return true; }
    if (upper == "WARNING" || upper == "WARN") { out = LogLevel::WARNING; return true; }
    if (upper == "ERROR") { out = LogLevel::ERROR; return true; }
    return false;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "DEBUG";
}

void Logger::printToStderr(LogLevel level, const std::string& message) {
    std::string ts = timestamp();

    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            logFile << ts << "[" << levelName(level) << "] " << message << std::endl;
        }
    }

    std::string prefix;
    switch (level) {
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "[Warn] " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "[Error] " + RESET;
            break;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    std::stringstream ss(trimmedMsg);
    std::string line;
    bool first = true;
    while (std::getline(ss, line)) {
        if (first) {
            std::cerr << GRAY << ts << RESET << prefix << line << std::endl;
        } else {
            std::cerr << GRAY << "  | " << RESET << line << std::endl;
        }
        first = false;
    }
}
