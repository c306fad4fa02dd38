#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::INFO: return "info";
        case LogLevel::SUCCESS: return "success";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

int Logger::severity(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return 0;
        case LogLevel::INFO:
        case LogLevel::SUCCESS: return 1;
        case LogLevel::WARNING: return 2;
        case LogLevel::ERROR: return 3;
    }
    return 1;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    // 1. Append to the log file when one is configured
    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            logFile << std::put_time(std::localtime(&now), "[%Y-%m-%d %H:%M:%S] ");
            switch (level) {
                case LogLevel::ERROR: logFile << "[ERROR] "; break;
                case LogLevel::WARNING: logFile << "[WARN] "; break;
                case LogLevel::INFO: logFile << "[INFO] "; break;
                case LogLevel::SUCCESS: logFile << "[OK] "; break;
                default: logFile << "[DEBUG] "; break;
            }
            logFile << message << std::endl;
        }
    }

    // 2. Simple prefix without rigid alignment
    std::string prefix;
    switch (level) {
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // stdout is reserved for command output
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << std::endl;
    }
}
