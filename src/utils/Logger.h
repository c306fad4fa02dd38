#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

// 诊断输出的统一入口。发现引擎通过 DiagnosticSink 回调接入，默认转发到这里。
using DiagnosticSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    using LogCallback = DiagnosticSink;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    // Records below this level are dropped (DEBUG < INFO < WARNING < ERROR)
    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    // Empty path disables the log file
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (severity(level) < severity(minLevel)) return;
        printToConsole(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    std::string logFilePath = "toolscout.log";

    static int severity(LogLevel level);
    void printToConsole(LogLevel level, const std::string& message);
};

// 默认的诊断接收器：把引擎事件写入全局 Logger
inline DiagnosticSink loggerSink() {
    return [](LogLevel level, const std::string& message) {
        Logger::getInstance().log(level, message);
    };
}
