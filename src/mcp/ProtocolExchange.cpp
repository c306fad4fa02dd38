#include "mcp/ProtocolExchange.h"
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <unistd.h>
#include <utility>

namespace {
using Clock = std::chrono::steady_clock;

long long millisSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// 读到 EAGAIN 为止；EOF 或错误时返回 false
bool readAvailable(int fd, std::string& out, std::string* lastChunk) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            if (lastChunk) lastChunk->assign(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

std::string preview(const std::string& chunk) {
    return chunk.substr(0, 100) + "...";
}
} // namespace

const std::string& ProtocolExchange::toolsListRequest() {
    // ordered_json 保持字段顺序与线上格式一致
    static const std::string request = nlohmann::ordered_json{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "tools/list"},
        {"params", nlohmann::ordered_json::object()}
    }.dump() + "\n";
    return request;
}

ProtocolExchange::ProtocolExchange(ExchangeOptions options, DiagnosticSink sink)
    : options(options), sink(std::move(sink)) {}

void ProtocolExchange::emit(LogLevel level, const std::string& message) const {
    if (sink) sink(level, message);
}

bool ProtocolExchange::writeRequest(ProcessSession& session) {
    const std::string& request = toolsListRequest();
    if (!session.stdinOpen() || session.hasExited()) {
        emit(LogLevel::DEBUG, "Failed to write to stdin: stream is not writable");
        return false;
    }

    emit(LogLevel::DEBUG, "Sending JSON-RPC request: " + request.substr(0, request.size() - 1));
    size_t offset = 0;
    while (offset < request.size()) {
        ssize_t n = write(session.stdinFd(), request.data() + offset, request.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        emit(LogLevel::DEBUG, std::string("Failed to write to stdin: ") +
                                  (n < 0 ? std::strerror(errno) : "short write"));
        return false;
    }
    return true;
}

void ProtocolExchange::drain(ProcessSession& session) {
    if (session.stdoutOpen()) {
        std::string chunk;
        if (!readAvailable(session.stdoutFd(), session.stdoutText, &chunk)) {
            session.closeStdout();
        }
        if (!chunk.empty()) {
            if (chunk.find("\"jsonrpc\"") != std::string::npos &&
                (chunk.find("\"result\"") != std::string::npos || chunk.find("\"error\"") != std::string::npos)) {
                emit(LogLevel::DEBUG, "Received potential JSON-RPC response: " + preview(chunk));
            } else if (chunk.find("function") != std::string::npos && chunk.find("name") != std::string::npos) {
                emit(LogLevel::DEBUG, "Received potential tool data: " + preview(chunk));
            }
        }
    }
    if (session.stderrOpen()) {
        if (!readAvailable(session.stderrFd(), session.stderrText, nullptr)) {
            session.closeStderr();
        }
    }
}

ExchangeOutcome ProtocolExchange::run(ProcessSession& session) {
    ExchangeOutcome outcome;
    const auto started = Clock::now();
    const long long timeoutMs = options.timeoutMs;
    const long long writeAtMs = options.startupDelayMs;
    bool writeAttempted = false;

    while (true) {
        drain(session);

        // 竞争的一方：进程自然退出
        if (!session.hasExited() && session.pollExit()) {
            session.resolve(TerminationReason::EXITED);
        }
        const bool pipesClosed = !session.stdoutOpen() && !session.stderrOpen();
        if (session.hasExited() && pipesClosed) break;

        // 另一方：超时计时器。脱离进程组后仍持有管道的进程也由它兜底。
        const long long elapsed = millisSince(started);
        if (elapsed >= timeoutMs) {
            if (session.resolve(TerminationReason::TIMED_OUT)) {
                emit(LogLevel::INFO, "Completed discovery - terminated server process after " +
                                         std::to_string(timeoutMs) + "ms");
            }
            session.kill();
            drain(session);
            break;
        }

        if (!writeAttempted && elapsed >= writeAtMs) {
            writeAttempted = true;
            outcome.requestWritten = writeRequest(session);
        }

        long long wait = timeoutMs - elapsed;
        if (!writeAttempted) wait = std::min(wait, writeAtMs - elapsed);
        // 进程已退出但管道仍开着时也需要定期检查；未退出时需要轮询 waitpid
        wait = std::max<long long>(1, std::min<long long>(wait, 50));

        pollfd fds[2];
        nfds_t count = 0;
        if (session.stdoutOpen()) fds[count++] = {session.stdoutFd(), POLLIN, 0};
        if (session.stderrOpen()) fds[count++] = {session.stderrFd(), POLLIN, 0};
        if (count > 0) {
            poll(fds, count, static_cast<int>(wait));
        } else {
            usleep(static_cast<useconds_t>(wait * 1000));
        }
    }

    // Reap now so the outcome carries the final status
    session.release();
    outcome.reason = session.reason();
    outcome.exitCode = session.exitCode();
    outcome.termSignal = session.termSignal();
    outcome.elapsedMs = millisSince(started);
    return outcome;
}
