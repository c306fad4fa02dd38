#pragma once
#include <string>
#include "mcp/ProcessSession.h"
#include "utils/Logger.h"

struct ExchangeOptions {
    int timeoutMs = 10000;
    int startupDelayMs = 500;
};

struct ExchangeOutcome {
    TerminationReason reason = TerminationReason::NONE;
    int exitCode = -1;
    int termSignal = 0;
    bool requestWritten = false;
    long long elapsedMs = 0;
};

/**
 * @brief 与子进程进行一次 tools/list 交换
 *
 * 启动宽限期后写入一行 JSON-RPC 请求，同时持续收集 stdout/stderr。
 * 进程自然退出与超时计时器竞争，先到者决定会话结局；超时时杀死进程组，
 * 已收集的部分输出保留给后续提取。
 */
class ProtocolExchange {
public:
    ProtocolExchange(ExchangeOptions options, DiagnosticSink sink);

    ExchangeOutcome run(ProcessSession& session);

    // {"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}} + '\n'
    static const std::string& toolsListRequest();

private:
    ExchangeOptions options;
    DiagnosticSink sink;

    void emit(LogLevel level, const std::string& message) const;
    bool writeRequest(ProcessSession& session);
    void drain(ProcessSession& session);
};
