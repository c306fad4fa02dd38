#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <stdexcept>
#include "mcp/ProcessSession.h"

// 无法启动子进程（空命令、pipe/fork 失败、shell 无法执行）
class SpawnFailure : public std::runtime_error {
public:
    explicit SpawnFailure(const std::string& what) : std::runtime_error(what) {}
};

struct LaunchRequest {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    // Throws SpawnFailure. The returned session owns the child and its pipes.
    virtual std::unique_ptr<ProcessSession> launch(const LaunchRequest& request) = 0;
};

/**
 * @brief 通过 /bin/sh -c 启动 MCP 服务器进程
 *
 * 环境 = 当前进程环境 <- 调用方 env <- 发现模式标志。
 * 未提供参数时补上 --list-functions --discovery。
 */
class ProcessLauncher : public IProcessLauncher {
public:
    std::unique_ptr<ProcessSession> launch(const LaunchRequest& request) override;

    static const std::vector<std::string>& defaultDiscoveryArgs();
    static const std::vector<std::pair<std::string, std::string>>& discoveryEnvironment();

    static std::vector<std::string> effectiveArgs(const std::vector<std::string>& args);
    static std::map<std::string, std::string> buildEnvironment(const std::map<std::string, std::string>& overrides);
    // command verbatim, each argument single-quoted
    static std::string buildCommandLine(const std::string& command, const std::vector<std::string>& args);
    static std::string shellQuote(const std::string& value);
};
