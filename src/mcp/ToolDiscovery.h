#pragma once
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "mcp/ProcessLauncher.h"
#include "mcp/ToolResultCache.h"
#include "utils/Logger.h"

struct DiscoveryOptions {
    int timeoutMs = Config::kDefaultTimeoutMs;
    int startupDelayMs = Config::kDefaultStartupDelayMs;

    static DiscoveryOptions fromConfig(const Config& cfg) {
        DiscoveryOptions options;
        options.timeoutMs = cfg.discovery.timeoutMs;
        options.startupDelayMs = cfg.discovery.startupDelayMs;
        return options;
    }
};

/**
 * @brief MCP 服务器工具发现引擎
 *
 * 启动服务器进程，发送一次 tools/list 请求，在超时内收集输出，
 * 再按优先级链从输出中提取工具名。结果按 serverId 永久缓存。
 *
 * discoverTools 从不抛异常：所有失败都降级为空列表 + 诊断事件。
 * 启动失败的结果不缓存，下次调用会重试。
 */
class ToolDiscovery {
public:
    explicit ToolDiscovery(DiscoveryOptions options = DiscoveryOptions(),
                           DiagnosticSink sink = loggerSink(),
                           std::shared_ptr<IProcessLauncher> launcher = std::make_shared<ProcessLauncher>());

    std::vector<std::string> discoverTools(const std::string& serverId, const ServerConfig& serverConfig);

    std::future<std::vector<std::string>> discoverToolsAsync(const std::string& serverId,
                                                             const ServerConfig& serverConfig);

    // 并行探测所有未禁用的服务器
    std::map<std::string, std::vector<std::string>> discoverAll(
        const std::vector<std::pair<std::string, ServerConfig>>& servers);

    void clearCache();

    bool isCached(const std::string& serverId) const { return cache.contains(serverId); }
    size_t cachedServerCount() const { return cache.size(); }

private:
    DiscoveryOptions options;
    DiagnosticSink sink;
    std::shared_ptr<IProcessLauncher> launcher;
    ToolResultCache cache;

    void emit(LogLevel level, const std::string& message) const;
    std::vector<std::string> runDiscovery(const std::string& serverId, const ServerConfig& serverConfig);
};
