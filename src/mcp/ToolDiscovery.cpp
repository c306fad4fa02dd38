#include "mcp/ToolDiscovery.h"
#include "mcp/ProtocolExchange.h"
#include "mcp/ToolExtraction.h"

namespace {
// 探测者在任何退出路径上都要释放等待同一 serverId 的调用者
class OwnedClaim {
public:
    OwnedClaim(ToolResultCache& cache, const std::string& serverId) : cache(cache), serverId(serverId) {}
    ~OwnedClaim() {
        if (!finished) cache.finish(serverId, {}, false);
    }

    OwnedClaim(const OwnedClaim&) = delete;
    OwnedClaim& operator=(const OwnedClaim&) = delete;

    void store(const std::vector<std::string>& names) {
        finished = true;
        cache.finish(serverId, names, true);
    }

private:
    ToolResultCache& cache;
    const std::string& serverId;
    bool finished = false;
};

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}
} // namespace

ToolDiscovery::ToolDiscovery(DiscoveryOptions options, DiagnosticSink sink, std::shared_ptr<IProcessLauncher> launcher)
    : options(options), launcher(std::move(launcher)) {
    // 诊断只是旁路信息：接收器抛出的异常不能影响发现流程
    this->sink = [inner = std::move(sink)](LogLevel level, const std::string& message) {
        if (!inner) return;
        try {
            inner(level, message);
        } catch (const std::exception& e) {
            Logger::getInstance().warn(std::string("Diagnostic sink failed: ") + e.what());
        } catch (...) {
            Logger::getInstance().warn("Diagnostic sink failed: unknown exception");
        }
    };
    if (!this->launcher) {
        this->launcher = std::make_shared<ProcessLauncher>();
    }
}

void ToolDiscovery::emit(LogLevel level, const std::string& message) const {
    sink(level, message);
}

std::vector<std::string> ToolDiscovery::discoverTools(const std::string& serverId, const ServerConfig& serverConfig) {
    ToolResultCache::Claim claim = cache.claim(serverId);
    if (claim.cached) {
        emit(LogLevel::DEBUG, "Using cached tools for " + serverId);
        return *claim.cached;
    }
    if (!claim.owner) {
        emit(LogLevel::DEBUG, "Waiting for in-flight discovery of " + serverId);
        return claim.pending.get();
    }

    OwnedClaim ownedClaim(cache, serverId);
    std::vector<std::string> tools;
    try {
        tools = runDiscovery(serverId, serverConfig);
    } catch (const std::exception& e) {
        emit(LogLevel::ERROR, "Failed to discover tools for " + serverId + ": " + e.what());
        return {};
    } catch (...) {
        emit(LogLevel::ERROR, "Failed to discover tools for " + serverId + ": unknown error");
        return {};
    }

    ownedClaim.store(tools);
    emit(LogLevel::DEBUG, "Discovered " + std::to_string(tools.size()) + " tools for " + serverId + ": " +
                              join(tools, ", "));
    return tools;
}

std::vector<std::string> ToolDiscovery::runDiscovery(const std::string& serverId, const ServerConfig& serverConfig) {
    emit(LogLevel::INFO, "Discovering tools for " + serverId);
    const std::string spawnFailed = "Discovery session for " + serverId + " ended: " +
                                    terminationReasonName(TerminationReason::SPAWN_FAILED);
    if (serverConfig.command.empty()) {
        emit(LogLevel::DEBUG, spawnFailed);
        throw SpawnFailure("No command defined for server " + serverId);
    }

    LaunchRequest request;
    request.command = serverConfig.command;
    request.args = ProcessLauncher::effectiveArgs(serverConfig.args);
    request.env = serverConfig.env;
    emit(LogLevel::DEBUG, "Running command: " + request.command + " " + join(request.args, " "));

    std::unique_ptr<ProcessSession> session;
    try {
        session = launcher->launch(request);
    } catch (const SpawnFailure&) {
        emit(LogLevel::DEBUG, spawnFailed);
        throw;
    }

    ExchangeOptions exchangeOptions;
    exchangeOptions.timeoutMs = options.timeoutMs;
    exchangeOptions.startupDelayMs = options.startupDelayMs;
    ProtocolExchange exchange(exchangeOptions, sink);
    ExchangeOutcome outcome = exchange.run(*session);
    emit(LogLevel::DEBUG, "Discovery session for " + serverId + " ended: " + terminationReasonName(outcome.reason) +
                              " after " + std::to_string(outcome.elapsedMs) + "ms");

    if (outcome.reason == TerminationReason::EXITED) {
        if (outcome.exitCode > 0) {
            emit(LogLevel::WARNING, "Server process exited with code " + std::to_string(outcome.exitCode));
            if (!session->stderrText.empty()) {
                emit(LogLevel::DEBUG, "Error output: " + session->stderrText);
            }
        } else if (outcome.termSignal != 0) {
            emit(LogLevel::DEBUG, "Server process was terminated as expected");
        }
    }

    ToolExtraction::ExtractionChain chain(sink, serverId);
    ToolExtraction::ExtractionResult result = chain.extractFromStreams(session->stdoutText, session->stderrText);
    return result.names;
}

std::future<std::vector<std::string>> ToolDiscovery::discoverToolsAsync(const std::string& serverId,
                                                                        const ServerConfig& serverConfig) {
    return std::async(std::launch::async, [this, serverId, serverConfig]() {
        return discoverTools(serverId, serverConfig);
    });
}

std::map<std::string, std::vector<std::string>> ToolDiscovery::discoverAll(
    const std::vector<std::pair<std::string, ServerConfig>>& servers) {
    std::vector<std::pair<std::string, std::future<std::vector<std::string>>>> futures;
    for (const auto& [id, cfg] : servers) {
        if (cfg.disabled) {
            emit(LogLevel::DEBUG, "Skipping disabled server " + id);
            continue;
        }
        futures.push_back({id, discoverToolsAsync(id, cfg)});
    }

    std::map<std::string, std::vector<std::string>> results;
    for (auto& f : futures) {
        results[f.first] = f.second.get();
    }
    return results;
}

void ToolDiscovery::clearCache() {
    cache.clear();
    emit(LogLevel::INFO, "Tool discovery cache cleared");
}
