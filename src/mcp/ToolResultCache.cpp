#include "mcp/ToolResultCache.h"

std::optional<ToolResultCache::Names> ToolResultCache::get(const std::string& serverId) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    auto it = entries.find(serverId);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

void ToolResultCache::put(const std::string& serverId, Names names) {
    std::unique_lock<std::shared_mutex> lock(mtx);
    entries[serverId] = std::move(names);
}

bool ToolResultCache::contains(const std::string& serverId) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return entries.count(serverId) > 0;
}

size_t ToolResultCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return entries.size();
}

void ToolResultCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mtx);
    // 正在进行的探测不受影响，完成后照常写入
    entries.clear();
}

ToolResultCache::Claim ToolResultCache::claim(const std::string& serverId) {
    Claim claim;
    {
        std::shared_lock<std::shared_mutex> lock(mtx);
        auto it = entries.find(serverId);
        if (it != entries.end()) {
            claim.cached = it->second;
            return claim;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mtx);
    // 升级锁期间可能已有其他线程写入或登记
    auto it = entries.find(serverId);
    if (it != entries.end()) {
        claim.cached = it->second;
        return claim;
    }
    auto pending = inFlightFutures.find(serverId);
    if (pending != inFlightFutures.end()) {
        claim.pending = pending->second;
        return claim;
    }

    auto promise = std::make_shared<std::promise<Names>>();
    inFlightFutures[serverId] = promise->get_future().share();
    inFlight[serverId] = std::move(promise);
    claim.owner = true;
    return claim;
}

void ToolResultCache::finish(const std::string& serverId, const Names& names, bool store) {
    std::shared_ptr<std::promise<Names>> promise;
    {
        std::unique_lock<std::shared_mutex> lock(mtx);
        if (store) entries[serverId] = names;
        auto it = inFlight.find(serverId);
        if (it != inFlight.end()) {
            promise = std::move(it->second);
            inFlight.erase(it);
        }
        inFlightFutures.erase(serverId);
    }
    if (promise) promise->set_value(names);
}
