#pragma once
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @brief serverId -> 工具名列表 的永久缓存
 *
 * 没有过期时间，空结果同样会被缓存，直到 clear()。
 * 读写并发安全；同一 serverId 正在探测时，其他调用者通过 claim() 拿到同一个 future 等待结果。
 */
class ToolResultCache {
public:
    using Names = std::vector<std::string>;

    std::optional<Names> get(const std::string& serverId) const;
    void put(const std::string& serverId, Names names);
    bool contains(const std::string& serverId) const;
    size_t size() const;
    void clear();

    struct Claim {
        bool owner = false;                 // true: caller must run discovery and then call finish()
        std::optional<Names> cached;        // set on a cache hit
        std::shared_future<Names> pending;  // valid when another call is probing
    };

    // 原子地检查缓存 / 正在进行的探测，必要时登记为探测者
    Claim claim(const std::string& serverId);
    // Publish the discovery outcome to waiters; `store` decides whether it is cached
    void finish(const std::string& serverId, const Names& names, bool store);

private:
    mutable std::shared_mutex mtx;
    std::map<std::string, Names> entries;
    std::map<std::string, std::shared_ptr<std::promise<Names>>> inFlight;
    std::map<std::string, std::shared_future<Names>> inFlightFutures;
};
