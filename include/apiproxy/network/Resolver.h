#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/InetAddress.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>

namespace apiproxy {
namespace network {

class EventLoop;

// Host name to IPv4 address, with a shared TTL cache. Resolve() calls getaddrinfo on the
// caller's thread and is meant for startup. ResolveAsync() never blocks the loop: cache
// misses go to a background thread, expired entries are served while they refresh.
class Resolver : common::noncopyable {
public:
    // address is nullopt on failure, with the reason in error.
    using ResolveCallback = std::function<void(std::optional<InetAddress> address, const std::string& error)>;

    explicit Resolver(double ttlSec = 300.0);
    ~Resolver();

    // Dotted-quad hosts skip the cache. On failure returns nullopt and fills *error.
    std::optional<InetAddress> Resolve(const std::string& host, uint16_t port, std::string* error);

    // Call in loop's thread. cb runs on loop: inline for numeric hosts and cache hits
    // (fresh or expired), otherwise once the lookup thread has an answer.
    void ResolveAsync(EventLoop* loop, const std::string& host, uint16_t port, ResolveCallback cb);

    bool Prime(const std::string& host, std::string* error);

    // Stops the lookup thread. Queued lookups are failed on their loops, so call it while
    // those loops still run.
    void Stop();

    void Clear();
    size_t CacheSize() const;

private:
    struct Entry {
        struct sockaddr_in addr;
        std::chrono::steady_clock::time_point expires;
    };

    struct Job {
        std::string host;
        uint16_t port;
        EventLoop* loop;        // null for a background refresh
        ResolveCallback cb;
    };

    static std::optional<struct sockaddr_in> Lookup(const std::string& host, std::string* error);
    void Store(const std::string& host, const struct sockaddr_in& addr);
    // false once stopped.
    bool Enqueue(Job job);
    void ThreadMain();

    const std::chrono::steady_clock::duration ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> cache_;

    std::mutex jobMutex_;
    std::condition_variable jobCond_;
    std::deque<Job> jobs_;
    std::set<std::string> refreshing_;
    std::atomic<bool> stop_{false};
    std::thread th_;
};

} // namespace network
} // namespace apiproxy
