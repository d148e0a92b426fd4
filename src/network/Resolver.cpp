#include "apiproxy/network/Resolver.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/common/Logger.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <cstring>

namespace apiproxy {
namespace network {

Resolver::Resolver(double ttlSec)
    : ttl_(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          std::chrono::duration<double>(ttlSec > 0.0 ? ttlSec : 0.0))) {
}

Resolver::~Resolver() {
    Stop();
}

std::optional<InetAddress> Resolver::Resolve(const std::string& host, uint16_t port, std::string* error) {
    if (auto numeric = InetAddress::FromIpPort(host, port)) {
        return numeric;
    }

    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(host);
        if (it != cache_.end() && now < it->second.expires) {
            struct sockaddr_in addr = it->second.addr;
            addr.sin_port = htons(port);
            return InetAddress(addr);
        }
    }

    auto addr = Lookup(host, error);
    if (!addr) return std::nullopt;
    Store(host, *addr);
    addr->sin_port = htons(port);
    return InetAddress(*addr);
}

void Resolver::ResolveAsync(EventLoop* loop, const std::string& host, uint16_t port, ResolveCallback cb) {
    if (auto numeric = InetAddress::FromIpPort(host, port)) {
        cb(numeric, std::string());
        return;
    }

    bool expired = false;
    std::optional<struct sockaddr_in> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(host);
        if (it != cache_.end()) {
            cached = it->second.addr;
            expired = std::chrono::steady_clock::now() >= it->second.expires;
        }
    }

    if (cached) {
        if (expired) {
            // Keep serving the old address until the refresh lands.
            Enqueue(Job{host, 0, nullptr, ResolveCallback()});
        }
        cached->sin_port = htons(port);
        cb(InetAddress(*cached), std::string());
        return;
    }

    Job job{host, port, loop, cb};
    if (!Enqueue(std::move(job))) {
        cb(std::nullopt, "resolver stopped");
    }
}

void Resolver::Store(const std::string& host, const struct sockaddr_in& addr) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[host] = Entry{addr, std::chrono::steady_clock::now() + ttl_};
}

bool Resolver::Enqueue(Job job) {
    std::lock_guard<std::mutex> lock(jobMutex_);
    if (stop_.load()) return false;
    if (!job.loop) {
        // One refresh per host at a time.
        if (!refreshing_.insert(job.host).second) return true;
    }
    jobs_.push_back(std::move(job));
    if (!th_.joinable()) {
        th_ = std::thread([this]() { ThreadMain(); });
    }
    jobCond_.notify_one();
    return true;
}

void Resolver::Stop() {
    std::deque<Job> pending;
    {
        std::lock_guard<std::mutex> lock(jobMutex_);
        if (stop_.exchange(true)) return;
        pending.swap(jobs_);
        refreshing_.clear();
    }
    jobCond_.notify_all();
    if (th_.joinable()) th_.join();

    for (auto& job : pending) {
        if (!job.loop) continue;
        ResolveCallback cb = std::move(job.cb);
        job.loop->QueueInLoop([cb]() { cb(std::nullopt, "resolver stopped"); });
    }
}

void Resolver::ThreadMain() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(jobMutex_);
            jobCond_.wait(lock, [this]() { return stop_.load() || !jobs_.empty(); });
            if (stop_.load()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        std::string error;
        auto addr = Lookup(job.host, &error);
        if (addr) Store(job.host, *addr);

        if (!job.loop) {
            if (!addr) LOG_WARN << "DNS refresh failed, keeping old address: " << error;
            std::lock_guard<std::mutex> lock(jobMutex_);
            refreshing_.erase(job.host);
            continue;
        }

        std::optional<InetAddress> result;
        if (addr) {
            addr->sin_port = htons(job.port);
            result = InetAddress(*addr);
        }
        ResolveCallback cb = std::move(job.cb);
        job.loop->QueueInLoop([cb, result, error]() { cb(result, error); });
    }
}

bool Resolver::Prime(const std::string& host, std::string* error) {
    return Resolve(host, 0, error).has_value();
}

void Resolver::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t Resolver::CacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::optional<struct sockaddr_in> Resolver::Lookup(const std::string& host, std::string* error) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (gai != 0 || !res) {
        if (error) *error = std::string("cannot resolve ") + host + ": " + ::gai_strerror(gai);
        if (res) ::freeaddrinfo(res);
        return std::nullopt;
    }

    struct sockaddr_in addr;
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    ::freeaddrinfo(res);

    char ip[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof ip);
    LOG_DEBUG << "Resolved " << host << " -> " << ip;
    return addr;
}

} // namespace network
} // namespace apiproxy
