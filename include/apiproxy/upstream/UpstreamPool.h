#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/Callbacks.h"
#include "apiproxy/network/InetAddress.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace apiproxy {
namespace network {
class EventLoop;
class TcpClient;
class TlsContext;
}

namespace upstream {

// Per-loop, per-origin pool of idle keep-alive upstream connections (one in-flight
// request per connection). Idle connections never move between loops.
class UpstreamPool : common::noncopyable {
public:
    struct Options {
        size_t maxIdlePerHost{20};
        double idleTimeoutSec{90.0};
        int keepAliveIdleSec{60};  // TCP keep-alive probe idle time, 0 leaves the OS default
    };

    class Lease : common::noncopyable {
    public:
        Lease(UpstreamPool* pool,
              network::EventLoop* loop,
              std::string origin,
              std::shared_ptr<network::TcpClient> client,
              bool reused);
        ~Lease();

        network::TcpConnectionPtr connection() const;
        const std::string& origin() const { return origin_; }
        bool reused() const { return reused_; }
        bool released() const { return released_; }

        // Routes the connection's input and its close to the holder until Release().
        void SetHandlers(const network::MessageCallback& onMessage, const std::function<void()>& onClose);

        // keepAlive=true -> back to the idle list; else the connection is closed.
        // Must not be called from inside one of the handlers set above.
        void Release(bool keepAlive);

    private:
        UpstreamPool* pool_;
        network::EventLoop* loop_;
        std::string origin_;
        std::shared_ptr<network::TcpClient> client_;
        bool reused_;
        bool released_{false};
    };

    using LeasePtr = std::shared_ptr<Lease>;
    // connected=false carries the errno of the failure (0 for a TLS handshake failure).
    using ReadyCallback = std::function<void(bool connected, int savedErrno)>;

    explicit UpstreamPool(const Options& options);
    ~UpstreamPool();

    // Reuses an idle connection to origin on this loop or opens a new one. ready runs
    // later on loop, never from inside Acquire, and never after the lease is released.
    // tls is null for plain http; serverName is the SNI / verification name.
    // allowReuse=false always opens a new connection.
    LeasePtr Acquire(network::EventLoop* loop,
                     const std::string& origin,
                     const network::InetAddress& addr,
                     const std::shared_ptr<network::TlsContext>& tls,
                     const std::string& serverName,
                     ReadyCallback ready,
                     bool allowReuse = true);

    // Closes every idle connection owned by loop. Call in that loop's thread.
    void ClearLoop(network::EventLoop* loop);

    size_t IdleCount(network::EventLoop* loop, const std::string& origin) const;
    const Options& options() const { return options_; }

private:
    void ReleaseInternal(network::EventLoop* loop,
                         const std::string& origin,
                         std::shared_ptr<network::TcpClient> client,
                         bool keepAlive);

    struct Idle {
        std::shared_ptr<network::TcpClient> client;
        std::chrono::steady_clock::time_point since;
    };

    struct PerOrigin {
        std::vector<Idle> idle;  // most recently used at the back
    };

    struct PerLoop {
        std::unordered_map<std::string, PerOrigin> origins;
    };

    static void Drop(network::EventLoop* loop, std::shared_ptr<network::TcpClient> client);

    const Options options_;
    mutable std::mutex mu_;
    std::unordered_map<network::EventLoop*, PerLoop> pools_;
};

} // namespace upstream
} // namespace apiproxy
