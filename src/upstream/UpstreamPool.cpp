#include "apiproxy/upstream/UpstreamPool.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/TcpClient.h"
#include "apiproxy/network/TlsContext.h"
#include "apiproxy/network/Buffer.h"
#include "apiproxy/common/Logger.h"

#include <cerrno>
#include <utility>

namespace apiproxy {
namespace upstream {

namespace {

// An idle connection has no business receiving bytes; anything arriving means the
// upstream is closing it or misbehaving.
void OnIdleMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf,
                   std::chrono::system_clock::time_point) {
    LOG_DEBUG << "Unexpected " << buf->ReadableBytes() << " bytes on idle upstream " << conn->name();
    buf->RetrieveAll();
    conn->ForceClose();
}

} // namespace

UpstreamPool::Lease::Lease(UpstreamPool* pool,
                           network::EventLoop* loop,
                           std::string origin,
                           std::shared_ptr<network::TcpClient> client,
                           bool reused)
    : pool_(pool), loop_(loop), origin_(std::move(origin)), client_(std::move(client)), reused_(reused) {
}

UpstreamPool::Lease::~Lease() {
    if (!released_ && client_) {
        Drop(loop_, std::move(client_));
    }
}

network::TcpConnectionPtr UpstreamPool::Lease::connection() const {
    if (!client_) return {};
    return client_->connection();
}

void UpstreamPool::Lease::SetHandlers(const network::MessageCallback& onMessage,
                                      const std::function<void()>& onClose) {
    if (released_ || !client_) return;
    client_->SetConnectionCallback([onClose](const network::TcpConnectionPtr& conn) {
        if (!conn->connected() && onClose) onClose();
    });
    network::TcpConnectionPtr conn = client_->connection();
    if (conn) conn->SetMessageCallback(onMessage);
}

void UpstreamPool::Lease::Release(bool keepAlive) {
    if (released_) return;
    released_ = true;
    if (!client_) return;

    client_->SetConnectionCallback(network::ConnectionCallback());
    client_->SetConnectFailureCallback(network::ConnectFailureCallback());
    network::TcpConnectionPtr conn = client_->connection();
    if (conn) conn->SetMessageCallback(&OnIdleMessage);

    pool_->ReleaseInternal(loop_, origin_, std::move(client_), keepAlive);
}

UpstreamPool::UpstreamPool(const Options& options) : options_(options) {}

UpstreamPool::~UpstreamPool() = default;

void UpstreamPool::Drop(network::EventLoop* loop, std::shared_ptr<network::TcpClient> client) {
    if (!client) return;
    // The client may be the one whose callback is running right now; destroy it later.
    loop->QueueInLoop([client]() {});
}

UpstreamPool::LeasePtr UpstreamPool::Acquire(network::EventLoop* loop,
                                             const std::string& origin,
                                             const network::InetAddress& addr,
                                             const std::shared_ptr<network::TlsContext>& tls,
                                             const std::string& serverName,
                                             ReadyCallback ready,
                                             bool allowReuse) {
    const auto now = std::chrono::steady_clock::now();
    const auto maxIdle = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(options_.idleTimeoutSec));

    // Fast path: reuse the freshest live idle connection on this loop.
    std::shared_ptr<network::TcpClient> reuse;
    std::vector<std::shared_ptr<network::TcpClient>> stale;
    if (allowReuse) {
        std::lock_guard<std::mutex> lock(mu_);
        auto& po = pools_[loop].origins[origin];
        while (!po.idle.empty()) {
            Idle entry = std::move(po.idle.back());
            po.idle.pop_back();
            if (!entry.client) continue;
            auto conn = entry.client->connection();
            if (!conn || !conn->connected() || now - entry.since > maxIdle) {
                stale.push_back(std::move(entry.client));
                continue;
            }
            reuse = std::move(entry.client);
            break;
        }
    }
    for (auto& c : stale) Drop(loop, std::move(c));

    if (reuse) {
        LOG_DEBUG << "Reusing idle connection to " << origin;
        auto lease = std::make_shared<Lease>(this, loop, origin, reuse, true);
        std::weak_ptr<Lease> weak(lease);
        loop->QueueInLoop([weak, ready]() {
            auto l = weak.lock();
            if (!l || l->released()) return;
            auto conn = l->connection();
            if (conn && conn->connected()) {
                ready(true, 0);
            } else {
                ready(false, ECONNRESET);
            }
        });
        return lease;
    }

    auto client = std::make_shared<network::TcpClient>(loop, addr, "Upstream-" + origin, tls, serverName);
    client->SetKeepAliveIdle(options_.keepAliveIdleSec);
    auto lease = std::make_shared<Lease>(this, loop, origin, client, false);
    std::weak_ptr<Lease> weak(lease);

    // Both callbacks fire at most once between them, and not after Release() clears them.
    auto done = std::make_shared<bool>(false);
    client->SetConnectionCallback([weak, ready, done](const network::TcpConnectionPtr& conn) {
        if (*done) return;
        *done = true;
        auto l = weak.lock();
        if (!l || l->released()) return;
        if (conn->connected()) {
            ready(true, 0);
        } else {
            ready(false, ECONNRESET);
        }
    });
    client->SetConnectFailureCallback([weak, ready, done](int savedErrno) {
        if (*done) return;
        *done = true;
        auto l = weak.lock();
        if (!l || l->released()) return;
        ready(false, savedErrno);
    });
    client->Connect();
    return lease;
}

void UpstreamPool::ReleaseInternal(network::EventLoop* loop,
                                   const std::string& origin,
                                   std::shared_ptr<network::TcpClient> client,
                                   bool keepAlive) {
    auto conn = client->connection();
    if (!keepAlive || !conn || !conn->connected()) {
        Drop(loop, std::move(client));
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto maxIdle = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(options_.idleTimeoutSec));
    std::vector<std::shared_ptr<network::TcpClient>> evicted;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto& po = pools_[loop].origins[origin];
        // Oldest entries sit at the front.
        while (!po.idle.empty() && now - po.idle.front().since > maxIdle) {
            evicted.push_back(std::move(po.idle.front().client));
            po.idle.erase(po.idle.begin());
        }
        if (po.idle.size() >= options_.maxIdlePerHost) {
            evicted.push_back(std::move(client));
        } else {
            po.idle.push_back(Idle{std::move(client), now});
        }
    }
    for (auto& c : evicted) Drop(loop, std::move(c));
}

void UpstreamPool::ClearLoop(network::EventLoop* loop) {
    PerLoop dropped;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = pools_.find(loop);
        if (it == pools_.end()) return;
        dropped = std::move(it->second);
        pools_.erase(it);
    }
    size_t n = 0;
    for (auto& kv : dropped.origins) n += kv.second.idle.size();
    LOG_DEBUG << "Closing " << n << " idle upstream connections";
}

size_t UpstreamPool::IdleCount(network::EventLoop* loop, const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto lit = pools_.find(loop);
    if (lit == pools_.end()) return 0;
    auto oit = lit->second.origins.find(origin);
    return oit == lit->second.origins.end() ? 0 : oit->second.idle.size();
}

} // namespace upstream
} // namespace apiproxy
