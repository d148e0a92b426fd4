#include "apiproxy/upstream/Forwarder.h"
#include "apiproxy/network/Buffer.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/TcpConnection.h"
#include "apiproxy/network/Timer.h"
#include "apiproxy/network/TlsContext.h"
#include "apiproxy/protocol/HttpResponseContext.h"
#include "apiproxy/common/Logger.h"

#include <cstring>
#include <future>

namespace apiproxy {
namespace upstream {

const char* ForwardErrorName(ForwardError e) {
    switch (e) {
        case ForwardError::kNone: return "none";
        case ForwardError::kConnect: return "connect";
        case ForwardError::kTimeout: return "timeout";
        case ForwardError::kOther: return "other";
        case ForwardError::kBodyRead: return "body-read";
    }
    return "unknown";
}

namespace {

// Framing is ours; these never pass through from the inbound side.
const protocol::HeaderNameSet kHopHeaders = {
    "host", "content-length", "transfer-encoding", "connection", "keep-alive",
    "proxy-connection", "te", "trailer", "upgrade", "expect",
};

bool MethodCarriesBody(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

} // namespace

std::string Forwarder::SerializeHead(const OutboundRequest& request) {
    std::string head;
    head.reserve(256);
    head += request.method;
    head += ' ';
    head += request.url.requestTarget();
    head += " HTTP/1.1\r\nHost: ";
    head += request.url.hostHeader();
    head += "\r\n";
    for (const auto& kv : request.headers) {
        if (kHopHeaders.contains(kv.first)) continue;
        head += kv.first;
        head += ": ";
        head += kv.second;
        head += "\r\n";
    }
    if (!request.body.empty() || MethodCarriesBody(request.method)) {
        head += "Content-Length: ";
        head += std::to_string(request.body.size());
        head += "\r\n";
    }
    head += "Connection: keep-alive\r\n\r\n";
    return head;
}

// One request/response exchange on one upstream connection. Kept alive by its deadline
// timer until it finishes.
class Forwarder::Exchange : public std::enable_shared_from_this<Exchange> {
public:
    Exchange(Forwarder* owner, network::EventLoop* loop, OutboundRequest request, ResultCallback cb)
        : owner_(owner), loop_(loop), request_(std::move(request)), cb_(std::move(cb)) {}

    void Start() {
        startTime_ = std::chrono::steady_clock::now();
        auto self = shared_from_this();
        totalTimer_ = loop_->RunAfter(owner_->options_.requestTimeoutSec, [self]() {
            LOG_WARN << "Upstream request to " << self->request_.url.withoutQuery() << " timed out after "
                     << self->owner_->options_.requestTimeoutSec << "s";
            self->Finish(ForwardError::kTimeout);
        });
        if (!totalTimer_) {
            Finish(ForwardError::kOther);
            return;
        }
        wire_ = SerializeHead(request_);
        wire_ += request_.body;

        owner_->resolver_.ResolveAsync(loop_, request_.url.host, request_.url.port,
                                       [self](std::optional<network::InetAddress> addr, const std::string& error) {
            self->OnResolved(addr, error);
        });
    }

private:
    void OnResolved(const std::optional<network::InetAddress>& addr, const std::string& error) {
        // The deadline may have passed while the lookup was running.
        if (done_) return;
        if (!addr) {
            LOG_WARN << "Cannot resolve upstream " << request_.url.host << ": " << error;
            Finish(ForwardError::kConnect);
            return;
        }
        addr_ = *addr;
        Connect(false);
    }

    void Connect(bool forceFresh) {
        auto self = shared_from_this();
        std::weak_ptr<Exchange> weak(self);
        connectTimer_ = loop_->RunAfter(owner_->options_.connectTimeoutSec, [weak]() {
            auto ex = weak.lock();
            if (!ex) return;
            LOG_WARN << "Connect to " << ex->request_.url.origin() << " (" << ex->addr_.toIpPort()
                     << ") timed out after " << ex->owner_->options_.connectTimeoutSec << "s";
            ex->Finish(ForwardError::kTimeout);
        });

        std::shared_ptr<network::TlsContext> tls = request_.url.isHttps() ? owner_->tls_ : nullptr;
        lease_ = owner_->pool_.Acquire(loop_, request_.url.origin(), addr_, tls, request_.url.host,
                                       [weak](bool connected, int savedErrno) {
            auto ex = weak.lock();
            if (ex) ex->OnReady(connected, savedErrno);
        }, !forceFresh);
    }

    void OnReady(bool connected, int savedErrno) {
        if (done_) return;
        if (connectTimer_) {
            connectTimer_->Cancel();
            connectTimer_.reset();
        }
        if (!connected) {
            if (lease_ && lease_->reused()) {
                // Nothing has been written to it yet; open a new connection instead.
                LOG_DEBUG << "Idle connection to " << request_.url.origin() << " closed before reuse, reconnecting";
                ReleaseLease(false);
                Connect(true);
                return;
            }
            if (savedErrno != 0) {
                LOG_WARN << "Connect to " << request_.url.origin() << " (" << addr_.toIpPort()
                         << ") failed: " << std::strerror(savedErrno);
            } else {
                LOG_WARN << "TLS handshake with " << request_.url.origin() << " failed";
            }
            Finish(ForwardError::kConnect);
            return;
        }

        std::weak_ptr<Exchange> weak(shared_from_this());
        lease_->SetHandlers(
            [weak](const network::TcpConnectionPtr&, network::Buffer* buf, std::chrono::system_clock::time_point) {
                auto ex = weak.lock();
                if (!ex) {
                    buf->RetrieveAll();
                    return;
                }
                ex->OnMessage(buf);
            },
            [weak]() {
                auto ex = weak.lock();
                if (ex) ex->OnClose();
            });

        network::TcpConnectionPtr conn = lease_->connection();
        if (!conn) {
            Finish(ForwardError::kOther);
            return;
        }
        parser_.reset();
        parser_.setHeadRequest(request_.method == "HEAD");
        LOG_DEBUG << "-> " << request_.method << " " << request_.url.withoutQuery() << " via " << conn->name()
                  << (lease_->reused() ? " (reused)" : "");
        conn->Send(wire_);
    }

    void OnMessage(network::Buffer* buf) {
        if (done_) {
            buf->RetrieveAll();
            return;
        }
        const bool ok = parser_.feed(buf->Peek(), buf->ReadableBytes());
        buf->RetrieveAll();
        if (!ok) {
            LOG_WARN << "Malformed response from " << request_.url.origin();
            Finish(ForwardError::kOther);
            return;
        }
        if (parser_.gotAll()) {
            Finish(ForwardError::kNone);
        }
    }

    void OnClose() {
        if (done_) return;
        if (parser_.onClose()) {
            Finish(ForwardError::kNone);
            return;
        }
        if (parser_.headersComplete()) {
            LOG_WARN << "Upstream " << request_.url.origin() << " closed mid-body after "
                     << parser_.body().size() << " bytes";
            Finish(ForwardError::kBodyRead);
            return;
        }
        LOG_WARN << "Upstream " << request_.url.origin() << " closed before sending a status line";
        Finish(ForwardError::kOther);
    }

    void ReleaseLease(bool keepAlive) {
        if (!lease_) return;
        // Handlers of this lease may be on the stack; release from a fresh loop iteration.
        UpstreamPool::LeasePtr lease = std::move(lease_);
        loop_->QueueInLoop([lease, keepAlive]() { lease->Release(keepAlive); });
    }

    void Finish(ForwardError error) {
        if (done_) return;
        done_ = true;
        auto self = shared_from_this();

        if (connectTimer_) {
            connectTimer_->Cancel();
            connectTimer_.reset();
        }
        if (totalTimer_) {
            totalTimer_->Cancel();
            totalTimer_.reset();
        }
        ReleaseLease(error == ForwardError::kNone && parser_.keepAlive());

        UpstreamResponse response;
        if (error == ForwardError::kNone) {
            response.status = parser_.statusCode();
            response.reason = parser_.reasonPhrase();
            response.headers = parser_.headers();
            response.body.swap(parser_.mutableBody());
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime_);
            LOG_DEBUG << "<- " << response.status << " from " << request_.url.origin() << " in "
                      << elapsed.count() << "ms, " << response.body.size() << " bytes";
        }
        ResultCallback cb = std::move(cb_);
        cb_ = nullptr;
        if (cb) cb(error, std::move(response));
    }

    Forwarder* owner_;
    network::EventLoop* loop_;
    OutboundRequest request_;
    ResultCallback cb_;
    std::string wire_;
    network::InetAddress addr_;
    std::chrono::steady_clock::time_point startTime_;

    std::shared_ptr<network::Timer> totalTimer_;
    std::shared_ptr<network::Timer> connectTimer_;
    UpstreamPool::LeasePtr lease_;
    protocol::HttpResponseContext parser_;
    bool done_{false};
};

Forwarder::Forwarder(const UpstreamClientOptions& options)
    : options_(options),
      resolver_(options.dnsTtlSec),
      pool_(UpstreamPool::Options{options.poolMaxIdlePerHost, options.poolIdleTimeoutSec, options.tcpKeepAliveSec}) {
}

Forwarder::~Forwarder() = default;

bool Forwarder::Init(std::string* error) {
    auto tls = std::make_shared<network::TlsContext>();
    if (!tls->InitClient(options_.verifyPeer, options_.caFile)) {
        if (error) *error = "TLS client setup failed: " + network::TlsContext::LastErrorString();
        return false;
    }
    if (!options_.verifyPeer) {
        LOG_WARN << "Upstream certificate verification is disabled";
    }
    tls_ = std::move(tls);
    return true;
}

bool Forwarder::Prime(const std::string& host, std::string* error) {
    return resolver_.Prime(host, error);
}

void Forwarder::Send(network::EventLoop* loop, OutboundRequest request, ResultCallback cb) {
    auto exchange = std::make_shared<Exchange>(this, loop, std::move(request), std::move(cb));
    // Never complete synchronously: the caller may still be setting up.
    loop->QueueInLoop([exchange]() { exchange->Start(); });
}

void Forwarder::Shutdown(const std::vector<network::EventLoop*>& loops) {
    resolver_.Stop();
    std::vector<std::future<void>> done;
    for (network::EventLoop* loop : loops) {
        if (loop->IsInLoopThread()) {
            pool_.ClearLoop(loop);
            continue;
        }
        auto promise = std::make_shared<std::promise<void>>();
        done.push_back(promise->get_future());
        loop->QueueInLoop([this, loop, promise]() {
            pool_.ClearLoop(loop);
            promise->set_value();
        });
    }
    for (auto& f : done) f.wait();
}

} // namespace upstream
} // namespace apiproxy
