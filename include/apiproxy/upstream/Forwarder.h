#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/Resolver.h"
#include "apiproxy/protocol/HttpHeaders.h"
#include "apiproxy/protocol/Url.h"
#include "apiproxy/upstream/UpstreamPool.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace apiproxy {
namespace network {
class EventLoop;
class TlsContext;
}

namespace upstream {

struct OutboundRequest {
    std::string method;
    protocol::Url url;
    protocol::HeaderList headers;
    std::string body;
};

struct UpstreamResponse {
    int status{0};
    std::string reason;
    protocol::HeaderList headers;
    std::string body;
};

enum class ForwardError {
    kNone,
    kConnect,   // DNS, TCP connect or TLS handshake failed
    kTimeout,   // connect or total deadline expired
    kOther,     // send failure, malformed response, reset before a status line
    kBodyRead,  // headers received, body cut short
};

const char* ForwardErrorName(ForwardError e);

struct UpstreamClientOptions {
    double connectTimeoutSec{10.0};
    double requestTimeoutSec{3600.0};
    int tcpKeepAliveSec{60};
    size_t poolMaxIdlePerHost{20};
    double poolIdleTimeoutSec{90.0};
    double dnsTtlSec{300.0};
    bool verifyPeer{true};
    std::string caFile;
};

// Shared outbound HTTP/1.1 client. One instance serves every worker loop; each exchange
// runs entirely on the loop it was started from.
class Forwarder : common::noncopyable {
public:
    using ResultCallback = std::function<void(ForwardError, UpstreamResponse&&)>;

    explicit Forwarder(const UpstreamClientOptions& options);
    ~Forwarder();

    // Sets up the TLS client context. Call once before Send().
    bool Init(std::string* error);

    // Warm the DNS cache so worker loops do not block on first use.
    bool Prime(const std::string& host, std::string* error);

    // Starts the exchange; cb runs exactly once, later, on loop.
    void Send(network::EventLoop* loop, OutboundRequest request, ResultCallback cb);

    // Drops idle upstream connections on each loop and waits for it. Call from outside
    // those loops before they stop.
    void Shutdown(const std::vector<network::EventLoop*>& loops);

    UpstreamPool& pool() { return pool_; }
    network::Resolver& resolver() { return resolver_; }
    const UpstreamClientOptions& options() const { return options_; }

    // Request head as written to the upstream.
    static std::string SerializeHead(const OutboundRequest& request);

private:
    class Exchange;

    const UpstreamClientOptions options_;
    network::Resolver resolver_;
    UpstreamPool pool_;
    std::shared_ptr<network::TlsContext> tls_;
};

} // namespace upstream
} // namespace apiproxy
