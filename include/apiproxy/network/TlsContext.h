#pragma once

#include "apiproxy/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace apiproxy {
namespace network {

// Owns an SSL_CTX for either the listener (server) or upstream connections (client).
class TlsContext : common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);
    // TLS 1.2+. With verifyPeer the chain is checked against caFile, or the system
    // trust store when caFile is empty; hostname checks are set per connection.
    bool InitClient(bool verifyPeer, const std::string& caFile = std::string());

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Drains the OpenSSL error queue into one line for logging.
    static std::string LastErrorString();

private:
    void Reset();

    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{false};
};

} // namespace network
} // namespace apiproxy
