#pragma once

#include "apiproxy/common/noncopyable.h"

namespace apiproxy {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);
    // Seconds of idle time before the first keep-alive probe.
    void SetKeepAliveIdle(int idleSec);

    static int CreateNonblocking();

private:
    const int sockfd_;
};

} // namespace network
} // namespace apiproxy
