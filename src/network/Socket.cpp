#include "apiproxy/network/Socket.h"
#include "apiproxy/network/InetAddress.h"
#include "apiproxy/common/Logger.h"

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>

namespace apiproxy {
namespace network {

Socket::~Socket() {
    ::close(sockfd_);
}

int Socket::CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_ERROR << "Socket::CreateNonblocking errno=" << errno << " " << std::strerror(errno);
    }
    return sockfd;
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) != 0) {
        LOG_ERROR << "Socket::BindAddress " << localaddr.toIpPort() << " failed: " << std::strerror(errno);
        return false;
    }
    return true;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        LOG_ERROR << "Socket::Listen failed: " << std::strerror(errno);
        return false;
    }
    return true;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_DEBUG << "Socket::ShutdownWrite fd=" << sockfd_ << " errno=" << errno;
    }
}

void Socket::SetTcpNoDelay(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof optval);
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetReusePort(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof optval);
}

void Socket::SetKeepAlive(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_KEEPALIVE, &optval, sizeof optval);
}

void Socket::SetKeepAliveIdle(int idleSec) {
    if (idleSec <= 0) return;
    SetKeepAlive(true);
    int optval = idleSec;
    if (::setsockopt(sockfd_, IPPROTO_TCP, TCP_KEEPIDLE, &optval, sizeof optval) < 0) {
        LOG_WARN << "setsockopt TCP_KEEPIDLE fd=" << sockfd_ << " errno=" << errno;
    }
}

} // namespace network
} // namespace apiproxy
