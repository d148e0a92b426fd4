#include "apiproxy/network/InetAddress.h"
#include "apiproxy/common/Logger.h"

#include <cstring>
#include <cstdio>
#include <cerrno>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace apiproxy {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

std::optional<InetAddress> InetAddress::FromIpPort(const std::string& ip, uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }
    return InetAddress(addr);
}

InetAddress InetAddress::LocalAddressOf(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_ERROR << "getsockname fd=" << sockfd << " errno=" << errno;
    }
    return InetAddress(addr);
}

InetAddress InetAddress::PeerAddressOf(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getpeername(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_DEBUG << "getpeername fd=" << sockfd << " errno=" << errno;
    }
    return InetAddress(addr);
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    size_t end = std::strlen(buf);
    uint16_t port = ntohs(addr_.sin_port);
    std::snprintf(buf + end, sizeof buf - end, ":%u", port);
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

} // namespace network
} // namespace apiproxy
