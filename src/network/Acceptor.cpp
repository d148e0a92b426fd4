#include "apiproxy/network/Acceptor.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace apiproxy {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      listen_addr_(listenAddr),
      accept_socket_(Socket::CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      listenning_(false) {

    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    if (listenning_) {
        accept_channel_.DisableAll();
        accept_channel_.Remove();
    }
}

bool Acceptor::Listen() {
    if (accept_socket_.fd() < 0) return false;
    if (!accept_socket_.BindAddress(listen_addr_)) return false;
    if (!accept_socket_.Listen()) return false;
    listenning_ = true;
    accept_channel_.EnableReading();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int savedErrno = errno;
        if (savedErrno == EAGAIN || savedErrno == EINTR || savedErrno == ECONNABORTED) return;
        LOG_ERROR << "Acceptor::HandleRead accept failed: " << std::strerror(savedErrno);
        if (savedErrno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace apiproxy
