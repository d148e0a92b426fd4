#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/InetAddress.h"
#include "apiproxy/network/Socket.h"
#include "apiproxy/network/Channel.h"

#include <functional>

namespace apiproxy {
namespace network {

class EventLoop;

class Acceptor : common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }
    // Binds and starts listening; false (with the reason logged) if the address is unusable.
    bool Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    InetAddress listen_addr_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
};

} // namespace network
} // namespace apiproxy
