#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/InetAddress.h"
#include "apiproxy/network/Callbacks.h"

#include <functional>
#include <memory>
#include <atomic>

namespace apiproxy {
namespace network {

class Channel;
class EventLoop;

// Single non-blocking connect attempt. Reports either a connected fd or the errno of
// the failure; never retries.
class Connector : public std::enable_shared_from_this<Connector>,
                  common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }
    void SetConnectFailureCallback(const ConnectFailureCallback& cb) {
        connectFailureCallback_ = cb;
    }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int savedErrno);
    int RemoveAndResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    std::atomic_bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ConnectFailureCallback connectFailureCallback_;
};

} // namespace network
} // namespace apiproxy
