#include "apiproxy/network/Connector.h"
#include "apiproxy/network/Channel.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/Socket.h"
#include "apiproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

namespace apiproxy {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() {
    if (channel_) {
        // Stop() was not called while connecting; release the half-open socket.
        channel_->DisableAll();
        channel_->Remove();
        ::close(channel_->fd());
    }
}

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stopped before start";
    }
}

void Connector::Stop() {
    connect_ = false;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = Socket::CreateNonblocking();
    if (sockfd < 0) {
        const int savedErrno = errno;
        if (connectFailureCallback_) connectFailureCallback_(savedErrno);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback(std::bind(&Connector::HandleWrite, this));
    channel_->SetErrorCallback(std::bind(&Connector::HandleError, this));
    channel_->Tie(shared_from_this());
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we may be inside Channel::HandleEvent
    Channel* ch = channel_.release();
    loop_->QueueInLoop([ch]() { delete ch; });
    return sockfd;
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }

    if (err) {
        Fail(sockfd, err);
        return;
    }

    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }
    Fail(sockfd, err != 0 ? err : ECONNREFUSED);
}

void Connector::Fail(int sockfd, int savedErrno) {
    ::close(sockfd);
    SetState(kDisconnected);
    LOG_DEBUG << "Connector to " << serverAddr_.toIpPort() << " failed: " << std::strerror(savedErrno);
    if (connect_ && connectFailureCallback_) {
        connectFailureCallback_(savedErrno);
    }
}

} // namespace network
} // namespace apiproxy
