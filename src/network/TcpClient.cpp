#include "apiproxy/network/TcpClient.h"
#include "apiproxy/network/Connector.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/TlsContext.h"
#include "apiproxy/common/Logger.h"

#include <cstdio>

namespace apiproxy {
namespace network {

namespace detail {
void removeConnection(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}
} // namespace detail

TcpClient::TcpClient(EventLoop* loop,
                     const InetAddress& serverAddr,
                     const std::string& nameArg,
                     std::shared_ptr<TlsContext> tls,
                     const std::string& tlsServerName)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(nameArg),
      tls_(std::move(tls)),
      tlsServerName_(tlsServerName),
      connect_(true),
      established_(false),
      keepAliveIdleSec_(0),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
    connector_->SetConnectFailureCallback(
        std::bind(&TcpClient::OnConnectFailure, this, std::placeholders::_1));
    LOG_DEBUG << "TcpClient::TcpClient[" << name_ << "] - connector " << connector_.get();
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "] - connector " << connector_.get();
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = connection_;
    }
    if (conn) {
        // Detach every callback that points back at this object before closing.
        CloseCallback cb = std::bind(&detail::removeConnection, loop_, std::placeholders::_1);
        loop_->RunInLoop([conn, cb]() {
            conn->SetConnectionCallback(ConnectionCallback());
            conn->SetMessageCallback(MessageCallback());
            conn->SetCloseCallback(cb);
            conn->ForceClose();
        });
    } else {
        connector_->Stop();
    }
}

const InetAddress& TcpClient::serverAddress() const {
    return connector_->serverAddress();
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to "
              << connector_->serverAddress().toIpPort();
    connect_ = true;
    connector_->Start();
}

void TcpClient::Disconnect() {
    connect_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_) {
            connection_->Shutdown();
        }
    }
}

void TcpClient::Stop() {
    connect_ = false;
    connector_->Stop();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = InetAddress::PeerAddressOf(sockfd);
    InetAddress localAddr = InetAddress::LocalAddressOf(sockfd);

    char buf[64];
    std::snprintf(buf, sizeof buf, ":%s#%d", peerAddr.toIpPort().c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr,
                                            tls_ ? tls_->ctx() : nullptr,
                                            tls_ ? TcpConnection::TlsRole::kClient : TcpConnection::TlsRole::kNone));
    if (tls_) {
        conn->SetTlsServerName(tlsServerName_, tls_->verifyPeer());
    }
    conn->SetTcpNoDelay(true);
    if (keepAliveIdleSec_ > 0) {
        conn->SetKeepAliveIdle(keepAliveIdleSec_);
    }

    conn->SetConnectionCallback(
        std::bind(&TcpClient::OnConnectionEvent, this, std::placeholders::_1));
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::OnConnectionEvent(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        established_ = true;
    } else if (!established_) {
        // Closed during the TLS handshake.
        OnConnectFailure(0);
        return;
    }
    if (connectionCallback_) {
        connectionCallback_(conn);
    }
}

void TcpClient::OnConnectFailure(int savedErrno) {
    LOG_DEBUG << "TcpClient[" << name_ << "] connect to " << connector_->serverAddress().toIpPort()
              << " failed errno=" << savedErrno;
    if (connect_ && connectFailureCallback_) {
        // One report per client.
        ConnectFailureCallback cb = std::move(connectFailureCallback_);
        connectFailureCallback_ = nullptr;
        cb(savedErrno);
    }
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }

    loop_->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace apiproxy
