#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/TcpConnection.h"
#include <mutex>

namespace apiproxy {
namespace network {

class Connector;
class EventLoop;
class TlsContext;

// One outbound connection. With a TLS context the connection callback fires only after
// the handshake; any failure before that point goes to the connect-failure callback.
class TcpClient : common::noncopyable {
public:
    TcpClient(EventLoop* loop,
              const InetAddress& serverAddr,
              const std::string& nameArg,
              std::shared_ptr<TlsContext> tls = nullptr,
              const std::string& tlsServerName = std::string());
    ~TcpClient();

    void Connect();
    void Disconnect();
    void Stop();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    const std::string& name() const { return name_; }
    const InetAddress& serverAddress() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    // errno of the socket failure, or 0 for a TLS handshake failure.
    void SetConnectFailureCallback(const ConnectFailureCallback& cb) { connectFailureCallback_ = cb; }
    void SetKeepAliveIdle(int idleSec) { keepAliveIdleSec_ = idleSec; }

private:
    void NewConnection(int sockfd);
    void OnConnectionEvent(const TcpConnectionPtr& conn);
    void OnConnectFailure(int savedErrno);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;
    std::shared_ptr<TlsContext> tls_;
    std::string tlsServerName_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    ConnectFailureCallback connectFailureCallback_;

    bool connect_;
    bool established_;
    int keepAliveIdleSec_;
    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace apiproxy
