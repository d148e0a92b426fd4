#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/InetAddress.h"
#include "apiproxy/network/Callbacks.h"
#include "apiproxy/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>

struct ssl_ctx_st;
struct ssl_st;

namespace apiproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;

class TcpConnection : common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    enum class TlsRole {
        kNone,
        kServerSniff, // listener: TLS if the first byte is a handshake record, else plaintext
        kClient       // upstream: always TLS, handshake before the connection is reported
    };

    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr,
                  TlsRole tlsRole = TlsRole::kNone);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    // SNI name and, when verifyHost is set, the name the peer certificate must match.
    // Client role only; call before ConnectEstablished().
    void SetTlsServerName(const std::string& serverName, bool verifyHost);

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    void SetKeepAliveIdle(int idleSec);
    void SetTcpNoDelay(bool on);

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) { highWaterMarkCallback_ = cb; highWaterMark_ = highWaterMark; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection / TcpClient connects
    void ConnectEstablished();
    // Called when the owner has dropped me
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsState { kTlsPlain, kTlsHandshake, kTlsEstablished };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();
    void OnTlsEstablished();

    bool tlsEnabled() const { return tlsCtx_ != nullptr; }
    bool tlsTryInitFromPeek();
    bool tlsInitClient();
    // true once established; on fatal failure sets tlsFailed_.
    bool tlsDoHandshake();
    ssize_t tlsReadOnce(char* buf, size_t cap, int* savedErrno);
    ssize_t tlsWriteOnce(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    ssl_ctx_st* tlsCtx_{nullptr};
    TlsRole tlsRole_{TlsRole::kNone};
    ssl_st* ssl_{nullptr};
    TlsState tlsState_{kTlsPlain};
    bool tlsWantWrite_{false};
    bool tlsFailed_{false};
    std::string tlsServerName_;
    bool tlsVerifyHost_{false};
};

} // namespace network
} // namespace apiproxy
