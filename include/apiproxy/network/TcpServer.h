#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/InetAddress.h"
#include "apiproxy/network/Callbacks.h"
#include "apiproxy/network/TcpConnection.h"
#include "apiproxy/network/EventLoopThreadPool.h"
#include "apiproxy/network/TlsContext.h"

#include <map>
#include <vector>
#include <string>
#include <atomic>
#include <memory>

namespace apiproxy {
namespace network {

class EventLoop;
class Acceptor;

class TcpServer : common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Worker loops; 0 serves every connection on the accepting loop.
    void SetThreadNum(int numThreads);

    // TLS termination (optional). The listener then accepts both HTTPS and plain HTTP by
    // sniffing the first byte of each connection.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Loops serving connections (the accepting loop when there are no workers). Valid after Start().
    std::vector<EventLoop*> GetAllLoops() const { return threadPool_->GetAllLoops(); }

    // Binds, listens and starts the worker loops. Call in the loop thread.
    bool Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    std::unique_ptr<EventLoopThreadPool> threadPool_;
    std::shared_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace apiproxy
