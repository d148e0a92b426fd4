#include "apiproxy/network/TcpServer.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/Acceptor.h"
#include "apiproxy/common/Logger.h"

#include <functional>
#include <cstdio>

namespace apiproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

bool TcpServer::Start() {
    if (started_++ != 0) return true;
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer [" << name_ << "] cannot listen on " << hostport_;
        return false;
    }
    threadPool_->Start();
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << hostport_
             << (tlsCtx_ ? " (TLS + plaintext)" : "");
    return true;
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();

    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            InetAddress::LocalAddressOf(sockfd),
                                            peerAddr,
                                            tlsCtx_ ? tlsCtx_->ctx() : nullptr,
                                            TcpConnection::TlsRole::kServerSniff));
    connections_[connName] = conn;
    conn->SetTcpNoDelay(true);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Defer removal to avoid re-entrancy inside TcpConnection event callbacks.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(
        std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace apiproxy
