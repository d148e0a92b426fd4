#pragma once

#include "apiproxy/network/TcpServer.h"
#include "apiproxy/common/noncopyable.h"
#include "apiproxy/protocol/HttpContext.h"
#include "apiproxy/protocol/HttpResponse.h"

#include <functional>
#include <memory>

namespace apiproxy {
namespace protocol {

class HttpRequest;

// HTTP/1.1 front end. One request is in flight per connection: bytes of a pipelined
// request are held until the current response has been written.
class HttpServer : common::noncopyable {
public:
    // Completes the request it was handed with. Call once, on the connection's loop.
    using Responder = std::function<void(HttpResponse)>;
    // The handler may answer synchronously or later (after upstream I/O) via the responder.
    using HttpCallback = std::function<void(const HttpRequest&, network::EventLoop*, const Responder&)>;
    // Fills the response sent before closing a connection whose request could not be parsed.
    using ParseErrorCallback = std::function<void(HttpContext::ParseError, HttpResponse*)>;

    HttpServer(network::EventLoop* loop,
               const network::InetAddress& listenAddr,
               const std::string& name,
               network::TcpServer::Option option = network::TcpServer::kNoReusePort);

    network::EventLoop* getLoop() const { return server_.getLoop(); }
    const std::string& hostport() const { return server_.hostport(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }
    void setParseErrorCallback(const ParseErrorCallback& cb) { parseErrorCallback_ = cb; }

    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    std::vector<network::EventLoop*> loops() const { return server_.GetAllLoops(); }
    void setMaxBodyBytes(size_t bytes) { maxBodyBytes_ = bytes; }

    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
        return server_.EnableTls(certPemPath, keyPemPath);
    }

    bool start();

private:
    struct Session;
    using SessionPtr = std::shared_ptr<Session>;

    void onConnection(const network::TcpConnectionPtr& conn);
    void onMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void processInput(const network::TcpConnectionPtr& conn, const SessionPtr& session,
                      network::Buffer* in, std::chrono::system_clock::time_point receiveTime);
    void onRequest(const network::TcpConnectionPtr& conn, const SessionPtr& session, HttpRequest& req);
    void sendResponse(const network::TcpConnectionPtr& conn, const SessionPtr& session,
                      uint64_t seq, HttpResponse& response);
    void sendParseError(const network::TcpConnectionPtr& conn, const SessionPtr& session,
                        HttpContext::ParseError error);

    static SessionPtr GetSession(const network::TcpConnectionPtr& conn);

    network::TcpServer server_;
    HttpCallback httpCallback_;
    ParseErrorCallback parseErrorCallback_;
    size_t maxBodyBytes_;
};

} // namespace protocol
} // namespace apiproxy
