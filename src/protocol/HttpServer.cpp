#include "apiproxy/protocol/HttpServer.h"
#include "apiproxy/protocol/HttpRequest.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/common/Logger.h"

namespace apiproxy {
namespace protocol {

namespace {

// Held pipelined bytes beyond this pause reading until the current response is out.
const size_t kMaxHeldBytes = 256 * 1024;

} // namespace

struct HttpServer::Session {
    explicit Session(size_t maxBodyBytes) : context(maxBodyBytes) {}

    HttpContext context;
    // Bytes received while a response is outstanding, or a partial request left over
    // from them. Parsing continues from here while it is non-empty.
    network::Buffer held;
    bool waitingResponse{false};
    bool headRequest{false};
    bool closeAfterResponse{false};
    bool readPaused{false};
    bool broken{false};
    uint64_t seq{0};
};

HttpServer::HttpServer(network::EventLoop* loop,
                       const network::InetAddress& listenAddr,
                       const std::string& name,
                       network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option),
      maxBodyBytes_(10 * 1024 * 1024) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

bool HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    return server_.Start();
}

HttpServer::SessionPtr HttpServer::GetSession(const network::TcpConnectionPtr& conn) {
    auto* session = std::any_cast<SessionPtr>(conn->GetMutableContext());
    return session ? *session : SessionPtr();
}

void HttpServer::onConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<Session>(maxBodyBytes_));
    } else {
        SessionPtr session = GetSession(conn);
        if (session) session->broken = true;
        conn->SetContext(std::any());
    }
}

void HttpServer::onMessage(const network::TcpConnectionPtr& conn,
                           network::Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    SessionPtr session = GetSession(conn);
    if (!session || session->broken) {
        buf->RetrieveAll();
        return;
    }

    network::Buffer* in = buf;
    if (session->waitingResponse || session->held.ReadableBytes() > 0) {
        session->held.Append(buf->Peek(), buf->ReadableBytes());
        buf->RetrieveAll();
        in = &session->held;
    }

    if (session->waitingResponse) {
        if (!session->readPaused && session->held.ReadableBytes() > kMaxHeldBytes) {
            session->readPaused = true;
            conn->StopRead();
        }
        return;
    }
    processInput(conn, session, in, receiveTime);
}

void HttpServer::processInput(const network::TcpConnectionPtr& conn, const SessionPtr& session,
                              network::Buffer* in, std::chrono::system_clock::time_point receiveTime) {
    HttpContext& context = session->context;
    if (!context.parseRequest(in, receiveTime)) {
        sendParseError(conn, session, context.error());
        return;
    }
    if (context.continueExpected()) {
        conn->Send("HTTP/1.1 100 Continue\r\n\r\n");
        context.clearExpectContinue();
    }
    if (!context.gotAll()) {
        return;
    }

    HttpRequest req;
    req.swap(context.request());
    const bool mustClose = context.mustClose();
    context.reset();

    const std::string connection = req.getHeader("Connection");
    session->closeAfterResponse = mustClose || HeaderHasToken(connection, "close") ||
                                  (req.getVersion() == HttpRequest::kHttp10 && !HeaderHasToken(connection, "keep-alive"));

    // Keep anything pipelined behind this request until the response is written.
    if (in != &session->held && in->ReadableBytes() > 0) {
        session->held.Append(in->Peek(), in->ReadableBytes());
        in->RetrieveAll();
    }
    onRequest(conn, session, req);
}

void HttpServer::onRequest(const network::TcpConnectionPtr& conn, const SessionPtr& session, HttpRequest& req) {
    req.setRemoteAddr(conn->peerAddress().toIp());
    session->waitingResponse = true;
    session->headRequest = req.getMethod() == HttpRequest::kHead;
    const uint64_t seq = ++session->seq;

    std::weak_ptr<network::TcpConnection> weakConn(conn);
    Responder responder = [this, weakConn, session, seq](HttpResponse response) {
        network::TcpConnectionPtr c = weakConn.lock();
        if (!c) return;
        sendResponse(c, session, seq, response);
    };

    if (httpCallback_) {
        httpCallback_(req, conn->getLoop(), responder);
    } else {
        HttpResponse response(false);
        response.setStatusCode(HttpResponse::k404NotFound);
        responder(std::move(response));
    }
}

void HttpServer::sendResponse(const network::TcpConnectionPtr& conn, const SessionPtr& session,
                              uint64_t seq, HttpResponse& response) {
    if (session->broken || !conn->connected()) return;
    if (!session->waitingResponse || seq != session->seq) {
        LOG_WARN << "Dropping duplicate response on " << conn->name();
        return;
    }
    session->waitingResponse = false;

    response.setCloseConnection(response.closeConnection() || session->closeAfterResponse);
    response.setHeadResponse(session->headRequest);

    network::Buffer buf;
    response.appendToBuffer(&buf);
    conn->Send(buf.Peek(), buf.ReadableBytes());

    if (response.closeConnection()) {
        session->broken = true;
        session->held.RetrieveAll();
        conn->Shutdown();
        return;
    }

    if (session->readPaused) {
        session->readPaused = false;
        conn->StartRead();
    }
    if (session->held.ReadableBytes() > 0) {
        conn->getLoop()->QueueInLoop([this, conn, session]() {
            if (!conn->connected() || session->broken || session->waitingResponse) return;
            if (session->held.ReadableBytes() == 0) return;
            processInput(conn, session, &session->held, std::chrono::system_clock::now());
        });
    }
}

void HttpServer::sendParseError(const network::TcpConnectionPtr& conn, const SessionPtr& session,
                                HttpContext::ParseError error) {
    LOG_WARN << "Rejecting request from " << conn->peerAddress().toIpPort() << ": "
             << (error == HttpContext::kBodyTooLarge ? "body too large" : "malformed request");
    HttpResponse response(true);
    if (parseErrorCallback_) {
        parseErrorCallback_(error, &response);
    } else {
        response.setStatusCode(error == HttpContext::kBodyTooLarge ? HttpResponse::k413PayloadTooLarge
                                                                   : HttpResponse::k400BadRequest);
    }
    response.setCloseConnection(true);

    network::Buffer buf;
    response.appendToBuffer(&buf);
    conn->Send(buf.Peek(), buf.ReadableBytes());

    session->broken = true;
    session->held.RetrieveAll();
    conn->Shutdown();
}

} // namespace protocol
} // namespace apiproxy
