#include "apiproxy/ProxyServer.h"
#include "apiproxy/LandingPage.h"
#include "apiproxy/ProxyError.h"
#include "apiproxy/ProxyPipeline.h"
#include "apiproxy/routing/HeaderFilter.h"
#include "apiproxy/upstream/Forwarder.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/InetAddress.h"
#include "apiproxy/common/Logger.h"

#include <set>

namespace apiproxy {

ProxyServer::ProxyServer(network::EventLoop* loop, const ProxySettings& settings)
    : loop_(loop), settings_(settings) {
}

ProxyServer::~ProxyServer() {
    Stop();
}

bool ProxyServer::Start() {
    std::string error;
    routes_ = routing::RouteTable::Create(settings_.routes, &error);
    if (!routes_) {
        LOG_ERROR << "Invalid route table: " << error;
        return false;
    }
    headerFilter_.reset(new routing::HeaderFilter(settings_.allowedHeaders));

    forwarder_.reset(new upstream::Forwarder(settings_.upstream));
    if (!forwarder_->Init(&error)) {
        LOG_ERROR << error;
        return false;
    }
    // Resolve every route host now so workers never block on DNS in steady state.
    std::set<std::string> hosts;
    for (const auto& r : routes_->routes()) hosts.insert(r.base.host);
    for (const auto& h : hosts) {
        if (!forwarder_->Prime(h, &error)) {
            LOG_WARN << "Cannot resolve route host " << h << " at startup: " << error;
        }
    }

    pipeline_.reset(new ProxyPipeline(*routes_, *headerFilter_, *forwarder_));
    landingPage_ = RenderLandingPage(*routes_);

    auto listenAddr = network::InetAddress::FromIpPort(settings_.host, settings_.port);
    if (!listenAddr) {
        LOG_ERROR << "Listen host must be an IPv4 address: " << settings_.host;
        return false;
    }
    server_.reset(new protocol::HttpServer(loop_, *listenAddr, "ApiProxy"));
    server_->setThreadNum(settings_.workers);
    server_->setMaxBodyBytes(settings_.maxBodyBytes());
    server_->setHttpCallback(
        [this](const protocol::HttpRequest& req, network::EventLoop* loop, const protocol::HttpServer::Responder& respond) {
            OnRequest(req, loop, respond);
        });
    server_->setParseErrorCallback([](protocol::HttpContext::ParseError e, protocol::HttpResponse* response) {
        *response = MakeErrorResponse(e == protocol::HttpContext::kBodyTooLarge ? ProxyErrorKind::kPayloadTooLarge
                                                                                : ProxyErrorKind::kMalformedRequest);
    });

    if (settings_.tlsEnable && !server_->EnableTls(settings_.tlsCertPath, settings_.tlsKeyPath)) {
        LOG_ERROR << "Failed to enable TLS with cert " << settings_.tlsCertPath;
        return false;
    }
    if (!server_->start()) {
        return false;
    }
    LOG_INFO << "api-proxy serving " << routes_->size() << " routes on " << server_->hostport();
    return true;
}

void ProxyServer::Stop() {
    if (stopped_ || !server_ || !forwarder_) return;
    stopped_ = true;
    forwarder_->Shutdown(server_->loops());
}

void ProxyServer::OnRequest(const protocol::HttpRequest& req, network::EventLoop* loop,
                            const protocol::HttpServer::Responder& respond) {
    if (ServeReserved(req, respond)) return;
    pipeline_->Handle(req, loop, respond);
}

bool ProxyServer::ServeReserved(const protocol::HttpRequest& req, const protocol::HttpServer::Responder& respond) {
    if (req.getMethod() != protocol::HttpRequest::kGet && req.getMethod() != protocol::HttpRequest::kHead) {
        return false;
    }
    const std::string& path = req.path();
    protocol::HttpResponse response(false);
    response.setStatusCode(protocol::HttpResponse::k200Ok);
    if (path == "/" || path == "/index.html") {
        response.setContentType("text/html; charset=utf-8");
        response.setBody(landingPage_);
    } else if (path == "/robots.txt") {
        response.setContentType("text/plain");
        response.setBody("User-agent: *\nDisallow: /");
    } else if (path == "/health") {
        response.setContentType("application/json");
        response.setBody("{\"status\": \"healthy\", \"service\": \"api-proxy\"}");
    } else {
        return false;
    }
    if (req.getMethod() == protocol::HttpRequest::kHead) {
        response.setHeader("Content-Length", std::to_string(response.body().size()));
    }
    respond(std::move(response));
    return true;
}

} // namespace apiproxy
