#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/ProxySettings.h"
#include "apiproxy/protocol/HttpServer.h"

#include <memory>
#include <optional>
#include <string>

namespace apiproxy {
namespace routing {
class HeaderFilter;
}

class ProxyPipeline;

// The listener plus everything behind it: reserved endpoints (landing page,
// robots.txt, health) and the proxy pipeline for every other request.
class ProxyServer : common::noncopyable {
public:
    ProxyServer(network::EventLoop* loop, const ProxySettings& settings);
    ~ProxyServer();

    // Builds the route table and the upstream client, resolves route hosts and starts
    // listening. Call in the loop thread. false (logged) on any failure.
    bool Start();

    // Closes idle upstream connections on the worker loops. Call after the accepting
    // loop has stopped.
    void Stop();

    const routing::RouteTable& routes() const { return *routes_; }
    upstream::Forwarder& forwarder() { return *forwarder_; }

private:
    void OnRequest(const protocol::HttpRequest& req, network::EventLoop* loop,
                   const protocol::HttpServer::Responder& respond);
    // true if req was one of the reserved endpoints and has been answered.
    bool ServeReserved(const protocol::HttpRequest& req, const protocol::HttpServer::Responder& respond);

    network::EventLoop* loop_;
    const ProxySettings settings_;
    std::optional<routing::RouteTable> routes_;
    std::unique_ptr<routing::HeaderFilter> headerFilter_;
    std::unique_ptr<upstream::Forwarder> forwarder_;
    std::unique_ptr<ProxyPipeline> pipeline_;
    std::unique_ptr<protocol::HttpServer> server_;
    std::string landingPage_;
    bool stopped_{false};
};

} // namespace apiproxy
