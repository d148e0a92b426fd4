#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/protocol/HttpRequest.h"
#include "apiproxy/protocol/HttpServer.h"

namespace apiproxy {
namespace routing {
class RouteTable;
class HeaderFilter;
}
namespace upstream {
class Forwarder;
}

// route -> target URL -> method check -> header filter -> forward -> translate.
// Every outcome, success or failure, ends in exactly one call of the responder.
class ProxyPipeline : common::noncopyable {
public:
    ProxyPipeline(const routing::RouteTable& routes,
                  const routing::HeaderFilter& headerFilter,
                  upstream::Forwarder& forwarder);

    void Handle(const protocol::HttpRequest& req,
                network::EventLoop* loop,
                const protocol::HttpServer::Responder& respond);

    static bool IsAllowedMethod(protocol::HttpRequest::Method method);

private:
    const routing::RouteTable& routes_;
    const routing::HeaderFilter& headerFilter_;
    upstream::Forwarder& forwarder_;
};

} // namespace apiproxy
