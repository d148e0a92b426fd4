#include "apiproxy/ProxyPipeline.h"
#include "apiproxy/ProxyError.h"
#include "apiproxy/routing/HeaderFilter.h"
#include "apiproxy/routing/RouteTable.h"
#include "apiproxy/routing/UrlBuilder.h"
#include "apiproxy/upstream/Forwarder.h"
#include "apiproxy/upstream/ResponseTranslator.h"
#include "apiproxy/common/Logger.h"

#include <chrono>
#include <memory>
#include <string>

namespace apiproxy {

namespace {

// What the access line needs once the request object is gone.
struct AccessInfo {
    std::string remote;
    std::string method;
    std::string path;
    std::string target;
    std::chrono::steady_clock::time_point start;
};

void LogAccess(const AccessInfo& info, int status) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info.start).count();
    LOG_INFO << info.remote << " \"" << info.method << " " << info.path << "\" -> "
             << (info.target.empty() ? "-" : info.target) << " " << status << " " << ms << "ms";
}

} // namespace

ProxyPipeline::ProxyPipeline(const routing::RouteTable& routes,
                             const routing::HeaderFilter& headerFilter,
                             upstream::Forwarder& forwarder)
    : routes_(routes), headerFilter_(headerFilter), forwarder_(forwarder) {
}

bool ProxyPipeline::IsAllowedMethod(protocol::HttpRequest::Method method) {
    switch (method) {
        case protocol::HttpRequest::kGet:
        case protocol::HttpRequest::kPost:
        case protocol::HttpRequest::kPut:
        case protocol::HttpRequest::kDelete:
        case protocol::HttpRequest::kPatch:
        case protocol::HttpRequest::kOptions:
        case protocol::HttpRequest::kHead:
            return true;
        default:
            return false;
    }
}

void ProxyPipeline::Handle(const protocol::HttpRequest& req,
                           network::EventLoop* loop,
                           const protocol::HttpServer::Responder& respond) {
    auto access = std::make_shared<AccessInfo>();
    access->remote = req.remoteAddr();
    access->method = req.methodString();
    access->path = req.path();
    access->start = std::chrono::steady_clock::now();

    auto fail = [&respond, access](ProxyErrorKind kind) {
        LogAccess(*access, ErrorInfo(kind).status);
        respond(MakeErrorResponse(kind));
    };

    auto match = routes_.Resolve(req.path());
    if (!match) {
        fail(ProxyErrorKind::kNoRouteMatch);
        return;
    }

    auto target = routing::BuildTargetUrl(match->route->base, match->remainder, req.query());
    if (!target) {
        LOG_WARN << "Cannot build target URL from " << match->route->entry.targetBase << " and '" << match->remainder << "'";
        fail(ProxyErrorKind::kInvalidUrl);
        return;
    }
    access->target = target->withoutQuery();

    if (!IsAllowedMethod(req.getMethod())) {
        fail(ProxyErrorKind::kMethodNotAllowed);
        return;
    }

    upstream::OutboundRequest out;
    out.method = req.methodString();
    out.url = std::move(*target);
    out.headers = headerFilter_.Filter(req.headers());
    out.body = req.body();

    const bool head = req.getMethod() == protocol::HttpRequest::kHead;
    forwarder_.Send(loop, std::move(out),
                    [respond, head, access](upstream::ForwardError error, upstream::UpstreamResponse&& response) {
        if (error != upstream::ForwardError::kNone) {
            const ProxyErrorKind kind = FromForwardError(error);
            LogAccess(*access, ErrorInfo(kind).status);
            respond(MakeErrorResponse(kind));
            return;
        }
        protocol::HttpResponse translated = upstream::ResponseTranslator::Translate(std::move(response), head);
        LogAccess(*access, translated.statusCode());
        respond(std::move(translated));
    });
}

} // namespace apiproxy
