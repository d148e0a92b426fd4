#include "apiproxy/ProxyError.h"

#include <string>

namespace apiproxy {

const char kAllowedMethods[] = "GET, POST, PUT, DELETE, PATCH, OPTIONS, HEAD";

namespace {

// Indexed by ProxyErrorKind.
const ProxyErrorInfo kErrorTable[] = {
    {404, "No route matches the request path"},
    {400, "Invalid target URL"},
    {405, "Method not allowed"},
    {502, "Failed to connect to upstream"},
    {504, "Upstream request timed out"},
    {500, "Failed to process request"},
    {500, "Failed to read upstream response body"},
    {413, "Request body too large"},
    {400, "Malformed request"},
};

} // namespace

const ProxyErrorInfo& ErrorInfo(ProxyErrorKind kind) {
    return kErrorTable[static_cast<size_t>(kind)];
}

protocol::HttpResponse MakeErrorResponse(ProxyErrorKind kind) {
    const ProxyErrorInfo& info = ErrorInfo(kind);
    protocol::HttpResponse response(false);
    response.setStatusCode(info.status);
    response.setContentType("application/json");
    if (kind == ProxyErrorKind::kMethodNotAllowed) {
        response.setHeader("Allow", kAllowedMethods);
    }
    response.setBody(std::string("{\"error\": \"") + info.message + "\", \"code\": " + std::to_string(info.status) + "}");
    return response;
}

ProxyErrorKind FromForwardError(upstream::ForwardError error) {
    switch (error) {
        case upstream::ForwardError::kConnect: return ProxyErrorKind::kUpstreamConnect;
        case upstream::ForwardError::kTimeout: return ProxyErrorKind::kUpstreamTimeout;
        case upstream::ForwardError::kBodyRead: return ProxyErrorKind::kBodyReadFailure;
        case upstream::ForwardError::kOther:
        case upstream::ForwardError::kNone:
            break;
    }
    return ProxyErrorKind::kUpstreamOther;
}

} // namespace apiproxy
