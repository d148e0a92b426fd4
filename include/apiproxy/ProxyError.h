#pragma once

#include "apiproxy/protocol/HttpResponse.h"
#include "apiproxy/upstream/Forwarder.h"

namespace apiproxy {

// Every way a request can fail, client- or upstream-caused.
enum class ProxyErrorKind {
    kNoRouteMatch,
    kInvalidUrl,
    kMethodNotAllowed,
    kUpstreamConnect,
    kUpstreamTimeout,
    kUpstreamOther,
    kBodyReadFailure,
    kPayloadTooLarge,
    kMalformedRequest,
};

struct ProxyErrorInfo {
    int status;
    const char* message;
};

// Value of the Allow header on 405 responses.
extern const char kAllowedMethods[];

const ProxyErrorInfo& ErrorInfo(ProxyErrorKind kind);

// {"error": <message>, "code": <status>} as application/json.
protocol::HttpResponse MakeErrorResponse(ProxyErrorKind kind);

// kNone is not an error; it maps to kUpstreamOther.
ProxyErrorKind FromForwardError(upstream::ForwardError error);

} // namespace apiproxy
