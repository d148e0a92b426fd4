#include "apiproxy/upstream/ResponseTranslator.h"
#include "apiproxy/common/Logger.h"

namespace apiproxy {
namespace upstream {

const protocol::HeaderNameSet& ResponseTranslator::FramingHeaders() {
    static const protocol::HeaderNameSet kFraming = {
        "connection", "keep-alive", "proxy-connection", "transfer-encoding",
        "content-length", "te", "trailer", "upgrade",
    };
    return kFraming;
}

const protocol::HeaderList& ResponseTranslator::SecurityHeaders() {
    static const protocol::HeaderList kSecurity = {
        {"X-Content-Type-Options", "nosniff"},
        {"X-Frame-Options", "DENY"},
        {"Referrer-Policy", "strict-origin-when-cross-origin"},
        {"X-XSS-Protection", "1; mode=block"},
    };
    return kSecurity;
}

protocol::HttpResponse ResponseTranslator::Translate(UpstreamResponse&& upstream, bool headRequest) {
    protocol::HttpResponse response(false);
    if (upstream.status < 100 || upstream.status > 599) {
        LOG_WARN << "Upstream status " << upstream.status << " out of range, answering 500";
        response.setStatusCode(protocol::HttpResponse::k500InternalServerError);
    } else {
        response.setStatusCode(upstream.status);
        if (!upstream.reason.empty() && protocol::IsValidFieldValue(upstream.reason)) {
            response.setStatusMessage(upstream.reason);
        }
    }
    response.setHeadResponse(headRequest);

    const protocol::HeaderNameSet& framing = FramingHeaders();
    for (auto& kv : upstream.headers) {
        if (!protocol::IsToken(kv.first) || !protocol::IsValidFieldValue(kv.second)) continue;
        if (framing.contains(kv.first)) {
            // A HEAD answer has no body to measure; pass the upstream's length through.
            if (!(headRequest && protocol::IEquals(kv.first, "Content-Length"))) continue;
        }
        response.addHeader(kv.first, kv.second);
    }

    for (const auto& kv : SecurityHeaders()) {
        response.setHeader(kv.first, kv.second);
    }

    if (!headRequest) {
        response.setBody(std::move(upstream.body));
    }
    return response;
}

} // namespace upstream
} // namespace apiproxy
