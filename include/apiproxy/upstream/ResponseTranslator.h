#pragma once

#include "apiproxy/protocol/HttpHeaders.h"
#include "apiproxy/protocol/HttpResponse.h"
#include "apiproxy/upstream/Forwarder.h"

namespace apiproxy {
namespace upstream {

// Upstream response -> response for the client: status and headers copied, framing
// headers dropped (the body is re-framed), security headers forced.
class ResponseTranslator {
public:
    static protocol::HttpResponse Translate(UpstreamResponse&& upstream, bool headRequest);

    static const protocol::HeaderNameSet& FramingHeaders();

    // Name/value pairs set on every proxied response.
    static const protocol::HeaderList& SecurityHeaders();
};

} // namespace upstream
} // namespace apiproxy
