#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace apiproxy {
namespace protocol {

// Absolute http/https URL. IPv4 literals and registered names only; userinfo is refused.
struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;    // lowercased
    uint16_t port{0};    // effective port (default filled in)
    bool explicitPort{false};
    std::string path{"/"};  // percent-encoded, always starts with '/'
    std::optional<std::string> query;  // without '?'

    static std::optional<Url> Parse(const std::string& text, std::string* error = nullptr);

    static uint16_t DefaultPort(const std::string& scheme) { return scheme == "https" ? 443 : 80; }

    bool isHttps() const { return scheme == "https"; }

    // scheme://host[:port]/path[?query]; the port appears only when explicit.
    std::string toString() const;
    // scheme://host:port, the identity used for connection reuse.
    std::string origin() const;
    // Origin-form request target: path[?query].
    std::string requestTarget() const;
    // Value of the Host header: host, plus ":port" when it is not the scheme's default.
    std::string hostHeader() const;
    // toString() without the query, for logs.
    std::string withoutQuery() const;

    bool sameOrigin(const Url& other) const {
        return scheme == other.scheme && host == other.host && port == other.port;
    }
};

// RFC 3986 section 5.2.4.
std::string RemoveDotSegments(const std::string& path);

// Percent-encodes every byte that may not appear literally in a path (or, with
// forQuery, a query). Valid %XX escapes are kept. Fails on control characters.
bool PercentEncode(const std::string& in, bool forQuery, std::string* out);

// RFC 3986 section 5.2.2 for a reference made of a relative path and an optional query.
// The base path is used as given; callers wanting directory semantics add the '/'.
Url ResolveReference(const Url& base, const std::string& refPath, const std::optional<std::string>& refQuery);

} // namespace protocol
} // namespace apiproxy
