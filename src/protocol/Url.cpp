#include "apiproxy/protocol/Url.h"
#include "apiproxy/protocol/HttpHeaders.h"

#include <cctype>
#include <cstring>

namespace apiproxy {
namespace protocol {

namespace {

bool SetError(std::string* error, const char* msg) {
    if (error) *error = msg;
    return false;
}

bool IsUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool IsSubDelim(unsigned char c) {
    return c != '\0' && std::strchr("!$&'()*+,;=", c) != nullptr;
}

bool IsPchar(unsigned char c) {
    return IsUnreserved(c) || IsSubDelim(c) || c == ':' || c == '@';
}

bool ParseHost(const std::string& authority, Url* url, std::string* error) {
    if (authority.find('@') != std::string::npos) return SetError(error, "userinfo is not supported");
    if (!authority.empty() && authority[0] == '[') return SetError(error, "IPv6 literals are not supported");

    std::string host = authority;
    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        host = authority.substr(0, colon);
        const std::string portStr = authority.substr(colon + 1);
        if (!portStr.empty()) {
            if (portStr.size() > 5) return SetError(error, "invalid port");
            unsigned long port = 0;
            for (unsigned char c : portStr) {
                if (!std::isdigit(c)) return SetError(error, "invalid port");
                port = port * 10 + (c - '0');
            }
            if (port == 0 || port > 65535) return SetError(error, "invalid port");
            url->port = static_cast<uint16_t>(port);
            url->explicitPort = true;
        }
    }
    if (host.empty()) return SetError(error, "missing host");
    for (unsigned char c : host) {
        if (!IsUnreserved(c) && !IsSubDelim(c)) return SetError(error, "invalid character in host");
    }
    url->host = ToLower(host);
    return true;
}

} // namespace

bool PercentEncode(const std::string& in, bool forQuery, std::string* out) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(in[i]);
        if (c < 0x20 || c == 0x7f) return false;
        if (c == '%' && i + 2 < in.size() &&
            std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            result.push_back('%');
            continue;
        }
        if (IsPchar(c) || c == '/' || (forQuery && c == '?')) {
            result.push_back(static_cast<char>(c));
            continue;
        }
        result.push_back('%');
        result.push_back(kHex[c >> 4]);
        result.push_back(kHex[c & 0x0f]);
    }
    out->swap(result);
    return true;
}

std::optional<Url> Url::Parse(const std::string& text, std::string* error) {
    Url url;
    const size_t sep = text.find("://");
    if (sep == std::string::npos) {
        SetError(error, "not an absolute URL");
        return std::nullopt;
    }
    url.scheme = ToLower(text.substr(0, sep));
    if (url.scheme != "http" && url.scheme != "https") {
        SetError(error, "scheme must be http or https");
        return std::nullopt;
    }

    std::string rest = text.substr(sep + 3);
    const size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);

    const size_t authEnd = rest.find_first_of("/?");
    const std::string authority = rest.substr(0, authEnd);
    if (!ParseHost(authority, &url, error)) return std::nullopt;
    if (!url.explicitPort) url.port = DefaultPort(url.scheme);

    std::string path;
    if (authEnd != std::string::npos) {
        const size_t q = rest.find('?', authEnd);
        path = rest.substr(authEnd, q == std::string::npos ? std::string::npos : q - authEnd);
        if (q != std::string::npos) {
            std::string query;
            if (!PercentEncode(rest.substr(q + 1), true, &query)) {
                SetError(error, "control character in query");
                return std::nullopt;
            }
            url.query = query;
        }
    }
    if (path.empty()) path = "/";
    if (!PercentEncode(RemoveDotSegments(path), false, &url.path)) {
        SetError(error, "control character in path");
        return std::nullopt;
    }
    return url;
}

std::string Url::toString() const {
    std::string s = scheme + "://" + host;
    if (explicitPort) s += ":" + std::to_string(port);
    s += requestTarget();
    return s;
}

std::string Url::withoutQuery() const {
    std::string s = scheme + "://" + host;
    if (explicitPort) s += ":" + std::to_string(port);
    return s + path;
}

std::string Url::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string Url::requestTarget() const {
    return query ? path + "?" + *query : path;
}

std::string Url::hostHeader() const {
    if (port == DefaultPort(scheme)) return host;
    return host + ":" + std::to_string(port);
}

std::string RemoveDotSegments(const std::string& path) {
    std::string in = path;
    std::string out;
    while (!in.empty()) {
        if (in.compare(0, 3, "../") == 0) {
            in.erase(0, 3);
        } else if (in.compare(0, 2, "./") == 0) {
            in.erase(0, 2);
        } else if (in.compare(0, 3, "/./") == 0) {
            in.erase(0, 2);
        } else if (in == "/.") {
            in = "/";
        } else if (in.compare(0, 4, "/../") == 0 || in == "/..") {
            in = in.size() == 3 ? std::string("/") : in.substr(3);
            const size_t slash = out.rfind('/');
            out.erase(slash == std::string::npos ? 0 : slash);
        } else if (in == "." || in == "..") {
            in.clear();
        } else {
            // Move the first segment, with its leading '/', to the output.
            const size_t next = in.find('/', in[0] == '/' ? 1 : 0);
            out += in.substr(0, next);
            in.erase(0, next);
        }
    }
    return out;
}

Url ResolveReference(const Url& base, const std::string& refPath, const std::optional<std::string>& refQuery) {
    Url target = base;
    if (refPath.empty()) {
        target.path = base.path;
        target.query = refQuery ? refQuery : base.query;
        return target;
    }
    if (refPath[0] == '/') {
        target.path = RemoveDotSegments(refPath);
    } else {
        // merge: everything up to and including the base path's last '/'
        const size_t slash = base.path.rfind('/');
        const std::string dir = slash == std::string::npos ? std::string("/") : base.path.substr(0, slash + 1);
        target.path = RemoveDotSegments(dir + refPath);
    }
    if (target.path.empty() || target.path[0] != '/') target.path.insert(0, "/");
    target.query = refQuery;
    return target;
}

} // namespace protocol
} // namespace apiproxy
