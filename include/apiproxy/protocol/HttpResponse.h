#pragma once

#include "apiproxy/protocol/HttpHeaders.h"

#include <string>

namespace apiproxy {
namespace network {
class Buffer;
}

namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k100Continue = 100,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k413PayloadTooLarge = 413,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k504GatewayTimeout = 504,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    // Sets the reason phrase from the standard table as well.
    void setStatusCode(int code);
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }

    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }

    // Answer to a HEAD request: no body is written and a Content-Length header added by
    // the caller is sent as is instead of the computed one.
    void setHeadResponse(bool on) { headResponse_ = on; }
    bool headResponse() const { return headResponse_; }

    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    // Appends, keeping any same-named header.
    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }
    // Replaces every same-named header (case-insensitive) with one entry.
    void setHeader(const std::string& key, const std::string& value);
    void removeHeader(const std::string& key);
    std::string getHeader(const std::string& key) const {
        const std::string* v = FindHeader(headers_, key);
        return v ? *v : std::string();
    }
    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void setBody(std::string&& body) { body_ = std::move(body); }
    const std::string& body() const { return body_; }

    // Serializes with its own framing: Content-Length and Connection are written here,
    // any Transfer-Encoding, Connection or (non-HEAD) Content-Length in headers() is skipped.
    void appendToBuffer(network::Buffer* output) const;

    static const char* ReasonPhrase(int code);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool headResponse_{false};
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace apiproxy
