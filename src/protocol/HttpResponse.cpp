#include "apiproxy/protocol/HttpResponse.h"
#include "apiproxy/network/Buffer.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace apiproxy {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int code) {
    switch (code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 422: return "Unprocessable Entity";
        case 425: return "Too Early";
        case 426: return "Upgrade Required";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default: return "";
    }
}

void HttpResponse::setStatusCode(int code) {
    statusCode_ = code;
    statusMessage_ = ReasonPhrase(code);
}

void HttpResponse::setHeader(const std::string& key, const std::string& value) {
    removeHeader(key);
    headers_.emplace_back(key, value);
}

void HttpResponse::removeHeader(const std::string& key) {
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&key](const std::pair<std::string, std::string>& kv) {
                                      return IEquals(kv.first, key);
                                  }),
                   headers_.end());
}

void HttpResponse::appendToBuffer(network::Buffer* output) const {
    char buf[64];
    snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n");

    // 1xx, 204 and 304 never carry a body or a length.
    const bool bodyless = (statusCode_ >= 100 && statusCode_ < 200) || statusCode_ == 204 || statusCode_ == 304;
    if (!bodyless && !headResponse_) {
        snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
        output->Append(buf, strlen(buf));
    }
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

    for (const auto& header : headers_) {
        if (IEquals(header.first, "Connection") || IEquals(header.first, "Transfer-Encoding")) continue;
        if (IEquals(header.first, "Content-Length") && (!headResponse_ || bodyless)) continue;
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    if (!headResponse_ && !bodyless) {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace apiproxy
