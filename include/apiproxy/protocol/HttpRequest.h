#pragma once

#include "apiproxy/protocol/HttpHeaders.h"

#include <string>
#include <cstddef>

namespace apiproxy {
namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kPatch, kOptions, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any token is accepted; methods outside the known set become kOther and keep
    // their spelling in methodString().
    bool setMethod(const char* start, const char* end) {
        methodString_.assign(start, end);
        if (!IsToken(methodString_)) {
            method_ = kInvalid;
            return false;
        }
        if (methodString_ == "GET") method_ = kGet;
        else if (methodString_ == "POST") method_ = kPost;
        else if (methodString_ == "HEAD") method_ = kHead;
        else if (methodString_ == "PUT") method_ = kPut;
        else if (methodString_ == "DELETE") method_ = kDelete;
        else if (methodString_ == "PATCH") method_ = kPatch;
        else if (methodString_ == "OPTIONS") method_ = kOptions;
        else method_ = kOther;
        return true;
    }

    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodString_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Stored without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }
    bool hasQuery() const { return hasQuery_; }
    void setHasQuery(bool on) { hasQuery_ = on; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && (*colon == ' ' || *colon == '\t')) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.pop_back();
        }
        headers_.emplace_back(std::move(field), std::move(value));
    }

    void addHeader(const std::string& field, const std::string& value) {
        headers_.emplace_back(field, value);
    }

    // First value, case-insensitive; empty if absent.
    std::string getHeader(const std::string& field) const {
        const std::string* v = FindHeader(headers_, field);
        return v ? *v : std::string();
    }

    bool hasHeader(const std::string& field) const { return FindHeader(headers_, field) != nullptr; }

    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void setRemoteAddr(const std::string& addr) { remoteAddr_ = addr; }
    const std::string& remoteAddr() const { return remoteAddr_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        std::swap(hasQuery_, that.hasQuery_);
        methodString_.swap(that.methodString_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
        remoteAddr_.swap(that.remoteAddr_);
    }

private:
    Method method_;
    Version version_;
    bool hasQuery_{false};
    std::string methodString_;
    std::string path_;
    std::string query_;
    HeaderList headers_;
    std::string body_;
    std::string remoteAddr_;
};

} // namespace protocol
} // namespace apiproxy
