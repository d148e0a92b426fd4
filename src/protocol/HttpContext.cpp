#include "apiproxy/protocol/HttpContext.h"
#include "apiproxy/network/Buffer.h"
#include "apiproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace apiproxy {
namespace protocol {

namespace {

// Digits only; a sign, blanks or an overflowing value are rejected.
bool ParseContentLength(const std::string& s, size_t* out) {
    if (s.empty() || s.size() > 18) return false;
    size_t v = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
        v = v * 10 + static_cast<size_t>(c - '0');
    }
    *out = v;
    return true;
}

bool ParseChunkSize(std::string line, size_t* out) {
    auto semi = line.find(';');
    if (semi != std::string::npos) line.resize(semi);
    line = TrimOws(line);
    if (line.empty() || line.size() > 15) return false;
    size_t v = 0;
    for (unsigned char c : line) {
        if (!std::isxdigit(c)) return false;
        v = v * 16 + static_cast<size_t>(std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);
    }
    *out = v;
    return true;
}

} // namespace

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    error_ = kNoError;
    HttpRequest dummy;
    request_.swap(dummy);
    headerBytes_ = 0;
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
    inTrailers_ = false;
    expectContinue_ = false;
    mustClose_ = false;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        // origin-form only
        if (space != end && space > start && *start == '/') {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question + 1, space);
                request_.setHasQuery(true);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::processHeaderLine(const char* begin, const char* end) {
    const char* colon = std::find(begin, end, ':');
    if (colon == end || colon == begin) return false;
    // No whitespace between field name and colon, and no obs-fold.
    if (!IsToken(std::string(begin, colon))) return false;
    request_.addHeader(begin, colon, end);
    return true;
}

bool HttpContext::beginBody() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
    inTrailers_ = false;

    bool hasLength = false;
    size_t contentLength = 0;
    std::string te;
    for (const auto& kv : request_.headers()) {
        if (IEquals(kv.first, "Content-Length")) {
            size_t v = 0;
            if (!ParseContentLength(kv.second, &v)) return fail(kMalformed);
            if (hasLength && v != contentLength) return fail(kMalformed);
            hasLength = true;
            contentLength = v;
        } else if (IEquals(kv.first, "Transfer-Encoding")) {
            if (!te.empty()) te += ",";
            te += kv.second;
        }
    }

    if (!te.empty()) {
        // Only a bare "chunked" coding is understood.
        if (!IEquals(TrimOws(te), "chunked")) return fail(kMalformed);
        chunked_ = true;
        if (hasLength) {
            LOG_WARN << "Request carries both Content-Length and chunked; using chunked and closing after response";
            mustClose_ = true;
        }
    } else if (hasLength) {
        if (contentLength > maxBodyBytes_) return fail(kBodyTooLarge);
        bodyRemaining_ = contentLength;
    }

    if (chunked_ || bodyRemaining_ > 0) {
        expectContinue_ = IEquals(TrimOws(request_.getHeader("Expect")), "100-continue") &&
                          request_.getVersion() == HttpRequest::kHttp11;
        state_ = kExpectBody;
    } else {
        state_ = kGotAll;
    }
    return true;
}

bool HttpContext::parseChunked(network::Buffer* buf) {
    while (true) {
        if (inTrailers_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (buf->ReadableBytes() > maxHeaderBytes_) return fail(kMalformed);
                return true;
            }
            const bool emptyLine = crlf == buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            if (emptyLine) {
                state_ = kGotAll;
                return true;
            }
            continue;
        }

        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (buf->ReadableBytes() > 1024) return fail(kMalformed);
                return true;
            }
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);
            if (!ParseChunkSize(line, &chunkSize_)) return fail(kMalformed);
            if (chunkSize_ == 0) {
                inTrailers_ = true;
                continue;
            }
            if (request_.body().size() + chunkSize_ > maxBodyBytes_) return fail(kBodyTooLarge);
            expectingChunkSize_ = false;
        }

        // Need chunkSize_ bytes + CRLF.
        if (buf->ReadableBytes() < chunkSize_ + 2) return true;
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') return fail(kMalformed);
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
}

bool HttpContext::parseRequest(network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    if (error_ != kNoError) return false;

    while (state_ != kGotAll) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (headerBytes_ + buf->ReadableBytes() > maxHeaderBytes_) return fail(kMalformed);
                return true;
            }
            const size_t lineLen = static_cast<size_t>(crlf - buf->Peek()) + 2;
            headerBytes_ += lineLen;
            if (headerBytes_ > maxHeaderBytes_) return fail(kMalformed);

            if (state_ == kExpectRequestLine) {
                // Tolerate empty lines between pipelined requests.
                if (crlf == buf->Peek()) {
                    buf->Retrieve(2);
                    continue;
                }
                if (!processRequestLine(buf->Peek(), crlf)) return fail(kMalformed);
                buf->Retrieve(lineLen);
                state_ = kExpectHeaders;
            } else if (crlf == buf->Peek()) {
                // empty line, end of headers
                buf->Retrieve(2);
                if (!beginBody()) return false;
            } else {
                if (!processHeaderLine(buf->Peek(), crlf)) return fail(kMalformed);
                buf->Retrieve(lineLen);
            }
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!parseChunked(buf)) return false;
                if (state_ != kGotAll) return true;
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ > 0) return true;
                state_ = kGotAll;
            }
        }
    }
    return true;
}

} // namespace protocol
} // namespace apiproxy
