#pragma once

#include "apiproxy/protocol/HttpRequest.h"

#include <chrono>
#include <cstddef>

namespace apiproxy {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x request parser. Feed it the connection's input buffer; it consumes
// exactly the bytes of one request and leaves anything pipelined behind it.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    enum ParseError {
        kNoError,
        kMalformed,
        kBodyTooLarge,
    };

    static const size_t kDefaultMaxHeaderBytes = 64 * 1024;

    explicit HttpContext(size_t maxBodyBytes = 10 * 1024 * 1024,
                         size_t maxHeaderBytes = kDefaultMaxHeaderBytes)
        : state_(kExpectRequestLine),
          maxBodyBytes_(maxBodyBytes),
          maxHeaderBytes_(maxHeaderBytes) {}

    // return false if some error; error() says which
    bool parseRequest(network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    bool expectingBody() const { return state_ == kExpectBody; }
    ParseError error() const { return error_; }

    // Client sent "Expect: 100-continue" and the body has not arrived yet.
    bool continueExpected() const { return expectContinue_ && state_ == kExpectBody; }
    void clearExpectContinue() { expectContinue_ = false; }

    // The message framing was ambiguous (Content-Length together with chunked); the
    // connection must not be reused after this request.
    bool mustClose() const { return mustClose_; }

    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeaderLine(const char* begin, const char* end);
    bool beginBody();
    bool parseChunked(network::Buffer* buf);
    bool fail(ParseError e) {
        error_ = e;
        return false;
    }

    HttpRequestParseState state_;
    ParseError error_{kNoError};
    HttpRequest request_;
    const size_t maxBodyBytes_;
    const size_t maxHeaderBytes_;
    size_t headerBytes_{0};

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    bool inTrailers_{false};
    bool expectContinue_{false};
    bool mustClose_{false};
};

} // namespace protocol
} // namespace apiproxy
