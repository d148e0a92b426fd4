#pragma once

#include "apiproxy/protocol/HttpHeaders.h"

#include <cstddef>
#include <string>

namespace apiproxy {
namespace protocol {

// Incremental HTTP/1.x response parser for upstream connections.
// - Supports Content-Length, Transfer-Encoding: chunked (de-chunked into body()) and
//   read-until-close framing.
// - 1xx interim responses other than 101 are skipped.
// - Responses to HEAD, and 101/204/304 responses, end at the header block.
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectBody, kGotAll, kError };

    static const size_t kMaxHeaderBytes = 64 * 1024;

    // The request on this connection was HEAD. Call before the first feed().
    void setHeadRequest(bool on) { headRequest_ = on; }

    // Returns false on a protocol error. Bytes after a complete response are not consumed;
    // they make the connection unfit for reuse.
    bool feed(const char* data, size_t len);

    // The peer closed the connection. Completes a read-until-close body; returns gotAll().
    bool onClose();

    bool headersComplete() const { return state_ == kExpectBody || state_ == kGotAll; }
    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    ParseState state() const { return state_; }

    void reset();

    bool keepAlive() const { return keepAlive_ && !trailingBytes_; }
    bool needsCloseToFinish() const { return needsCloseToFinish_; }
    int statusCode() const { return statusCode_; }
    const std::string& reasonPhrase() const { return reason_; }
    const HeaderList& headers() const { return headers_; }
    const std::string& body() const { return body_; }
    std::string& mutableBody() { return body_; }

private:
    enum ChunkState { kChunkSize, kChunkData, kChunkDataEnd, kChunkTrailers };

    bool parseHeaderBlock(const std::string& headerBlock);
    bool parseStatusLine(const std::string& line);
    bool consumeChunked(const char* data, size_t len, size_t* consumed);
    // Appends to lineBuf_ up to a LF; true once a whole line is buffered.
    bool takeLine(const char* data, size_t len, size_t* consumed);
    bool setError() {
        state_ = kError;
        return false;
    }

    ParseState state_{kExpectStatusLine};
    std::string headerBuf_;
    bool headRequest_{false};

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;
    HeaderList headers_;
    std::string body_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool keepAlive_{false};
    bool needsCloseToFinish_{false};
    bool trailingBytes_{false};

    ChunkState chunkState_{kChunkSize};
    std::string lineBuf_;
    size_t chunkRemaining_{0};
};

} // namespace protocol
} // namespace apiproxy
