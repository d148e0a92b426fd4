#include "apiproxy/protocol/HttpResponseContext.h"
#include "apiproxy/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace apiproxy {
namespace protocol {

namespace {

bool ParseDecimal(const std::string& s, size_t* out) {
    if (s.empty() || s.size() > 18) return false;
    size_t v = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
        v = v * 10 + static_cast<size_t>(c - '0');
    }
    *out = v;
    return true;
}

bool ParseHex(const std::string& s, size_t* out) {
    if (s.empty() || s.size() > 15) return false;
    size_t v = 0;
    for (unsigned char c : s) {
        if (!std::isxdigit(c)) return false;
        v = v * 16 + static_cast<size_t>(std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);
    }
    *out = v;
    return true;
}

} // namespace

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    headerBuf_.clear();
    headRequest_ = false;
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    body_.clear();
    chunked_ = false;
    bodyRemaining_ = 0;
    keepAlive_ = false;
    needsCloseToFinish_ = false;
    trailingBytes_ = false;
    chunkState_ = kChunkSize;
    lineBuf_.clear();
    chunkRemaining_ = 0;
}

bool HttpResponseContext::parseStatusLine(const std::string& line) {
    // HTTP/1.1 200 OK
    if (line.size() < 12 || line.compare(0, 5, "HTTP/") != 0) return false;
    if (!std::isdigit(static_cast<unsigned char>(line[5])) || line[6] != '.' ||
        !std::isdigit(static_cast<unsigned char>(line[7])) || line[8] != ' ') {
        return false;
    }
    httpMajor_ = line[5] - '0';
    httpMinor_ = line[7] - '0';
    if (httpMajor_ != 1) return false;

    for (size_t i = 9; i < 12; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) return false;
    }
    statusCode_ = (line[9] - '0') * 100 + (line[10] - '0') * 10 + (line[11] - '0');
    if (line.size() > 12) {
        if (line[12] != ' ') return false;
        reason_ = line.substr(13);
    } else {
        reason_.clear();
    }
    return true;
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    size_t pos = 0;
    size_t lineEnd = headerBlock.find("\r\n", pos);
    if (lineEnd == std::string::npos || !parseStatusLine(headerBlock.substr(0, lineEnd))) {
        LOG_DEBUG << "Bad upstream status line: " << headerBlock.substr(0, std::min<size_t>(lineEnd, 128));
        return setError();
    }
    pos = lineEnd + 2;

    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            LOG_DEBUG << "Skipping malformed upstream header line";
            continue;
        }
        headers_.emplace_back(line.substr(0, colon), TrimOws(line.substr(colon + 1)));
    }

    std::string te;
    std::string conn;
    bool hasLength = false;
    size_t contentLength = 0;
    for (const auto& kv : headers_) {
        if (IEquals(kv.first, "Transfer-Encoding")) {
            if (!te.empty()) te += ",";
            te += kv.second;
        } else if (IEquals(kv.first, "Content-Length")) {
            size_t v = 0;
            if (!ParseDecimal(kv.second, &v) || (hasLength && v != contentLength)) {
                LOG_DEBUG << "Bad upstream Content-Length: " << kv.second;
                return setError();
            }
            hasLength = true;
            contentLength = v;
        } else if (IEquals(kv.first, "Connection")) {
            if (!conn.empty()) conn += ",";
            conn += kv.second;
        }
    }

    if (httpMinor_ == 0) {
        keepAlive_ = HeaderHasToken(conn, "keep-alive");
    } else {
        keepAlive_ = !HeaderHasToken(conn, "close");
    }

    chunked_ = false;
    needsCloseToFinish_ = false;
    bodyRemaining_ = 0;

    const bool bodyless = headRequest_ || (statusCode_ >= 100 && statusCode_ < 200) ||
                          statusCode_ == 204 || statusCode_ == 304;
    if (bodyless) {
        state_ = kGotAll;
        return true;
    }

    if (!te.empty()) {
        // chunked must be the final coding, otherwise the body runs until close.
        std::string last = te;
        const size_t comma = te.rfind(',');
        if (comma != std::string::npos) last = te.substr(comma + 1);
        if (IEquals(TrimOws(last), "chunked")) {
            chunked_ = true;
            chunkState_ = kChunkSize;
            lineBuf_.clear();
            chunkRemaining_ = 0;
        } else {
            needsCloseToFinish_ = true;
            keepAlive_ = false;
        }
    } else if (hasLength) {
        bodyRemaining_ = contentLength;
        body_.reserve(std::min<size_t>(contentLength, 16 * 1024 * 1024));
    } else {
        needsCloseToFinish_ = true;
        keepAlive_ = false;
    }

    state_ = (!chunked_ && !needsCloseToFinish_ && bodyRemaining_ == 0) ? kGotAll : kExpectBody;
    return true;
}

bool HttpResponseContext::takeLine(const char* data, size_t len, size_t* consumed) {
    const char* lf = static_cast<const char*>(std::find(data, data + len, '\n'));
    if (lf == data + len) {
        lineBuf_.append(data, len);
        *consumed = len;
        return false;
    }
    lineBuf_.append(data, lf);
    if (!lineBuf_.empty() && lineBuf_.back() == '\r') lineBuf_.pop_back();
    *consumed = static_cast<size_t>(lf - data) + 1;
    return true;
}

bool HttpResponseContext::consumeChunked(const char* data, size_t len, size_t* consumed) {
    *consumed = 0;
    while (*consumed < len && state_ == kExpectBody) {
        const char* p = data + *consumed;
        const size_t avail = len - *consumed;
        size_t used = 0;

        switch (chunkState_) {
            case kChunkSize: {
                const bool whole = takeLine(p, avail, &used);
                *consumed += used;
                if (!whole) {
                    if (lineBuf_.size() > 1024) return setError();
                    break;
                }
                std::string line = lineBuf_;
                lineBuf_.clear();
                const size_t semi = line.find(';');
                if (semi != std::string::npos) line.resize(semi);
                if (!ParseHex(TrimOws(line), &chunkRemaining_)) return setError();
                chunkState_ = chunkRemaining_ == 0 ? kChunkTrailers : kChunkData;
                break;
            }
            case kChunkData: {
                const size_t take = std::min(chunkRemaining_, avail);
                body_.append(p, take);
                chunkRemaining_ -= take;
                *consumed += take;
                if (chunkRemaining_ == 0) chunkState_ = kChunkDataEnd;
                break;
            }
            case kChunkDataEnd: {
                const bool whole = takeLine(p, avail, &used);
                *consumed += used;
                // Only the CRLF may follow chunk data.
                if (whole ? !lineBuf_.empty() : (!lineBuf_.empty() && lineBuf_ != "\r")) return setError();
                if (whole) chunkState_ = kChunkSize;
                break;
            }
            case kChunkTrailers: {
                const bool whole = takeLine(p, avail, &used);
                *consumed += used;
                if (!whole) {
                    if (lineBuf_.size() > kMaxHeaderBytes) return setError();
                    break;
                }
                const bool last = lineBuf_.empty();
                lineBuf_.clear();
                if (last) state_ = kGotAll;
                break;
            }
        }
    }
    return true;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError) return false;
    if (!data || len == 0) return true;

    size_t off = 0;
    while (off < len) {
        if (state_ == kGotAll) {
            trailingBytes_ = true;
            return true;
        }

        if (state_ == kExpectStatusLine) {
            // Accumulate until CRLFCRLF.
            const size_t searchFrom = headerBuf_.size() >= 3 ? headerBuf_.size() - 3 : 0;
            headerBuf_.append(data + off, len - off);
            off = len;
            const size_t hdrPos = headerBuf_.find("\r\n\r\n", searchFrom);
            if (hdrPos == std::string::npos) {
                if (headerBuf_.size() > kMaxHeaderBytes) return setError();
                return true;
            }
            const size_t headerEnd = hdrPos + 4;
            std::string rest = headerBuf_.substr(headerEnd);
            headerBuf_.resize(headerEnd);
            std::string headerBlock;
            headerBlock.swap(headerBuf_);

            if (!parseHeaderBlock(headerBlock)) return false;

            // Interim response: parse the real one from what follows.
            if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
                const bool head = headRequest_;
                reset();
                headRequest_ = head;
            }
            if (!rest.empty()) return feed(rest.data(), rest.size());
            return true;
        }

        // kExpectBody
        size_t consumed = 0;
        if (chunked_) {
            if (!consumeChunked(data + off, len - off, &consumed)) return false;
        } else if (needsCloseToFinish_) {
            body_.append(data + off, len - off);
            consumed = len - off;
        } else {
            consumed = std::min(bodyRemaining_, len - off);
            body_.append(data + off, consumed);
            bodyRemaining_ -= consumed;
            if (bodyRemaining_ == 0) state_ = kGotAll;
        }
        off += consumed;
    }
    return true;
}

bool HttpResponseContext::onClose() {
    if (state_ == kExpectBody && needsCloseToFinish_) state_ = kGotAll;
    keepAlive_ = false;
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace apiproxy
