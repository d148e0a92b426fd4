#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cstring>
#include <sys/types.h> // for ssize_t

namespace apiproxy {
namespace network {

/// Growable byte buffer with a cheap prepend area.
///
/// +-------------------+------------------+------------------+
/// | prependable bytes |  readable bytes  |  writable bytes  |
/// +-------------------+------------------+------------------+
/// 0      <=      readerIndex   <=   writerIndex    <=     size
class Buffer {
public:
    static const size_t kCheapPrepend = 8;
    static const size_t kInitialSize = 1024;

    explicit Buffer(size_t initialSize = kInitialSize)
        : buffer_(kCheapPrepend + initialSize),
          readerIndex_(kCheapPrepend),
          writerIndex_(kCheapPrepend) {
    }

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    Buffer(Buffer&& other) noexcept
        : buffer_(std::move(other.buffer_)),
          readerIndex_(other.readerIndex_),
          writerIndex_(other.writerIndex_) {
        other.readerIndex_ = 0;
        other.writerIndex_ = 0;
    }

    size_t ReadableBytes() const { return writerIndex_ - readerIndex_; }
    size_t WritableBytes() const { return buffer_.size() - writerIndex_; }
    size_t PrependableBytes() const { return readerIndex_; }

    const char* Peek() const { return Begin() + readerIndex_; }

    const char* FindCRLF() const {
        const char* crlf = std::search(Peek(), BeginWrite(), kCRLF, kCRLF + 2);
        return crlf == BeginWrite() ? nullptr : crlf;
    }

    const char* FindCRLF(const char* start) const {
        const char* crlf = std::search(start, BeginWrite(), kCRLF, kCRLF + 2);
        return crlf == BeginWrite() ? nullptr : crlf;
    }

    void Retrieve(size_t len) {
        if (len < ReadableBytes()) {
            readerIndex_ += len;
        } else {
            RetrieveAll();
        }
    }

    void RetrieveUntil(const char* end) {
        Retrieve(static_cast<size_t>(end - Peek()));
    }

    void RetrieveAll() {
        readerIndex_ = kCheapPrepend;
        writerIndex_ = kCheapPrepend;
    }

    std::string RetrieveAllAsString() {
        return RetrieveAsString(ReadableBytes());
    }

    std::string RetrieveAsString(size_t len) {
        std::string result(Peek(), len);
        Retrieve(len);
        return result;
    }

    void Append(const std::string& str) {
        Append(str.data(), str.size());
    }

    void Append(const char* data, size_t len) {
        EnsureWritableBytes(len);
        std::copy(data, data + len, BeginWrite());
        HasWritten(len);
    }

    char* BeginWrite() { return Begin() + writerIndex_; }
    const char* BeginWrite() const { return Begin() + writerIndex_; }

    void HasWritten(size_t len) { writerIndex_ += len; }

    void EnsureWritableBytes(size_t len) {
        if (WritableBytes() < len) {
            MakeSpace(len);
        }
    }

    ssize_t ReadFd(int fd, int* savedErrno);

private:
    char* Begin() { return buffer_.data(); }
    const char* Begin() const { return buffer_.data(); }

    void MakeSpace(size_t len) {
        if (WritableBytes() + PrependableBytes() < len + kCheapPrepend) {
            buffer_.resize(writerIndex_ + len);
        } else {
            // Move readable data to the front
            size_t readable = ReadableBytes();
            std::copy(Begin() + readerIndex_,
                      Begin() + writerIndex_,
                      Begin() + kCheapPrepend);
            readerIndex_ = kCheapPrepend;
            writerIndex_ = readerIndex_ + readable;
        }
    }

    static const char kCRLF[];

    std::vector<char> buffer_;
    size_t readerIndex_;
    size_t writerIndex_;
};

} // namespace network
} // namespace apiproxy
