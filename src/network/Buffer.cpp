#include "apiproxy/network/Buffer.h"

#include <errno.h>
#include <sys/uio.h>
#include <unistd.h>

namespace apiproxy {
namespace network {

const char Buffer::kCRLF[] = "\r\n";

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char extrabuf[65536];
    struct iovec vec[2];
    const size_t writable = WritableBytes();
    vec[0].iov_base = Begin() + writerIndex_;
    vec[0].iov_len = writable;
    vec[1].iov_base = extrabuf;
    vec[1].iov_len = sizeof extrabuf;
    // extrabuf only kicks in when the buffer itself is short on room
    const int iovcnt = (writable < sizeof extrabuf) ? 2 : 1;
    const ssize_t n = ::readv(fd, vec, iovcnt);
    if (n < 0) {
        *savedErrno = errno;
    } else if (static_cast<size_t>(n) <= writable) {
        writerIndex_ += n;
    } else {
        writerIndex_ = buffer_.size();
        Append(extrabuf, n - writable);
    }
    return n;
}

} // namespace network
} // namespace apiproxy
