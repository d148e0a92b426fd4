#include "apiproxy/network/TcpConnection.h"
#include "apiproxy/network/Socket.h"
#include "apiproxy/network/Channel.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/TlsContext.h"
#include "apiproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace apiproxy {
namespace network {

namespace {

bool IsIpLiteral(const std::string& host) {
    struct in_addr v4;
    struct in6_addr v6;
    return ::inet_pton(AF_INET, host.c_str(), &v4) == 1 || ::inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx,
                             TlsRole tlsRole)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(64 * 1024 * 1024),
      tlsCtx_(tlsRole == TlsRole::kNone ? nullptr : tlsCtx),
      tlsRole_(tlsCtx ? tlsRole : TlsRole::kNone) {

    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd() << " state=" << state_;
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::SetTlsServerName(const std::string& serverName, bool verifyHost) {
    tlsServerName_ = serverName;
    tlsVerifyHost_ = verifyHost;
}

void TcpConnection::SetKeepAliveIdle(int idleSec) {
    socket_->SetKeepAliveIdle(idleSec);
}

void TcpConnection::SetTcpNoDelay(bool on) {
    socket_->SetTcpNoDelay(on);
}

void TcpConnection::ConnectEstablished() {
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (tlsRole_ == TlsRole::kClient) {
        // Reported as connected only once the handshake is done.
        if (!tlsInitClient()) {
            HandleClose();
            return;
        }
        if (tlsDoHandshake()) {
            OnTlsEstablished();
        } else if (tlsFailed_) {
            HandleClose();
        }
        return;
    }

    SetState(kConnected);
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::tlsTryInitFromPeek() {
    if (tlsRole_ != TlsRole::kServerSniff || tlsState_ != kTlsPlain) return false;

    unsigned char b = 0;
    const ssize_t n = ::recv(channel_->fd(), &b, 1, MSG_PEEK);
    if (n <= 0) return false;

    // TLS record type 0x16 indicates Handshake. If not, treat as plaintext.
    if (b != 0x16) {
        tlsCtx_ = nullptr;
        tlsRole_ = TlsRole::kNone;
        return false;
    }

    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_ERROR << "TLS: SSL_new failed: " << TlsContext::LastErrorString();
        tlsCtx_ = nullptr;
        tlsRole_ = TlsRole::kNone;
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshake;
    tlsWantWrite_ = false;
    return true;
}

bool TcpConnection::tlsInitClient() {
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_ERROR << "TLS: SSL_new failed: " << TlsContext::LastErrorString();
        tlsFailed_ = true;
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_connect_state(s);

    if (!tlsServerName_.empty()) {
        const bool ipLiteral = IsIpLiteral(tlsServerName_);
        // SNI carries host names only.
        if (!ipLiteral) {
            SSL_set_tlsext_host_name(s, tlsServerName_.c_str());
        }
        if (tlsVerifyHost_) {
            X509_VERIFY_PARAM* param = SSL_get0_param(s);
            const int ok = ipLiteral
                ? X509_VERIFY_PARAM_set1_ip_asc(param, tlsServerName_.c_str())
                : SSL_set1_host(s, tlsServerName_.c_str());
            if (ok != 1) {
                LOG_ERROR << "TLS: cannot set expected peer name " << tlsServerName_;
                SSL_free(s);
                tlsFailed_ = true;
                return false;
            }
        }
    }

    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshake;
    tlsWantWrite_ = false;
    return true;
}

bool TcpConnection::tlsDoHandshake() {
    if (!ssl_ || tlsState_ != kTlsHandshake) return false;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    ERR_clear_error();
    const int r = SSL_do_handshake(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        tlsWantWrite_ = false;
        return true;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        tlsWantWrite_ = false;
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return false;
    }

    tlsFailed_ = true;
    const long verify = SSL_get_verify_result(s);
    std::string detail = TlsContext::LastErrorString();
    if (verify != X509_V_OK) {
        if (!detail.empty()) detail += "; ";
        detail += X509_verify_cert_error_string(verify);
    }
    LOG_WARN << "TLS handshake failed [" << name_ << "] peer=" << peerAddr_.toIpPort()
             << (tlsServerName_.empty() ? "" : " name=" + tlsServerName_)
             << " error=" << e << (detail.empty() ? "" : " " + detail);
    return false;
}

void TcpConnection::OnTlsEstablished() {
    LOG_DEBUG << "TLS established [" << name_ << "] " << SSL_get_version(reinterpret_cast<SSL*>(ssl_));
    if (outputBuffer_.ReadableBytes() > 0) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
    } else if (channel_->IsWriting()) {
        channel_->DisableWriting();
    }

    if (tlsRole_ == TlsRole::kClient && state_ == kConnecting) {
        SetState(kConnected);
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
}

ssize_t TcpConnection::tlsReadOnce(char* buf, size_t cap, int* savedErrno) {
    if (!ssl_ || cap == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    ERR_clear_error();
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return 0; // EOF without close_notify
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

ssize_t TcpConnection::tlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    if (!ssl_ || len == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    ERR_clear_error();
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE) return -2;
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsRole_ == TlsRole::kServerSniff && tlsState_ == kTlsPlain) {
        (void)tlsTryInitFromPeek();
    }
    if (ssl_ && tlsState_ == kTlsHandshake) {
        if (!tlsDoHandshake()) {
            if (tlsFailed_) HandleClose();
            return;
        }
        OnTlsEstablished();
        if (state_ == kDisconnected) return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (ssl_ && tlsState_ == kTlsEstablished) {
        // SSL_read hands out at most one record per call; drain until it wants more input.
        ssize_t total = 0;
        char tmp[16 * 1024];
        for (;;) {
            const ssize_t r = tlsReadOnce(tmp, sizeof(tmp), &savedErrno);
            if (r > 0) {
                inputBuffer_.Append(tmp, static_cast<size_t>(r));
                total += r;
                continue;
            }
            if (r == -2) {
                n = total > 0 ? total : -2;
            } else if (total > 0) {
                // Deliver what arrived; the close or error is seen again on the next read.
                n = total;
            } else {
                n = r;
            }
            break;
        }
        if (n == -2) return;
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    }

    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else {
        if (savedErrno == EAGAIN || savedErrno == EINTR) return;
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] errno=" << savedErrno << " " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (ssl_ && tlsState_ == kTlsHandshake) {
        if (!tlsDoHandshake()) {
            if (tlsFailed_) HandleClose();
            return;
        }
        OnTlsEstablished();
        if (state_ == kDisconnected) return;
    }

    if (channel_->IsWriting()) {
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            return;
        }
        ssize_t n = 0;
        int savedErrno = 0;
        if (ssl_ && tlsState_ == kTlsEstablished) {
            n = tlsWriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
            if (n == -2) return;
        } else {
            n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
            if (n < 0) savedErrno = errno;
        }
        if (n > 0) {
            outputBuffer_.Retrieve(n);
            if (outputBuffer_.ReadableBytes() == 0) {
                channel_->DisableWriting();
                if (writeCompleteCallback_) {
                    loop_->QueueInLoop(
                        std::bind(writeCompleteCallback_, shared_from_this()));
                }
                if (state_ == kDisconnecting) {
                    ShutdownInLoop();
                }
            }
        } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
            LOG_DEBUG << "TcpConnection::HandleWrite [" << name_ << "] errno=" << savedErrno;
            HandleClose();
        }
    } else {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "fd = " << channel_->fd() << " state = " << state_;
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    if (err != 0) {
        LOG_DEBUG << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err << " " << std::strerror(err);
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ == kConnected) {
        if (loop_->IsInLoopThread()) {
            SendInLoop(data, len);
        } else {
            std::string msg(static_cast<const char*>(data), len);
            loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
                ptr->SendInLoop(msg.data(), msg.size());
            });
        }
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_WARN << "disconnected, give up writing";
        return;
    }

    // Held until the handshake completes.
    if (ssl_ && tlsState_ != kTlsEstablished) {
        outputBuffer_.Append(static_cast<const char*>(data), len);
        return;
    }

    // if nothing in output queue, try write directly
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        if (ssl_) {
            const ssize_t r = tlsWriteOnce(data, len, &savedErrno);
            nwrote = (r == -2) ? 0 : r;
        } else {
            nwrote = ::write(channel_->fd(), data, len);
            if (nwrote < 0) savedErrno = errno;
        }
        if (nwrote >= 0) {
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else {
            nwrote = 0;
            if (savedErrno != EWOULDBLOCK && savedErrno != EAGAIN) {
                LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] errno=" << savedErrno;
                if (savedErrno == EPIPE || savedErrno == ECONNRESET || savedErrno == EIO) {
                    faultError = true;
                }
            }
        }
    }

    if (!faultError && remaining > 0) {
        size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_
            && oldLen < highWaterMark_
            && highWaterMarkCallback_) {
            loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), oldLen + remaining));
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        if (ssl_ && tlsState_ == kTlsEstablished) {
            SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
        }
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->RunInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        channel_->DisableReading();
    }
}

} // namespace network
} // namespace apiproxy
