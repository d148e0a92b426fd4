#pragma once

// Blocking socket helpers, a scriptable fake upstream and a proxy running on its own
// thread, shared by the integration tests.

#include "apiproxy/ProxyServer.h"
#include "apiproxy/ProxySettings.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/protocol/HttpHeaders.h"
#include "apiproxy/common/Logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace testsupport {

using apiproxy::protocol::HeaderList;

inline int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

inline void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

inline std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        if (pret != 1) break;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

// Splits "Name: value\r\n..." lines after the first line of a head block.
inline void parseHeaderLines(const std::string& head, std::string* firstLine, HeaderList* headers) {
    size_t pos = head.find("\r\n");
    *firstLine = head.substr(0, pos);
    while (pos != std::string::npos && pos + 2 < head.size()) {
        size_t next = head.find("\r\n", pos + 2);
        std::string line = head.substr(pos + 2, next == std::string::npos ? std::string::npos : next - pos - 2);
        pos = next;
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers->emplace_back(line.substr(0, colon), apiproxy::protocol::TrimOws(line.substr(colon + 1)));
    }
}

inline size_t countHeader(const HeaderList& headers, const std::string& name) {
    size_t n = 0;
    for (const auto& kv : headers) {
        if (apiproxy::protocol::IEquals(kv.first, name)) ++n;
    }
    return n;
}

inline std::string headerValue(const HeaderList& headers, const std::string& name) {
    const std::string* v = apiproxy::protocol::FindHeader(headers, name);
    return v ? *v : std::string();
}

struct ClientResponse {
    int status{0};
    std::string statusLine;
    HeaderList headers;
    std::string body;

    std::string header(const std::string& name) const { return headerValue(headers, name); }
    size_t count(const std::string& name) const { return countHeader(headers, name); }
};

// Reads whole responses off one client connection; bytes of a following response stay
// buffered for the next Read().
class ResponseReader {
public:
    explicit ResponseReader(int fd) : fd_(fd) {}

    bool Read(ClientResponse* out, bool headRequest = false, int timeoutMs = 5000) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        size_t headerEnd;
        while ((headerEnd = buf_.find("\r\n\r\n")) == std::string::npos) {
            if (!Fill(deadline)) return false;
        }
        const std::string head = buf_.substr(0, headerEnd + 2);
        buf_.erase(0, headerEnd + 4);

        *out = ClientResponse();
        parseHeaderLines(head, &out->statusLine, &out->headers);
        if (out->statusLine.size() < 12) return false;
        out->status = std::atoi(out->statusLine.c_str() + 9);

        if (headRequest || out->status == 204 || out->status == 304 || out->status / 100 == 1) {
            return true;
        }
        const std::string cl = out->header("Content-Length");
        if (cl.empty()) {
            while (Fill(deadline)) {
            }
            out->body.swap(buf_);
            return closed_;
        }
        const size_t len = static_cast<size_t>(std::strtoul(cl.c_str(), nullptr, 10));
        while (buf_.size() < len) {
            if (!Fill(deadline)) return false;
        }
        out->body = buf_.substr(0, len);
        buf_.erase(0, len);
        return true;
    }

    // True once the peer has closed with nothing left unread.
    bool WaitClosed(int timeoutMs = 3000) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (Fill(deadline)) {
        }
        return closed_ && buf_.empty();
    }

    const std::string& pending() const { return buf_; }

private:
    bool Fill(std::chrono::steady_clock::time_point deadline) {
        if (closed_) return false;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;
        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, static_cast<int>(left)) != 1) return false;
        char tmp[8192];
        ssize_t n = ::recv(fd_, tmp, sizeof tmp, 0);
        if (n <= 0) {
            closed_ = true;
            return false;
        }
        buf_.append(tmp, static_cast<size_t>(n));
        return true;
    }

    int fd_;
    std::string buf_;
    bool closed_{false};
};

// One request/response over a fresh connection.
inline ClientResponse roundTrip(uint16_t port, const std::string& request, bool headRequest = false) {
    int fd = connectTo(port);
    sendAll(fd, request);
    ResponseReader reader(fd);
    ClientResponse resp;
    bool ok = reader.Read(&resp, headRequest);
    assert(ok);
    ::close(fd);
    return resp;
}

inline std::string makeResponse(int status, const std::string& reason, const std::string& body,
                                const HeaderList& headers = {}) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    for (const auto& kv : headers) out += kv.first + ": " + kv.second + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    return out;
}

struct UpstreamRequest {
    std::string method;
    std::string target;
    HeaderList headers;
    std::string body;

    std::string header(const std::string& name) const { return headerValue(headers, name); }
    size_t count(const std::string& name) const { return countHeader(headers, name); }
};

// Blocking HTTP/1.1 server on 127.0.0.1, one thread per connection. The handler returns
// the raw bytes to answer with and may ask for the connection to be closed afterwards.
class FakeUpstream {
public:
    using Handler = std::function<std::string(const UpstreamRequest&, bool* close)>;

    FakeUpstream(uint16_t port, Handler handler) : handler_(std::move(handler)) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(listenFd_ >= 0);
        int on = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof on);
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        int ret = ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof addr);
        assert(ret == 0);
        ret = ::listen(listenFd_, 64);
        assert(ret == 0);
        acceptThread_ = std::thread([this]() { AcceptLoop(); });
    }

    ~FakeUpstream() {
        stop_ = true;
        acceptThread_.join();
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mu_);
            workers.swap(workers_);
        }
        for (auto& t : workers) t.join();
        ::close(listenFd_);
    }

    std::vector<UpstreamRequest> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

    int connections() const { return connections_.load(); }

private:
    void AcceptLoop() {
        while (!stop_) {
            pollfd pfd;
            pfd.fd = listenFd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 50) != 1) continue;
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) continue;
            ++connections_;
            std::lock_guard<std::mutex> lock(mu_);
            workers_.emplace_back([this, fd]() { Serve(fd); });
        }
    }

    // false when the peer closed or the upstream is stopping.
    bool Fill(int fd, std::string* buf) {
        while (!stop_) {
            pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 50) != 1) continue;
            char tmp[8192];
            ssize_t n = ::recv(fd, tmp, sizeof tmp, 0);
            if (n <= 0) return false;
            buf->append(tmp, static_cast<size_t>(n));
            return true;
        }
        return false;
    }

    void Serve(int fd) {
        std::string buf;
        while (true) {
            size_t headerEnd;
            while ((headerEnd = buf.find("\r\n\r\n")) == std::string::npos) {
                if (!Fill(fd, &buf)) {
                    ::close(fd);
                    return;
                }
            }
            UpstreamRequest req;
            std::string requestLine;
            parseHeaderLines(buf.substr(0, headerEnd + 2), &requestLine, &req.headers);
            buf.erase(0, headerEnd + 4);
            const size_t sp1 = requestLine.find(' ');
            const size_t sp2 = requestLine.find(' ', sp1 + 1);
            req.method = requestLine.substr(0, sp1);
            req.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);

            const size_t len = static_cast<size_t>(std::strtoul(req.header("Content-Length").c_str(), nullptr, 10));
            while (buf.size() < len) {
                if (!Fill(fd, &buf)) {
                    ::close(fd);
                    return;
                }
            }
            req.body = buf.substr(0, len);
            buf.erase(0, len);

            {
                std::lock_guard<std::mutex> lock(mu_);
                requests_.push_back(req);
            }
            bool close = false;
            const std::string reply = handler_(req, &close);
            size_t off = 0;
            while (off < reply.size()) {
                ssize_t n = ::send(fd, reply.data() + off, reply.size() - off, MSG_NOSIGNAL);
                if (n <= 0) break;
                off += static_cast<size_t>(n);
            }
            if (close) {
                ::close(fd);
                return;
            }
        }
    }

    Handler handler_;
    int listenFd_{-1};
    std::atomic<bool> stop_{false};
    std::atomic<int> connections_{0};
    std::thread acceptThread_;

    mutable std::mutex mu_;
    std::vector<std::thread> workers_;
    std::vector<UpstreamRequest> requests_;
};

// ProxyServer on its own loop thread, started before the constructor returns.
class ProxyHarness {
public:
    explicit ProxyHarness(const apiproxy::ProxySettings& settings) {
        auto ready = std::make_shared<std::promise<bool>>();
        std::future<bool> readyFuture = ready->get_future();
        thread_ = std::thread([this, settings, ready]() {
            apiproxy::network::EventLoop loop;
            apiproxy::ProxyServer server(&loop, settings);
            const bool ok = server.Start();
            if (ok) {
                loop_ = &loop;
                server_ = &server;
            }
            ready->set_value(ok);
            if (!ok) return;
            loop.Loop();
            server.Stop();
        });
        started_ = readyFuture.get();
    }

    ~ProxyHarness() {
        if (loop_) loop_->Quit();
        thread_.join();
    }

    bool started() const { return started_; }
    apiproxy::network::EventLoop* loop() const { return loop_; }
    apiproxy::ProxyServer& server() { return *server_; }

private:
    std::thread thread_;
    apiproxy::network::EventLoop* loop_{nullptr};
    apiproxy::ProxyServer* server_{nullptr};
    bool started_{false};
};

inline apiproxy::ProxySettings localSettings(uint16_t port, std::vector<apiproxy::routing::RouteEntry> routes) {
    apiproxy::ProxySettings settings;
    settings.host = "127.0.0.1";
    settings.port = port;
    settings.workers = 2;
    settings.routes = std::move(routes);
    settings.upstream.connectTimeoutSec = 2.0;
    settings.upstream.requestTimeoutSec = 5.0;
    return settings;
}

} // namespace testsupport
