#include "apiproxy/ProxyError.h"
#include "apiproxy/common/Logger.h"

#include "TestSupport.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using namespace apiproxy;
using namespace apiproxy::common;
using namespace testsupport;

namespace {

constexpr uint16_t kProxyPort = 19021;
constexpr uint16_t kUpstreamPort = 19022;
// Nothing listens here.
constexpr uint16_t kDeadPort = 19029;

std::string handle(const UpstreamRequest& req, bool* close) {
    if (req.target == "/slow") {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        return makeResponse(200, "OK", "too late");
    }
    if (req.target == "/truncated") {
        *close = true;
        return "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 100\r\n\r\nonly ten b";
    }
    if (req.target == "/garbage") {
        *close = true;
        return "this is not http\r\n\r\n";
    }
    if (req.target == "/hangup") {
        *close = true;
        return "";
    }
    if (req.target == "/weird-status") {
        return "HTTP/1.1 999 Weird\r\nContent-Length: 2\r\n\r\nok";
    }
    if (req.target == "/until-close") {
        *close = true;
        return "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nstreamed until close";
    }
    return makeResponse(200, "OK", "fine");
}

void expectError(const ClientResponse& resp, ProxyErrorKind kind) {
    const ProxyErrorInfo& info = ErrorInfo(kind);
    assert(resp.status == info.status);
    assert(resp.header("Content-Type") == "application/json");
    assert(resp.body == MakeErrorResponse(kind).body());
    assert(resp.body.find("\"code\": " + std::to_string(info.status)) != std::string::npos);
}

ClientResponse get(const std::string& path) {
    return roundTrip(kProxyPort, "GET " + path + " HTTP/1.1\r\nHost: proxy.local\r\n\r\n");
}

void testConnectRefused() {
    expectError(get("/dead/x"), ProxyErrorKind::kUpstreamConnect);
    LOG_INFO << "Connect Refused -> 502 PASS";
}

void testTimeout() {
    const auto start = std::chrono::steady_clock::now();
    ClientResponse resp = get("/up/slow");
    const auto elapsed = std::chrono::steady_clock::now() - start;
    expectError(resp, ProxyErrorKind::kUpstreamTimeout);
    assert(elapsed >= std::chrono::milliseconds(900));
    assert(elapsed < std::chrono::milliseconds(1500));
    LOG_INFO << "Request Deadline -> 504 PASS";
}

void testTruncatedBody() {
    ClientResponse resp = get("/up/truncated");
    expectError(resp, ProxyErrorKind::kBodyReadFailure);
    // Nothing of the upstream's partial answer reaches the client.
    assert(resp.body.find("only ten") == std::string::npos);
    LOG_INFO << "Truncated Body -> 500 PASS";
}

void testMalformedAndHangup() {
    expectError(get("/up/garbage"), ProxyErrorKind::kUpstreamOther);
    expectError(get("/up/hangup"), ProxyErrorKind::kUpstreamOther);
    LOG_INFO << "Malformed / Hangup -> 500 PASS";
}

void testStatusOutOfRange() {
    ClientResponse resp = get("/up/weird-status");
    assert(resp.status == 500);
    assert(resp.header("X-Frame-Options") == "DENY");
    LOG_INFO << "Status Out Of Range -> 500 PASS";
}

void testReadUntilClose() {
    ClientResponse resp = get("/up/until-close");
    assert(resp.status == 200);
    assert(resp.body == "streamed until close");
    assert(resp.header("Content-Length") == std::to_string(resp.body.size()));
    LOG_INFO << "Read Until Close PASS";
}

void testClientStaysUsable() {
    // A failed exchange answers the client but keeps its connection.
    int fd = connectTo(kProxyPort);
    ResponseReader reader(fd);
    sendAll(fd, "GET /dead/x HTTP/1.1\r\nHost: proxy.local\r\n\r\n");
    ClientResponse failed;
    assert(reader.Read(&failed));
    assert(failed.status == 502);
    assert(failed.header("Connection") == "keep-alive");
    sendAll(fd, "GET /up/ok HTTP/1.1\r\nHost: proxy.local\r\n\r\n");
    ClientResponse ok;
    assert(reader.Read(&ok));
    assert(ok.status == 200);
    assert(ok.body == "fine");
    ::close(fd);
    LOG_INFO << "Client Stays Usable PASS";
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    FakeUpstream upstream(kUpstreamPort, handle);

    ProxySettings settings = localSettings(kProxyPort, {
        {"/up", "http://127.0.0.1:" + std::to_string(kUpstreamPort)},
        {"/dead", "http://127.0.0.1:" + std::to_string(kDeadPort)},
    });
    settings.upstream.requestTimeoutSec = 1.0;
    ProxyHarness proxy(settings);
    assert(proxy.started());

    testConnectRefused();
    testTimeout();
    testTruncatedBody();
    testMalformedAndHangup();
    testStatusOutOfRange();
    testReadUntilClose();
    testClientStaysUsable();
    return 0;
}
