#include "apiproxy/LandingPage.h"
#include "apiproxy/ProxyError.h"
#include "apiproxy/common/Logger.h"

#include "TestSupport.h"

#include <cassert>
#include <string>

using namespace apiproxy;
using namespace apiproxy::common;
using namespace testsupport;

namespace {

constexpr uint16_t kProxyPort = 19031;
constexpr uint16_t kUpstreamPort = 19032;

std::string handle(const UpstreamRequest& req, bool*) {
    return makeResponse(200, "OK", req.method + " " + req.target);
}

ClientResponse request(const std::string& method, const std::string& path, const std::string& extra = "") {
    return roundTrip(kProxyPort, method + " " + path + " HTTP/1.1\r\nHost: proxy.local\r\n" + extra + "\r\n",
                     method == "HEAD");
}

void expectError(const ClientResponse& resp, ProxyErrorKind kind) {
    assert(resp.status == ErrorInfo(kind).status);
    assert(resp.header("Content-Type") == "application/json");
    assert(resp.body == MakeErrorResponse(kind).body());
}

void testLandingPage() {
    ClientResponse root = request("GET", "/");
    assert(root.status == 200);
    assert(root.header("Content-Type") == "text/html; charset=utf-8");
    assert(root.body.find("href=\"/svc\"") != std::string::npos);
    assert(root.body.find("href=\"/svc/v2\"") != std::string::npos);

    ClientResponse index = request("GET", "/index.html");
    assert(index.status == 200);
    assert(index.body == root.body);

    ClientResponse head = request("HEAD", "/");
    assert(head.status == 200);
    assert(head.header("Content-Length") == std::to_string(root.body.size()));
    LOG_INFO << "Landing Page PASS";
}

void testRobotsAndHealth() {
    ClientResponse robots = request("GET", "/robots.txt");
    assert(robots.status == 200);
    assert(robots.header("Content-Type") == "text/plain");
    assert(robots.body == "User-agent: *\nDisallow: /");

    ClientResponse health = request("GET", "/health");
    assert(health.status == 200);
    assert(health.header("Content-Type") == "application/json");
    assert(health.body.find("\"status\": \"healthy\"") != std::string::npos);

    // Query strings do not change the reserved match.
    ClientResponse healthQuery = request("GET", "/health?probe=1");
    assert(healthQuery.status == 200);
    assert(healthQuery.body == health.body);
    LOG_INFO << "Robots And Health PASS";
}

void testNotReserved() {
    // Only exact paths are reserved; everything else goes through routing.
    expectError(request("GET", "/healthz"), ProxyErrorKind::kNoRouteMatch);
    expectError(request("GET", "/unknown"), ProxyErrorKind::kNoRouteMatch);
    expectError(request("POST", "/health", "Content-Length: 0\r\n"), ProxyErrorKind::kNoRouteMatch);
    assert(request("GET", "/unknown").body == "{\"error\": \"No route matches the request path\", \"code\": 404}");
    LOG_INFO << "Not Reserved PASS";
}

void testRoutingOrderAndMethods() {
    ClientResponse v2 = request("GET", "/svc/v2/items");
    assert(v2.status == 200);
    assert(v2.body == "GET /two/items");

    ClientResponse v1 = request("GET", "/svc/v1/items");
    assert(v1.status == 200);
    assert(v1.body == "GET /one/v1/items");

    for (const char* m : {"PUT", "PATCH", "OPTIONS", "DELETE"}) {
        ClientResponse r = request(m, "/svc/x", "Content-Length: 0\r\n");
        assert(r.status == 200);
        assert(r.body == std::string(m) + " /one/x");
    }

    ClientResponse trace = request("TRACE", "/svc/x");
    expectError(trace, ProxyErrorKind::kMethodNotAllowed);
    assert(trace.header("Allow") == kAllowedMethods);
    expectError(request("PROPFIND", "/svc/x"), ProxyErrorKind::kMethodNotAllowed);
    // Routing is checked first.
    expectError(request("TRACE", "/nowhere"), ProxyErrorKind::kNoRouteMatch);
    LOG_INFO << "Routing Order And Methods PASS";
}

void testClientErrors() {
    expectError(request("GET", "/svc/a\x01" "b"), ProxyErrorKind::kInvalidUrl);

    int fd = connectTo(kProxyPort);
    sendAll(fd, "POST /svc/x HTTP/1.1\r\nHost: proxy.local\r\nContent-Length: 2097152\r\n\r\n");
    ResponseReader reader(fd);
    ClientResponse tooLarge;
    assert(reader.Read(&tooLarge));
    expectError(tooLarge, ProxyErrorKind::kPayloadTooLarge);
    assert(tooLarge.header("Connection") == "close");
    assert(reader.WaitClosed());
    ::close(fd);

    fd = connectTo(kProxyPort);
    sendAll(fd, "GET /svc/x HTTP/1.1\r\nHost proxy.local\r\n\r\n");
    ResponseReader reader2(fd);
    ClientResponse malformed;
    assert(reader2.Read(&malformed));
    expectError(malformed, ProxyErrorKind::kMalformedRequest);
    ::close(fd);
    LOG_INFO << "Client Errors PASS";
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    FakeUpstream upstream(kUpstreamPort, handle);
    const std::string origin = "http://127.0.0.1:" + std::to_string(kUpstreamPort);
    ProxySettings settings = localSettings(kProxyPort, {
        {"/svc", origin + "/one"},
        {"/svc/v2", origin + "/two/"},
    });
    settings.maxBodySizeMb = 1;
    ProxyHarness proxy(settings);
    assert(proxy.started());

    testLandingPage();
    testRobotsAndHealth();
    testNotReserved();
    testRoutingOrderAndMethods();
    testClientErrors();
    return 0;
}
