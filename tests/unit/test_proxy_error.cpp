#include "apiproxy/ProxyError.h"
#include "apiproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace apiproxy;
using namespace apiproxy::upstream;
using namespace apiproxy::common;

void testStatusTable() {
    assert(ErrorInfo(ProxyErrorKind::kNoRouteMatch).status == 404);
    assert(ErrorInfo(ProxyErrorKind::kInvalidUrl).status == 400);
    assert(ErrorInfo(ProxyErrorKind::kMethodNotAllowed).status == 405);
    assert(ErrorInfo(ProxyErrorKind::kUpstreamConnect).status == 502);
    assert(ErrorInfo(ProxyErrorKind::kUpstreamTimeout).status == 504);
    assert(ErrorInfo(ProxyErrorKind::kUpstreamOther).status == 500);
    assert(ErrorInfo(ProxyErrorKind::kBodyReadFailure).status == 500);
    assert(ErrorInfo(ProxyErrorKind::kPayloadTooLarge).status == 413);
    assert(ErrorInfo(ProxyErrorKind::kMalformedRequest).status == 400);
    LOG_INFO << "Status Table PASS";
}

void testForwardErrorMapping() {
    assert(FromForwardError(ForwardError::kConnect) == ProxyErrorKind::kUpstreamConnect);
    assert(FromForwardError(ForwardError::kTimeout) == ProxyErrorKind::kUpstreamTimeout);
    assert(FromForwardError(ForwardError::kOther) == ProxyErrorKind::kUpstreamOther);
    assert(FromForwardError(ForwardError::kBodyRead) == ProxyErrorKind::kBodyReadFailure);
    assert(FromForwardError(ForwardError::kNone) == ProxyErrorKind::kUpstreamOther);
    assert(std::string(ForwardErrorName(ForwardError::kTimeout)).size() > 0);
    LOG_INFO << "Forward Error Mapping PASS";
}

void testJsonBody() {
    auto resp = MakeErrorResponse(ProxyErrorKind::kNoRouteMatch);
    assert(resp.statusCode() == 404);
    assert(resp.statusMessage() == "Not Found");
    assert(resp.getHeader("Content-Type") == "application/json");
    assert(resp.body() == "{\"error\": \"No route matches the request path\", \"code\": 404}");
    assert(resp.getHeader("Allow").empty());

    auto timeout = MakeErrorResponse(ProxyErrorKind::kUpstreamTimeout);
    assert(timeout.statusCode() == 504);
    assert(timeout.body().find("\"code\": 504") != std::string::npos);
    LOG_INFO << "JSON Body PASS";
}

void testAllowHeader() {
    auto resp = MakeErrorResponse(ProxyErrorKind::kMethodNotAllowed);
    assert(resp.statusCode() == 405);
    assert(resp.getHeader("Allow") == kAllowedMethods);
    const std::string allow = resp.getHeader("Allow");
    for (const char* m : {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS", "HEAD"}) {
        assert(allow.find(m) != std::string::npos);
    }
    LOG_INFO << "Allow Header PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testStatusTable();
    testForwardErrorMapping();
    testJsonBody();
    testAllowHeader();
    return 0;
}
