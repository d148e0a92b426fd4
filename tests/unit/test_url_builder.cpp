#include "apiproxy/routing/UrlBuilder.h"
#include "apiproxy/protocol/Url.h"
#include "apiproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace apiproxy::routing;
using namespace apiproxy::protocol;
using namespace apiproxy::common;

static Url parse(const std::string& text) {
    auto url = Url::Parse(text);
    assert(url);
    return *url;
}

static std::string build(const std::string& base, const std::string& remainder, const std::string& query = "") {
    auto url = BuildTargetUrl(parse(base), remainder, query);
    assert(url);
    return url->toString();
}

void testUrlParse() {
    Url u = parse("HTTPS://API.Example.com:8443/v1/./a/../b?x=1#frag");
    assert(u.scheme == "https");
    assert(u.host == "api.example.com");
    assert(u.port == 8443);
    assert(u.explicitPort);
    assert(u.path == "/v1/b");
    assert(u.query && *u.query == "x=1");
    assert(u.origin() == "https://api.example.com:8443");
    assert(u.hostHeader() == "api.example.com:8443");
    assert(u.requestTarget() == "/v1/b?x=1");
    assert(u.withoutQuery() == "https://api.example.com:8443/v1/b");

    Url d = parse("http://example.com");
    assert(d.port == 80);
    assert(!d.explicitPort);
    assert(d.path == "/");
    assert(!d.query);
    assert(d.hostHeader() == "example.com");
    assert(d.toString() == "http://example.com/");

    Url sp = parse("http://example.com/a b");
    assert(sp.path == "/a%20b");

    std::string error;
    assert(!Url::Parse("ftp://example.com", &error));
    assert(!Url::Parse("example.com/x", &error));
    assert(!Url::Parse("http://user@example.com/", &error));
    assert(!Url::Parse("http://[::1]/", &error));
    assert(!Url::Parse("http://example.com:99999/", &error));
    assert(!Url::Parse("http://example.com:0/", &error));
    assert(!Url::Parse("http:///path", &error));
    assert(!error.empty());
    LOG_INFO << "Url Parse PASS";
}

void testRemoveDotSegments() {
    assert(RemoveDotSegments("/a/b/c/./../../g") == "/a/g");
    assert(RemoveDotSegments("mid/content=5/../6") == "mid/6");
    assert(RemoveDotSegments("/../x") == "/x");
    assert(RemoveDotSegments("/a/..") == "/");
    assert(RemoveDotSegments("/a//b") == "/a//b");
    LOG_INFO << "Remove Dot Segments PASS";
}

void testPercentEncode() {
    std::string out;
    assert(PercentEncode("a b/%41%zz", false, &out));
    assert(out == "a%20b/%41%25zz");
    assert(PercentEncode("q=a b&c=?d", true, &out));
    assert(out == "q=a%20b&c=?d");
    assert(PercentEncode("x?y", false, &out));
    assert(out == "x%3Fy");
    assert(PercentEncode("\xc3\xa9", false, &out));
    assert(out == "%C3%A9");
    assert(!PercentEncode("a\r\nb", false, &out));
    LOG_INFO << "Percent Encode PASS";
}

void testBasicJoin() {
    assert(build("https://api.openai.com", "/v1/models") == "https://api.openai.com/v1/models");
    assert(build("https://api.openai.com/", "/v1/models") == "https://api.openai.com/v1/models");
    // The base path is a directory: its last segment is kept.
    assert(build("https://api.groq.com/openai", "/v1/chat/completions") ==
           "https://api.groq.com/openai/v1/chat/completions");
    assert(build("https://openrouter.ai/api/", "/v1/models") == "https://openrouter.ai/api/v1/models");
    // Without the leading '/' as well.
    assert(build("https://api.groq.com/openai", "v1/x") == "https://api.groq.com/openai/v1/x");
    LOG_INFO << "Basic Join PASS";
}

void testEmptyRemainder() {
    assert(build("https://api.openai.com", "") == "https://api.openai.com/");
    assert(build("https://api.groq.com/openai", "") == "https://api.groq.com/openai");
    assert(build("https://openrouter.ai/api/", "") == "https://openrouter.ai/api/");
    assert(build("https://api.groq.com/openai", "/") == "https://api.groq.com/openai");
    assert(build("https://api.groq.com/openai", "", "a=1") == "https://api.groq.com/openai?a=1");
    LOG_INFO << "Empty Remainder PASS";
}

void testQuery() {
    assert(build("https://api.openai.com", "/v1/models", "limit=5&order=desc") ==
           "https://api.openai.com/v1/models?limit=5&order=desc");
    assert(build("https://api.openai.com", "/v1/models", "q=a b") == "https://api.openai.com/v1/models?q=a%20b");
    // An empty query is not carried.
    assert(build("https://api.openai.com", "/v1/models", "") == "https://api.openai.com/v1/models");
    LOG_INFO << "Query PASS";
}

void testStaysOnOrigin() {
    assert(build("https://api.openai.com", "//evil.com/x") == "https://api.openai.com/evil.com/x");
    assert(build("https://api.groq.com/openai", "///v1/models", "q=1") == "https://api.groq.com/openai/v1/models?q=1");
    assert(build("https://api.openai.com", "/https://evil.com/x") == "https://api.openai.com/https:/evil.com/x");
    assert(build("https://api.openai.com", "/javascript:alert(1)") == "https://api.openai.com/javascript:alert(1)");
    assert(build("https://api.openai.com", "/%2F%2Fevil.com") == "https://api.openai.com/%2F%2Fevil.com");

    auto url = BuildTargetUrl(parse("https://api.openai.com:8443"), "//evil.com:80/x", "");
    assert(url);
    assert(url->host == "api.openai.com");
    assert(url->port == 8443);
    LOG_INFO << "Stays On Origin PASS";
}

void testDotSegmentsAndDuplicates() {
    assert(build("https://api.groq.com/openai", "/v1/../v2/x") == "https://api.groq.com/openai/v2/x");
    assert(build("https://api.groq.com/openai", "/v1/./x") == "https://api.groq.com/openai/v1/x");
    // Dot segments may climb above the base path but never off the host.
    assert(build("https://api.groq.com/openai", "/../../../etc") == "https://api.groq.com/etc");
    assert(build("https://api.openai.com", "//v1/models") == "https://api.openai.com/v1/models");
    assert(build("https://api.openai.com", "/v1//models") == "https://api.openai.com/v1/models");
    assert(build("https://api.groq.com/openai", "//v1//models//") == "https://api.groq.com/openai/v1/models/");
    LOG_INFO << "Dot Segments PASS";
}

void testRejects() {
    assert(!BuildTargetUrl(parse("https://api.openai.com"), "/v1/\r\nHost: evil", ""));
    assert(!BuildTargetUrl(parse("https://api.openai.com"), "/v1", "a=\x01"));
    LOG_INFO << "Rejects PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testUrlParse();
    testRemoveDotSegments();
    testPercentEncode();
    testBasicJoin();
    testEmptyRemainder();
    testQuery();
    testStaysOnOrigin();
    testDotSegmentsAndDuplicates();
    testRejects();
    return 0;
}
