#include "apiproxy/protocol/HttpContext.h"
#include "apiproxy/protocol/HttpResponse.h"
#include "apiproxy/protocol/HttpResponseContext.h"
#include "apiproxy/network/Buffer.h"
#include "apiproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace apiproxy::protocol;
using namespace apiproxy::network;
using namespace apiproxy::common;

static bool parseAll(HttpContext& context, Buffer& buf) {
    return context.parseRequest(&buf, std::chrono::system_clock::now());
}

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    buf.Append("GET /openai/v1/models?limit=5 HTTP/1.1\r\nHost: ");
    assert(parseAll(context, buf));
    assert(!context.gotAll());

    buf.Append("localhost\r\nUser-Agent: curl/7.68.0\r\nAccept: */*\r\nx-api-key:  k1 \r\n\r\n");
    assert(parseAll(context, buf));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kGet);
    assert(req.methodString() == "GET");
    assert(req.path() == "/openai/v1/models");
    assert(req.hasQuery());
    assert(req.query() == "limit=5");
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("X-API-KEY") == "k1");
    assert(req.headers().size() == 4);
    assert(req.headers()[0].first == "Host");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Request PASS";
}

void testParseEmptyQuery() {
    HttpContext context;
    Buffer buf;
    buf.Append("GET /a? HTTP/1.1\r\n\r\n");
    assert(parseAll(context, buf));
    assert(context.gotAll());
    assert(context.request().hasQuery());
    assert(context.request().query().empty());
    LOG_INFO << "Parse Empty Query PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /submit HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Content-Length: 5\r\n"
               "\r\n"
               "hello"
               "GET /next HTTP/1.1\r\n\r\n");
    assert(parseAll(context, buf));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kPost);
    assert(req.body() == "hello");
    // The pipelined request stays in the buffer.
    assert(buf.RetrieveAllAsString() == "GET /next HTTP/1.1\r\n\r\n");
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /chunk HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Transfer-Encoding: chunked\r\n"
               "\r\n"
               "5;ext=1\r\n"
               "hello\r\n"
               "6\r\n");
    assert(parseAll(context, buf));
    assert(context.expectingBody());
    buf.Append(" world\r\n0\r\nX-Trailer: 1\r\n\r\n");
    assert(parseAll(context, buf));
    assert(context.gotAll());
    assert(context.request().body() == "hello world");
    assert(!context.mustClose());
    LOG_INFO << "Parse Chunked Body PASS";
}

void testRejects() {
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET http://example.com/ HTTP/1.1\r\n\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kMalformed);
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nBad Header: x\r\n\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kMalformed);
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 6\r\n\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kMalformed);
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kMalformed);
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/2.0\r\n\r\n");
        assert(!parseAll(context, buf));
    }
    LOG_INFO << "Parse Rejects PASS";
}

void testBodyLimits() {
    {
        HttpContext context(16);
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kBodyTooLarge);
    }
    {
        HttpContext context(16);
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: 16\r\n\r\n0123456789abcdef");
        assert(parseAll(context, buf));
        assert(context.gotAll());
    }
    {
        HttpContext context(8);
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n5\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kBodyTooLarge);
    }
    {
        HttpContext context(1024, 64);
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nX-Long: " + std::string(100, 'a') + "\r\n\r\n");
        assert(!parseAll(context, buf));
        assert(context.error() == HttpContext::kMalformed);
    }
    LOG_INFO << "Body Limits PASS";
}

void testExpectContinueAndAmbiguousFraming() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST / HTTP/1.1\r\nExpect: 100-continue\r\nContent-Length: 3\r\n\r\n");
    assert(parseAll(context, buf));
    assert(context.continueExpected());
    buf.Append("abc");
    assert(parseAll(context, buf));
    assert(context.gotAll());
    assert(!context.continueExpected());

    HttpContext both;
    Buffer buf2;
    buf2.Append("POST / HTTP/1.1\r\nContent-Length: 99\r\nTransfer-Encoding: chunked\r\n\r\n1\r\nx\r\n0\r\n\r\n");
    assert(parseAll(both, buf2));
    assert(both.gotAll());
    assert(both.request().body() == "x");
    assert(both.mustClose());
    LOG_INFO << "Expect/Ambiguous Framing PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.addHeader("Set-Cookie", "a=1");
    resp.addHeader("Set-Cookie", "b=2");
    resp.addHeader("Transfer-Encoding", "chunked");
    resp.setBody("Hello World");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string expected =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 11\r\n"
        "Connection: close\r\n"
        "Content-Type: text/plain\r\n"
        "Set-Cookie: a=1\r\n"
        "Set-Cookie: b=2\r\n"
        "\r\n"
        "Hello World";
    assert(buf.RetrieveAllAsString() == expected);

    HttpResponse head(false);
    head.setStatusCode(200);
    head.setHeadResponse(true);
    head.setHeader("Content-Length", "42");
    head.setBody("ignored");
    head.appendToBuffer(&buf);
    assert(buf.RetrieveAllAsString() == "HTTP/1.1 200 OK\r\nConnection: keep-alive\r\nContent-Length: 42\r\n\r\n");

    HttpResponse noContent(false);
    noContent.setStatusCode(204);
    noContent.setBody("x");
    noContent.appendToBuffer(&buf);
    assert(buf.RetrieveAllAsString() == "HTTP/1.1 204 No Content\r\nConnection: keep-alive\r\n\r\n");
    LOG_INFO << "Response Gen PASS";
}

void testUpstreamContentLength() {
    HttpResponseContext ctx;
    const std::string msg = "HTTP/1.1 201 Created\r\nContent-Length: 4\r\nX-Id: 7\r\n\r\nab";
    assert(ctx.feed(msg.data(), msg.size()));
    assert(ctx.headersComplete());
    assert(!ctx.gotAll());
    assert(ctx.feed("cd", 2));
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 201);
    assert(ctx.reasonPhrase() == "Created");
    assert(ctx.body() == "abcd");
    assert(ctx.keepAlive());
    assert(*FindHeader(ctx.headers(), "x-id") == "7");
    LOG_INFO << "Upstream Content-Length PASS";
}

void testUpstreamChunkedSplit() {
    HttpResponseContext ctx;
    const std::string msg =
        "HTTP/1.1 100 Continue\r\n\r\n"
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nWiki\r\n5\r\npedia\r\n0\r\nX-T: 1\r\n\r\n";
    // Byte at a time exercises every split point, a lone '\r' included.
    for (char c : msg) {
        assert(ctx.feed(&c, 1));
    }
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 200);
    assert(ctx.body() == "Wikipedia");
    assert(ctx.keepAlive());
    LOG_INFO << "Upstream Chunked Split PASS";
}

void testUpstreamReadUntilClose() {
    HttpResponseContext ctx;
    const std::string msg = "HTTP/1.0 200 OK\r\n\r\npartial";
    assert(ctx.feed(msg.data(), msg.size()));
    assert(!ctx.gotAll());
    assert(ctx.needsCloseToFinish());
    assert(ctx.onClose());
    assert(ctx.body() == "partial");
    assert(!ctx.keepAlive());

    HttpResponseContext cut;
    const std::string shortBody = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";
    assert(cut.feed(shortBody.data(), shortBody.size()));
    assert(!cut.onClose());
    LOG_INFO << "Upstream Read Until Close PASS";
}

void testUpstreamHeadAndErrors() {
    HttpResponseContext head;
    head.setHeadRequest(true);
    const std::string msg = "HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n";
    assert(head.feed(msg.data(), msg.size()));
    assert(head.gotAll());
    assert(head.body().empty());

    HttpResponseContext bad;
    const std::string garbage = "SSH-2.0-OpenSSH\r\n\r\n";
    assert(!bad.feed(garbage.data(), garbage.size()));
    assert(bad.hasError());

    HttpResponseContext badChunk;
    const std::string chunk = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n";
    assert(!badChunk.feed(chunk.data(), chunk.size()));

    HttpResponseContext extra;
    const std::string twice = "HTTP/1.1 204 No Content\r\n\r\nHTTP/1.1 200 OK\r\n";
    assert(extra.feed(twice.data(), twice.size()));
    assert(extra.gotAll());
    assert(!extra.keepAlive());
    LOG_INFO << "Upstream HEAD/Errors PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testParseEmptyQuery();
    testParseContentLengthBody();
    testParseChunkedBody();
    testRejects();
    testBodyLimits();
    testExpectContinueAndAmbiguousFraming();
    testResponseGen();
    testUpstreamContentLength();
    testUpstreamChunkedSplit();
    testUpstreamReadUntilClose();
    testUpstreamHeadAndErrors();
    return 0;
}
