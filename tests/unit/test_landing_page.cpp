#include "apiproxy/LandingPage.h"
#include "apiproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace apiproxy;
using namespace apiproxy::routing;
using namespace apiproxy::common;

void testListsRoutesSorted() {
    std::string error;
    auto table = RouteTable::Create({
        {"/zeta", "https://zeta.example"},
        {"/alpha/long", "https://alpha.example/v1"},
        {"/beta", "https://beta.example"},
    }, &error);
    assert(table);

    const std::string html = RenderLandingPage(*table);
    assert(html.find("<!DOCTYPE html>") == 0);
    const size_t a = html.find("href=\"/alpha/long\"");
    const size_t b = html.find("href=\"/beta\"");
    const size_t z = html.find("href=\"/zeta\"");
    assert(a != std::string::npos && b != std::string::npos && z != std::string::npos);
    assert(a < b && b < z);
    assert(html.find("https://alpha.example/v1") != std::string::npos);
    LOG_INFO << "Lists Routes Sorted PASS";
}

void testEscaping() {
    assert(HtmlEscape("<a href=\"x\">&'") == "&lt;a href=&quot;x&quot;&gt;&amp;&#39;");
    assert(HtmlEscape("plain") == "plain");

    std::string error;
    auto table = RouteTable::Create({{"/x<y>", "https://x.example"}}, &error);
    assert(table);
    const std::string html = RenderLandingPage(*table);
    assert(html.find("/x<y>") == std::string::npos);
    assert(html.find("/x&lt;y&gt;") != std::string::npos);
    LOG_INFO << "Escaping PASS";
}

void testDefaultTable() {
    std::string error;
    auto table = RouteTable::Create(RouteTable::Defaults(), &error);
    assert(table);
    const std::string html = RenderLandingPage(*table);
    for (const auto& e : RouteTable::Defaults()) {
        assert(html.find("href=\"" + e.prefix + "\"") != std::string::npos);
    }
    LOG_INFO << "Default Table PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testListsRoutesSorted();
    testEscaping();
    testDefaultTable();
    return 0;
}
