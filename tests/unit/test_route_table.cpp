#include "apiproxy/routing/RouteTable.h"
#include "apiproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace apiproxy::routing;
using namespace apiproxy::common;

static RouteTable build(std::vector<RouteEntry> entries) {
    std::string error;
    auto table = RouteTable::Create(std::move(entries), &error);
    assert(table);
    assert(error.empty());
    return std::move(*table);
}

void testLongestMatch() {
    RouteTable table = build({
        {"/api", "http://one.example"},
        {"/api/v2", "http://two.example"},
    });
    auto m = table.Resolve("/api/v2/x");
    assert(m);
    assert(m->route->entry.prefix == "/api/v2");
    assert(m->remainder == "/x");
    assert(m->route->base.host == "two.example");

    m = table.Resolve("/api/v1/x");
    assert(m);
    assert(m->route->entry.prefix == "/api");
    assert(m->remainder == "/v1/x");

    // Literal string prefix, not segment-aware.
    m = table.Resolve("/apiary");
    assert(m);
    assert(m->route->entry.prefix == "/api");
    assert(m->remainder == "ary");
    LOG_INFO << "Longest Match PASS";
}

void testExactAndMiss() {
    RouteTable table = build({{"/openai", "https://api.openai.com"}});
    auto m = table.Resolve("/openai");
    assert(m);
    assert(m->remainder.empty());

    m = table.Resolve("/openai/v1/models");
    assert(m);
    assert(m->route->entry.prefix == "/openai");
    assert(m->remainder == "/v1/models");

    assert(!table.Resolve("/unknown"));
    assert(!table.Resolve("/open"));
    assert(!table.Resolve("/OPENAI/v1"));
    LOG_INFO << "Exact And Miss PASS";
}

void testDeterministicOrder() {
    // Equal lengths rank lexicographically whatever the input order.
    RouteTable a = build({{"/bb", "http://b.example"}, {"/aa", "http://a.example"}, {"/c", "http://c.example"}});
    RouteTable b = build({{"/c", "http://c.example"}, {"/aa", "http://a.example"}, {"/bb", "http://b.example"}});
    assert(a.size() == 3);
    for (size_t i = 0; i < a.size(); ++i) {
        assert(a.routes()[i].entry.prefix == b.routes()[i].entry.prefix);
    }
    assert(a.routes()[0].entry.prefix == "/aa");
    assert(a.routes()[1].entry.prefix == "/bb");
    assert(a.routes()[2].entry.prefix == "/c");
    LOG_INFO << "Deterministic Order PASS";
}

void testCreateRejects() {
    std::string error;
    assert(!RouteTable::Create({{"", "http://a.example"}}, &error));
    assert(!error.empty());
    assert(!RouteTable::Create({{"noslash", "http://a.example"}}, &error));
    assert(!RouteTable::Create({{"/a", "http://a.example"}, {"/a", "http://b.example"}}, &error));
    assert(error.find("duplicate") != std::string::npos);
    assert(!RouteTable::Create({{"/a", "ftp://a.example"}}, &error));
    assert(!RouteTable::Create({{"/a", "a.example/path"}}, &error));
    assert(!RouteTable::Create({{"/a", "http://a.example/x?k=v"}}, &error));
    assert(!RouteTable::Create({{"/a b", "http://a.example"}}, &error));
    LOG_INFO << "Create Rejects PASS";
}

void testDefaults() {
    std::string error;
    auto table = RouteTable::Create(RouteTable::Defaults(), &error);
    assert(table);
    assert(table->size() == RouteTable::Defaults().size());

    auto m = table->Resolve("/groq/v1/chat/completions");
    assert(m);
    assert(m->route->base.toString() == "https://api.groq.com/openai");
    assert(m->remainder == "/v1/chat/completions");

    m = table->Resolve("/openrouter/v1/models");
    assert(m);
    assert(m->route->entry.prefix == "/openrouter");

    m = table->Resolve("/claude/v1/messages");
    assert(m);
    assert(m->route->base.host == "api.anthropic.com");
    LOG_INFO << "Default Routes PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testLongestMatch();
    testExactAndMiss();
    testDeterministicOrder();
    testCreateRejects();
    testDefaults();
    return 0;
}
