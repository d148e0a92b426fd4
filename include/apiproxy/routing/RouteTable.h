#pragma once

#include "apiproxy/protocol/Url.h"

#include <optional>
#include <string>
#include <vector>

namespace apiproxy {
namespace routing {

struct RouteEntry {
    std::string prefix;      // e.g. "/openai"
    std::string targetBase;  // e.g. "https://api.openai.com"
};

// Immutable prefix -> upstream base mapping, built once at startup.
class RouteTable {
public:
    struct Route {
        RouteEntry entry;
        protocol::Url base;
    };

    struct Match {
        const Route* route;
        std::string remainder;  // path with the prefix removed, possibly empty
    };

    // Fails on an empty prefix, one not starting with '/', a duplicate prefix, or a base
    // that is not an absolute http(s) URL without a query.
    static std::optional<RouteTable> Create(std::vector<RouteEntry> entries, std::string* error);

    // The built-in provider table.
    static std::vector<RouteEntry> Defaults();

    // Longest literal prefix of path wins; equal lengths are ordered by prefix string.
    std::optional<Match> Resolve(const std::string& path) const;

    // Routes in match order.
    const std::vector<Route>& routes() const { return ranked_; }
    size_t size() const { return ranked_.size(); }

private:
    RouteTable() = default;

    std::vector<Route> ranked_;
};

} // namespace routing
} // namespace apiproxy
