#pragma once

#include "apiproxy/protocol/HttpHeaders.h"

#include <string>
#include <vector>

namespace apiproxy {
namespace routing {

// Inbound headers that may be forwarded upstream. Immutable once built.
class HeaderFilter {
public:
    explicit HeaderFilter(const std::vector<std::string>& allowedNames);

    static std::vector<std::string> Defaults();
    // "a, B ,c" -> {"a", "b", "c"}; empty elements are dropped.
    static std::vector<std::string> ParseList(const std::string& csv);

    bool allows(const std::string& name) const { return allowed_.contains(name); }

    // Allowed headers with wire-safe values, in inbound order, duplicates kept.
    protocol::HeaderList Filter(const protocol::HeaderList& inbound) const;

    const protocol::HeaderNameSet& allowed() const { return allowed_; }

private:
    protocol::HeaderNameSet allowed_;
};

} // namespace routing
} // namespace apiproxy
