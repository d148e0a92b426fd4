#include "apiproxy/routing/HeaderFilter.h"
#include "apiproxy/common/Logger.h"

namespace apiproxy {
namespace routing {

HeaderFilter::HeaderFilter(const std::vector<std::string>& allowedNames) {
    for (const auto& name : allowedNames) {
        allowed_.insert(name);
    }
}

std::vector<std::string> HeaderFilter::Defaults() {
    return {"accept", "content-type", "authorization", "x-goog-api-key",
            "x-api-key", "user-agent", "cache-control"};
}

std::vector<std::string> HeaderFilter::ParseList(const std::string& csv) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= csv.size()) {
        size_t comma = csv.find(',', pos);
        if (comma == std::string::npos) comma = csv.size();
        std::string name = protocol::ToLower(protocol::TrimOws(csv.substr(pos, comma - pos)));
        if (!name.empty()) out.push_back(std::move(name));
        pos = comma + 1;
    }
    return out;
}

protocol::HeaderList HeaderFilter::Filter(const protocol::HeaderList& inbound) const {
    protocol::HeaderList out;
    for (const auto& kv : inbound) {
        if (!allowed_.contains(kv.first)) continue;
        if (!protocol::IsValidFieldValue(kv.second)) {
            LOG_DEBUG << "Dropping header " << kv.first << " with non-printable value";
            continue;
        }
        out.push_back(kv);
    }
    return out;
}

} // namespace routing
} // namespace apiproxy
