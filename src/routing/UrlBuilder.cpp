#include "apiproxy/routing/UrlBuilder.h"
#include "apiproxy/common/Logger.h"

namespace apiproxy {
namespace routing {

std::optional<protocol::Url> BuildTargetUrl(const protocol::Url& base,
                                            const std::string& remainder,
                                            const std::string& query) {
    // Runs of '/' collapse to one and leading ones go, so the reference is never a
    // network-path ("//host") or an absolute path.
    std::string ref;
    ref.reserve(remainder.size());
    for (char c : remainder) {
        if (c == '/' && (ref.empty() || ref.back() == '/')) continue;
        ref += c;
    }

    // A scheme-like first segment would make it absolute too.
    const size_t colon = ref.find(':');
    if (colon != std::string::npos && colon < ref.find('/')) {
        ref.insert(0, "./");
    }

    std::string encodedRef;
    if (!protocol::PercentEncode(ref, false, &encodedRef)) {
        LOG_DEBUG << "Control character in path remainder";
        return std::nullopt;
    }
    std::optional<std::string> encodedQuery;
    if (!query.empty()) {
        std::string q;
        if (!protocol::PercentEncode(query, true, &q)) {
            LOG_DEBUG << "Control character in query";
            return std::nullopt;
        }
        encodedQuery = std::move(q);
    }

    if (encodedRef.empty() && !encodedQuery) return base;

    protocol::Url dirBase = base;
    if (dirBase.path.empty() || dirBase.path.back() != '/') dirBase.path += '/';
    protocol::Url target = protocol::ResolveReference(encodedRef.empty() ? base : dirBase, encodedRef, encodedQuery);

    if (!target.sameOrigin(base)) {
        LOG_WARN << "Resolved URL " << target.toString() << " left origin " << base.origin();
        return std::nullopt;
    }
    return target;
}

} // namespace routing
} // namespace apiproxy
