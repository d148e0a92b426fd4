#pragma once

#include "apiproxy/protocol/Url.h"

#include <optional>
#include <string>

namespace apiproxy {
namespace routing {

// Resolves remainder (the inbound path after the route prefix) against base with the
// base path taken as a directory. The result always stays on the base's scheme, host and
// port. Runs of '/' in remainder collapse to one. query is the inbound query without
// '?'; an empty one is not carried.
// nullopt when the remainder or query holds control characters.
std::optional<protocol::Url> BuildTargetUrl(const protocol::Url& base,
                                            const std::string& remainder,
                                            const std::string& query);

} // namespace routing
} // namespace apiproxy
