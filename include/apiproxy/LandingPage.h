#pragma once

#include "apiproxy/routing/RouteTable.h"

#include <string>

namespace apiproxy {

// Informational HTML listing every route, sorted by prefix.
std::string RenderLandingPage(const routing::RouteTable& routes);

std::string HtmlEscape(const std::string& s);

} // namespace apiproxy
