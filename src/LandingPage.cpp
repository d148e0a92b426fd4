#include "apiproxy/LandingPage.h"

#include <algorithm>
#include <vector>

namespace apiproxy {

namespace {

const char kPageHead[] = R"(<!DOCTYPE html>
<html>
<head>
    <title>API Proxy Service</title>
    <meta charset="utf-8">
    <meta name="viewport" content="width=device-width, initial-scale=1">
    <style>
        body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif;
               max-width: 1200px; margin: 0 auto; padding: 20px; line-height: 1.6; background: #f5f5f5; }
        .container { background: white; border-radius: 8px; padding: 30px; box-shadow: 0 2px 10px rgba(0,0,0,0.1); }
        h1 { color: #333; border-bottom: 2px solid #007acc; padding-bottom: 10px; margin-top: 0; }
        ul { list-style-type: none; padding: 0; display: grid;
             grid-template-columns: repeat(auto-fill, minmax(300px, 1fr)); gap: 10px; }
        li { margin: 5px 0; padding: 15px; background: #f8f9fa; border-radius: 5px; border-left: 4px solid #007acc; }
        a { text-decoration: none; color: #007acc; font-weight: bold; }
        a:hover { color: #005a9e; text-decoration: underline; }
        .url { color: #666; font-size: 0.9em; display: block; margin-top: 5px; }
        footer { margin-top: 30px; text-align: center; color: #666; font-size: 0.9em; }
        @media (max-width: 768px) { ul { grid-template-columns: 1fr; } }
    </style>
</head>
<body>
    <div class="container">
        <h1>API Proxy Service</h1>
        <p>Available API endpoints:</p>
        <ul>
)";

const char kPageTail[] = R"(        </ul>
        <footer>
            <p><small>Requests to a prefix are forwarded to the listed upstream.</small></p>
        </footer>
    </div>
</body>
</html>
)";

} // namespace

std::string HtmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string RenderLandingPage(const routing::RouteTable& routes) {
    std::vector<const routing::RouteEntry*> sorted;
    for (const auto& r : routes.routes()) sorted.push_back(&r.entry);
    std::sort(sorted.begin(), sorted.end(), [](const routing::RouteEntry* a, const routing::RouteEntry* b) {
        return a->prefix < b->prefix;
    });

    std::string html = kPageHead;
    for (const routing::RouteEntry* e : sorted) {
        const std::string prefix = HtmlEscape(e->prefix);
        html += "            <li><a href=\"" + prefix + "\">" + prefix + "</a>"
                "<span class=\"url\">" + HtmlEscape(e->targetBase) + "</span></li>\n";
    }
    html += kPageTail;
    return html;
}

} // namespace apiproxy
