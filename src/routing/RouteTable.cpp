#include "apiproxy/routing/RouteTable.h"

#include <algorithm>
#include <set>

namespace apiproxy {
namespace routing {

std::vector<RouteEntry> RouteTable::Defaults() {
    return {
        {"/anthropic", "https://api.anthropic.com"},
        {"/claude", "https://api.anthropic.com"},
        {"/cerebras", "https://api.cerebras.ai"},
        {"/cohere", "https://api.cohere.ai"},
        {"/discord", "https://discord.com/api"},
        {"/fireworks", "https://api.fireworks.ai"},
        {"/gemini", "https://generativelanguage.googleapis.com"},
        {"/groq", "https://api.groq.com/openai"},
        {"/huggingface", "https://api-inference.huggingface.co"},
        {"/meta", "https://www.meta.ai/api"},
        {"/novita", "https://api.novita.ai"},
        {"/nvidia", "https://integrate.api.nvidia.com"},
        {"/oaipro", "https://api.oaipro.com"},
        {"/openai", "https://api.openai.com"},
        {"/openrouter", "https://openrouter.ai/api"},
        {"/portkey", "https://api.portkey.ai"},
        {"/reka", "https://api.reka.ai"},
        {"/telegram", "https://api.telegram.org"},
        {"/together", "https://api.together.xyz"},
        {"/xai", "https://api.x.ai"},
        {"/github", "https://api.github.com"},
    };
}

std::optional<RouteTable> RouteTable::Create(std::vector<RouteEntry> entries, std::string* error) {
    RouteTable table;
    std::set<std::string> seen;
    for (auto& e : entries) {
        if (e.prefix.empty() || e.prefix[0] != '/') {
            if (error) *error = "route prefix must start with '/': '" + e.prefix + "'";
            return std::nullopt;
        }
        for (unsigned char c : e.prefix) {
            if (c <= 0x20 || c == 0x7f || c == '?' || c == '#') {
                if (error) *error = "invalid character in route prefix '" + e.prefix + "'";
                return std::nullopt;
            }
        }
        if (!seen.insert(e.prefix).second) {
            if (error) *error = "duplicate route prefix '" + e.prefix + "'";
            return std::nullopt;
        }
        std::string why;
        auto base = protocol::Url::Parse(e.targetBase, &why);
        if (!base) {
            if (error) *error = "route '" + e.prefix + "': bad target '" + e.targetBase + "': " + why;
            return std::nullopt;
        }
        if (base->query) {
            if (error) *error = "route '" + e.prefix + "': target must not carry a query";
            return std::nullopt;
        }
        table.ranked_.push_back(Route{std::move(e), std::move(*base)});
    }

    std::sort(table.ranked_.begin(), table.ranked_.end(), [](const Route& a, const Route& b) {
        if (a.entry.prefix.size() != b.entry.prefix.size()) {
            return a.entry.prefix.size() > b.entry.prefix.size();
        }
        return a.entry.prefix < b.entry.prefix;
    });
    return table;
}

std::optional<RouteTable::Match> RouteTable::Resolve(const std::string& path) const {
    for (const auto& route : ranked_) {
        const std::string& prefix = route.entry.prefix;
        if (path.compare(0, prefix.size(), prefix) == 0) {
            return Match{&route, path.substr(prefix.size())};
        }
    }
    return std::nullopt;
}

} // namespace routing
} // namespace apiproxy
