#include "apiproxy/protocol/HttpHeaders.h"

#include <cctype>
#include <cstring>

namespace apiproxy {
namespace protocol {

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string ToLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool IsToken(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (std::isalnum(c)) continue;
        if (c != '\0' && c < 0x80 && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr) continue;
        return false;
    }
    return true;
}

bool IsValidFieldValue(const std::string& s) {
    for (unsigned char c : s) {
        if (c == ' ' || c == '\t') continue;
        if (c < 0x21 || c > 0x7e) return false;
    }
    return true;
}

const std::string* FindHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& kv : headers) {
        if (IEquals(kv.first, name)) return &kv.second;
    }
    return nullptr;
}

std::string TrimOws(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}

bool HeaderHasToken(const std::string& value, const std::string& token) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        if (IEquals(TrimOws(value.substr(pos, comma - pos)), token)) return true;
        pos = comma + 1;
    }
    return false;
}

} // namespace protocol
} // namespace apiproxy
