#pragma once

#include <initializer_list>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace apiproxy {
namespace protocol {

// Header fields in wire order. Duplicates are kept as separate entries.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

bool IEquals(const std::string& a, const std::string& b);
std::string ToLower(const std::string& s);

// RFC 7230 token (field names, methods).
bool IsToken(const std::string& s);
// Visible ASCII, SP and HTAB only.
bool IsValidFieldValue(const std::string& s);

// First value of a field, case-insensitive; nullptr if absent.
const std::string* FindHeader(const HeaderList& headers, const std::string& name);

// True if the comma-separated value contains token (case-insensitive, whole element).
bool HeaderHasToken(const std::string& value, const std::string& token);

std::string TrimOws(const std::string& s);

// Set of header names compared case-insensitively.
class HeaderNameSet {
public:
    HeaderNameSet() = default;
    HeaderNameSet(std::initializer_list<const char*> names) {
        for (const char* n : names) insert(n);
    }

    void insert(const std::string& name) { names_.insert(ToLower(name)); }
    bool contains(const std::string& name) const { return names_.count(ToLower(name)) > 0; }
    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    // Lowercased, sorted.
    const std::set<std::string>& names() const { return names_; }

private:
    std::set<std::string> names_;
};

} // namespace protocol
} // namespace apiproxy
