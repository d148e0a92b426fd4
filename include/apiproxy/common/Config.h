#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include "apiproxy/common/noncopyable.h"

namespace apiproxy {
namespace common {

// INI-style settings store:
//   [section]
//   key = value        ; '#' or ';' start a comment line
// Keys before the first section header land in [global].
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text, replacing the current settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    bool Has(const std::string& section, const std::string& key) const;
    bool HasSection(const std::string& section) const;

    // Snapshot of one section; empty if the section does not exist.
    Section GetSection(const std::string& section) const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Numeric getters fall back to defaultVal (with a warning) when the value does not parse.
    long GetInt(const std::string& section, const std::string& key, long defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static bool Parse(std::istream& in, std::map<std::string, Section>* out, const std::string& origin);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace apiproxy
