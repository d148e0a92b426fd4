#include "apiproxy/common/Config.h"
#include "apiproxy/common/Logger.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace apiproxy {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool Config::Parse(std::istream& in, std::map<std::string, Section>* out, const std::string& origin) {
    std::string line, section = "global";
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                LOG_ERROR << origin << ":" << lineNo << ": malformed section header: " << line;
                return false;
            }
            section = Trim(line.substr(1, line.size() - 2));
            (*out)[section];
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            LOG_WARN << origin << ":" << lineNo << ": ignoring line without '=': " << line;
            continue;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (key.empty()) {
            LOG_WARN << origin << ":" << lineNo << ": ignoring entry with empty key";
            continue;
        }
        (*out)[section][key] = value;
    }
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::map<std::string, Section> parsed;
    if (!Parse(file, &parsed, filename)) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    std::map<std::string, Section> parsed;
    if (!Parse(in, &parsed, "<string>")) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    return sit != settings_.end() && sit->second.count(key) > 0;
}

bool Config::HasSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.count(section) > 0;
}

Config::Section Config::GetSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return {};
    return sit->second;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? defaultVal : kit->second;
}

long Config::GetInt(const std::string& section, const std::string& key, long defaultVal) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        long v = std::stol(val, &used);
        if (used == val.size()) return v;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range, reported below
    }
    LOG_WARN << "Config [" << section << "] " << key << " = '" << val << "' is not an integer, using " << defaultVal;
    return defaultVal;
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        double v = std::stod(val, &used);
        if (used == val.size()) return v;
    } catch (const std::logic_error&) {
    }
    LOG_WARN << "Config [" << section << "] " << key << " = '" << val << "' is not a number, using " << defaultVal;
    return defaultVal;
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    LOG_WARN << "Config [" << section << "] " << key << " = '" << val << "' is not a boolean, using " << defaultVal;
    return defaultVal;
}

} // namespace common
} // namespace apiproxy
