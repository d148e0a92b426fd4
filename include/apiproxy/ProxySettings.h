#pragma once

#include "apiproxy/common/Logger.h"
#include "apiproxy/routing/RouteTable.h"
#include "apiproxy/upstream/Forwarder.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace apiproxy {
namespace common {
class Config;
}

// Everything the server needs, assembled from (lowest to highest precedence) built-in
// defaults, the INI file, the environment and the command line.
struct ProxySettings {
    std::string host{"0.0.0.0"};
    uint16_t port{8080};
    int workers{4};
    size_t maxBodySizeMb{10};
    common::LogLevel logLevel{common::LogLevel::INFO};

    bool tlsEnable{false};
    std::string tlsCertPath;
    std::string tlsKeyPath;

    upstream::UpstreamClientOptions upstream;

    std::vector<routing::RouteEntry> routes{routing::RouteTable::Defaults()};
    std::vector<std::string> allowedHeaders;

    std::string configFile;
    bool checkOnly{false};

    ProxySettings();

    size_t maxBodyBytes() const { return maxBodySizeMb * 1024 * 1024; }

    bool ApplyConfig(const common::Config& conf, std::string* error);

    using EnvLookup = std::function<const char*(const char*)>;
    bool ApplyEnvironment(const EnvLookup& getenv, std::string* error);

    enum class CliAction { kRun, kExit, kError };
    // Parses argv into *this. kExit after --help.
    CliAction ApplyCommandLine(int argc, char* argv[], std::string* error);

    // Cross-field checks, including that the route table builds.
    bool Validate(std::string* error) const;

    // One line for the startup log.
    std::string Summary() const;

    static void PrintUsage(const char* prog);

    // Full layering: command line (for -c), file, environment, command line again.
    static CliAction Load(int argc, char* argv[], const EnvLookup& getenv, ProxySettings* out, std::string* error);
};

} // namespace apiproxy
