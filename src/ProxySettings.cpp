#include "apiproxy/ProxySettings.h"
#include "apiproxy/common/Config.h"
#include "apiproxy/routing/HeaderFilter.h"

#include <getopt.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace apiproxy {

namespace {

enum LongOnlyOption {
    kOptMaxBodySize = 1000,
    kOptRequestTimeout,
    kOptConnectTimeout,
};

bool ParseLong(const std::string& s, long lo, long hi, long* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0' || v < lo || v > hi) return false;
    *out = v;
    return true;
}

bool ParseSeconds(const std::string& s, double* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0' || !(v > 0)) return false;
    *out = v;
    return true;
}

bool Invalid(std::string* error, const std::string& what, const std::string& value) {
    if (error) *error = "invalid " + what + ": '" + value + "'";
    return false;
}

// Setters shared by the environment and the command line.
bool SetPort(ProxySettings* s, const std::string& v, std::string* error) {
    long n = 0;
    if (!ParseLong(v, 1, 65535, &n)) return Invalid(error, "port", v);
    s->port = static_cast<uint16_t>(n);
    return true;
}

bool SetWorkers(ProxySettings* s, const std::string& v, std::string* error) {
    long n = 0;
    if (!ParseLong(v, 0, 1024, &n)) return Invalid(error, "worker count", v);
    s->workers = static_cast<int>(n);
    return true;
}

bool SetMaxBody(ProxySettings* s, const std::string& v, std::string* error) {
    long n = 0;
    if (!ParseLong(v, 1, 4096, &n)) return Invalid(error, "max body size (MB)", v);
    s->maxBodySizeMb = static_cast<size_t>(n);
    return true;
}

bool SetLogLevel(ProxySettings* s, const std::string& v, std::string* error) {
    if (!common::Logger::ParseLevel(v, &s->logLevel)) return Invalid(error, "log level", v);
    return true;
}

} // namespace

ProxySettings::ProxySettings()
    : allowedHeaders(routing::HeaderFilter::Defaults()) {
}

bool ProxySettings::ApplyConfig(const common::Config& conf, std::string* error) {
    host = conf.GetString("global", "host", host);
    if (conf.Has("global", "port") && !SetPort(this, conf.GetString("global", "port"), error)) return false;
    if (conf.Has("global", "workers") && !SetWorkers(this, conf.GetString("global", "workers"), error)) return false;
    if (conf.Has("global", "max_body_size_mb") &&
        !SetMaxBody(this, conf.GetString("global", "max_body_size_mb"), error)) {
        return false;
    }
    if (conf.Has("global", "log_level")) {
        const std::string level = conf.GetString("global", "log_level");
        if (!SetLogLevel(this, level, error)) return false;
    }

    tlsEnable = conf.GetBool("tls", "enable", tlsEnable);
    tlsCertPath = conf.GetString("tls", "cert_path", tlsCertPath);
    tlsKeyPath = conf.GetString("tls", "key_path", tlsKeyPath);

    upstream.requestTimeoutSec = conf.GetDouble("upstream", "request_timeout", upstream.requestTimeoutSec);
    upstream.connectTimeoutSec = conf.GetDouble("upstream", "connect_timeout", upstream.connectTimeoutSec);
    upstream.tcpKeepAliveSec = static_cast<int>(conf.GetInt("upstream", "tcp_keepalive", upstream.tcpKeepAliveSec));
    upstream.poolMaxIdlePerHost = static_cast<size_t>(
        conf.GetInt("upstream", "pool_max_idle_per_host", static_cast<long>(upstream.poolMaxIdlePerHost)));
    upstream.poolIdleTimeoutSec = conf.GetDouble("upstream", "pool_idle_timeout", upstream.poolIdleTimeoutSec);
    upstream.dnsTtlSec = conf.GetDouble("upstream", "dns_ttl", upstream.dnsTtlSec);
    upstream.verifyPeer = conf.GetBool("upstream", "verify_peer", upstream.verifyPeer);
    upstream.caFile = conf.GetString("upstream", "ca_file", upstream.caFile);

    // A [routes] section replaces the built-in table entirely.
    if (conf.HasSection("routes")) {
        routes.clear();
        for (const auto& kv : conf.GetSection("routes")) {
            routes.push_back(routing::RouteEntry{kv.first, kv.second});
        }
    }
    if (conf.Has("headers", "allow")) {
        allowedHeaders = routing::HeaderFilter::ParseList(conf.GetString("headers", "allow"));
    }
    return true;
}

bool ProxySettings::ApplyEnvironment(const EnvLookup& getenv, std::string* error) {
    const char* v = nullptr;
    if ((v = getenv("PROXY_HOST")) && *v) host = v;
    if ((v = getenv("PROXY_PORT")) && *v && !SetPort(this, v, error)) return false;
    if ((v = getenv("PROXY_WORKERS")) && *v && !SetWorkers(this, v, error)) return false;
    if ((v = getenv("MAX_BODY_SIZE_MB")) && *v && !SetMaxBody(this, v, error)) return false;
    if ((v = getenv("REQUEST_TIMEOUT")) && *v && !ParseSeconds(v, &upstream.requestTimeoutSec)) {
        return Invalid(error, "REQUEST_TIMEOUT", v);
    }
    if ((v = getenv("CONNECT_TIMEOUT")) && *v && !ParseSeconds(v, &upstream.connectTimeoutSec)) {
        return Invalid(error, "CONNECT_TIMEOUT", v);
    }
    if ((v = getenv("PROXY_LOG_LEVEL")) && *v && !SetLogLevel(this, v, error)) return false;
    return true;
}

void ProxySettings::PrintUsage(const char* prog) {
    printf("Usage: %s [options]\n", prog);
    printf("  -c, --config FILE            INI config file\n");
    printf("  -C, --check                  validate settings and exit\n");
    printf("  -H, --host ADDR              listen address (default 0.0.0.0)\n");
    printf("  -p, --port PORT              listen port (default 8080)\n");
    printf("  -w, --workers N              worker event loops (default 4)\n");
    printf("  -l, --log-level LEVEL        DEBUG, INFO, WARN, ERROR\n");
    printf("      --max-body-size-mb N     inbound body cap (default 10)\n");
    printf("      --request-timeout SEC    total upstream deadline (default 3600)\n");
    printf("      --connect-timeout SEC    upstream connect deadline (default 10)\n");
    printf("  -h, --help                   show this help\n");
}

ProxySettings::CliAction ProxySettings::ApplyCommandLine(int argc, char* argv[], std::string* error) {
    static const struct option kLongOptions[] = {
        {"config", required_argument, nullptr, 'c'},
        {"check", no_argument, nullptr, 'C'},
        {"host", required_argument, nullptr, 'H'},
        {"port", required_argument, nullptr, 'p'},
        {"workers", required_argument, nullptr, 'w'},
        {"log-level", required_argument, nullptr, 'l'},
        {"max-body-size-mb", required_argument, nullptr, kOptMaxBodySize},
        {"request-timeout", required_argument, nullptr, kOptRequestTimeout},
        {"connect-timeout", required_argument, nullptr, kOptConnectTimeout},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;  // full rescan, argv may be parsed more than once
    opterr = 0;
    int ch;
    while ((ch = getopt_long(argc, argv, "c:CH:p:w:l:h", kLongOptions, nullptr)) != -1) {
        const std::string arg = optarg ? optarg : "";
        bool ok = true;
        switch (ch) {
            case 'c':
                configFile = arg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'H':
                host = arg;
                break;
            case 'p':
                ok = SetPort(this, arg, error);
                break;
            case 'w':
                ok = SetWorkers(this, arg, error);
                break;
            case 'l':
                ok = SetLogLevel(this, arg, error);
                break;
            case kOptMaxBodySize:
                ok = SetMaxBody(this, arg, error);
                break;
            case kOptRequestTimeout:
                ok = ParseSeconds(arg, &upstream.requestTimeoutSec) || Invalid(error, "request timeout", arg);
                break;
            case kOptConnectTimeout:
                ok = ParseSeconds(arg, &upstream.connectTimeoutSec) || Invalid(error, "connect timeout", arg);
                break;
            case 'h':
                PrintUsage(argv[0]);
                return CliAction::kExit;
            default:
                if (error) {
                    *error = optind > 0 && optind <= argc ? "unknown option or missing argument: " + std::string(argv[optind - 1])
                                                          : std::string("bad command line");
                }
                return CliAction::kError;
        }
        if (!ok) return CliAction::kError;
    }
    if (optind < argc) {
        if (error) *error = "unexpected argument: " + std::string(argv[optind]);
        return CliAction::kError;
    }
    return CliAction::kRun;
}

bool ProxySettings::Validate(std::string* error) const {
    if (host.empty()) {
        if (error) *error = "listen host is empty";
        return false;
    }
    if (workers < 0) return Invalid(error, "worker count", std::to_string(workers));
    if (maxBodySizeMb == 0) return Invalid(error, "max body size (MB)", "0");
    if (!(upstream.requestTimeoutSec > 0)) return Invalid(error, "request timeout", std::to_string(upstream.requestTimeoutSec));
    if (!(upstream.connectTimeoutSec > 0)) return Invalid(error, "connect timeout", std::to_string(upstream.connectTimeoutSec));
    if (!(upstream.dnsTtlSec >= 0)) return Invalid(error, "dns_ttl", std::to_string(upstream.dnsTtlSec));
    if (tlsEnable && (tlsCertPath.empty() || tlsKeyPath.empty())) {
        if (error) *error = "[tls] enable needs cert_path and key_path";
        return false;
    }
    if (allowedHeaders.empty()) {
        if (error) *error = "header allowlist is empty";
        return false;
    }
    std::string why;
    if (!routing::RouteTable::Create(routes, &why)) {
        if (error) *error = "route table: " + why;
        return false;
    }
    return true;
}

std::string ProxySettings::Summary() const {
    std::ostringstream ss;
    ss << "listen=" << host << ":" << port << " workers=" << workers << " max_body=" << maxBodySizeMb << "MB"
       << " routes=" << routes.size() << " allowed_headers=" << allowedHeaders.size()
       << " connect_timeout=" << upstream.connectTimeoutSec << "s request_timeout=" << upstream.requestTimeoutSec << "s"
       << " tls=" << (tlsEnable ? "on" : "off");
    return ss.str();
}

ProxySettings::CliAction ProxySettings::Load(int argc, char* argv[], const EnvLookup& getenv,
                                             ProxySettings* out, std::string* error) {
    // First pass only to learn -c / --help; values are applied again after the file.
    ProxySettings probe;
    CliAction action = probe.ApplyCommandLine(argc, argv, error);
    if (action != CliAction::kRun) return action;

    ProxySettings settings;
    if (!probe.configFile.empty()) {
        auto& conf = common::Config::Instance();
        if (!conf.Load(probe.configFile)) {
            if (error) *error = "cannot load config file " + probe.configFile;
            return CliAction::kError;
        }
        if (!settings.ApplyConfig(conf, error)) return CliAction::kError;
    }
    if (!settings.ApplyEnvironment(getenv, error)) return CliAction::kError;
    action = settings.ApplyCommandLine(argc, argv, error);
    if (action != CliAction::kRun) return action;

    *out = std::move(settings);
    return CliAction::kRun;
}

} // namespace apiproxy
