#include "apiproxy/network/TlsContext.h"
#include "apiproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>

namespace apiproxy {
namespace network {

TlsContext::TlsContext() {
    static std::once_flag inited;
    std::call_once(inited, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

TlsContext::~TlsContext() {
    Reset();
}

void TlsContext::Reset() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

std::string TlsContext::LastErrorString() {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

bool TlsContext::InitServer(const std::string& certPemPath, const std::string& keyPemPath) {
    if (certPemPath.empty() || keyPemPath.empty()) {
        LOG_ERROR << "TLS: listener needs both cert_path and key_path";
        return false;
    }
    Reset();

    SSL_CTX* c = SSL_CTX_new(TLS_server_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastErrorString();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (SSL_CTX_use_certificate_chain_file(c, certPemPath.c_str()) != 1) {
        LOG_ERROR << "TLS: load cert failed: " << certPemPath << " " << LastErrorString();
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(c, keyPemPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "TLS: load key failed: " << keyPemPath << " " << LastErrorString();
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_check_private_key(c) != 1) {
        LOG_ERROR << "TLS: key does not match cert";
        SSL_CTX_free(c);
        return false;
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    verifyPeer_ = false;
    return true;
}

bool TlsContext::InitClient(bool verifyPeer, const std::string& caFile) {
    Reset();

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastErrorString();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Upstreams that close without close_notify still delimit read-until-close bodies.
    SSL_CTX_set_options(c, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (verifyPeer) {
        int rc = caFile.empty()
            ? SSL_CTX_set_default_verify_paths(c)
            : SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr);
        if (rc != 1) {
            LOG_ERROR << "TLS: cannot load trust store " << (caFile.empty() ? "(system default)" : caFile)
                      << ": " << LastErrorString();
            SSL_CTX_free(c);
            return false;
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        LOG_WARN << "TLS: upstream certificate verification is disabled";
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    verifyPeer_ = verifyPeer;
    return true;
}

} // namespace network
} // namespace apiproxy
