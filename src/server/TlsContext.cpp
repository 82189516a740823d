#include "server/TlsContext.hpp"
#include "core/Errors.hpp"

#include <fstream>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace dropzone {

namespace ssl = boost::asio::ssl;

std::string TlsContext::opensslErrors() {
    std::string out;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

void TlsContext::requireReadable(const std::filesystem::path& path, const char* what) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw CertificateError(std::string(what) + " not found: " + path.string());
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw CertificateError(std::string(what) + " is not a regular file: " + path.string());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CertificateError(std::string(what) + " is not readable: " + path.string());
    }
}

std::shared_ptr<ssl::context> TlsContext::load(const std::filesystem::path& certPath,
                                               const std::filesystem::path& keyPath) {
    requireReadable(certPath, "Certificate");
    requireReadable(keyPath, "Private key");

    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    ctx->set_options(ssl::context::default_workarounds |
                     ssl::context::no_sslv2 |
                     ssl::context::no_sslv3 |
                     ssl::context::no_tlsv1 |
                     ssl::context::no_tlsv1_1 |
                     ssl::context::single_dh_use);
    SSL_CTX_set_options(ctx->native_handle(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);

    boost::system::error_code ec;
    ERR_clear_error();
    ctx->use_certificate_chain_file(certPath.string(), ec);
    if (ec) {
        throw CertificateError("Cannot load certificate " + certPath.string() + ": " + ec.message());
    }

    ctx->use_private_key_file(keyPath.string(), ssl::context::pem, ec);
    if (ec) {
        throw CertificateError("Cannot load private key " + keyPath.string() + ": " + ec.message());
    }

    if (SSL_CTX_check_private_key(ctx->native_handle()) != 1) {
        throw CertificateError("Private key does not match certificate: " + opensslErrors());
    }

    return ctx;
}

std::shared_ptr<ssl::context> TlsContext::fromConfig(const ServerConfig& config) {
    if (!config.tlsEnabled) return nullptr;
    return load(config.certPath, config.keyPath);
}

} // namespace dropzone
