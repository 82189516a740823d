#pragma once

#include <filesystem>
#include <memory>
#include <boost/asio/ssl.hpp>
#include "server/ServerConfig.hpp"

namespace dropzone {

/**
 * Loads the server certificate chain and private key once at startup.
 */
class TlsContext {
public:
    /**
     * @throws CertificateError when a file is missing, unreadable, not PEM,
     *         or the key does not belong to the certificate
     */
    static std::shared_ptr<boost::asio::ssl::context> load(const std::filesystem::path& certPath,
                                                           const std::filesystem::path& keyPath);

    // nullptr when TLS is disabled in config
    static std::shared_ptr<boost::asio::ssl::context> fromConfig(const ServerConfig& config);

private:
    static void requireReadable(const std::filesystem::path& path, const char* what);
    static std::string opensslErrors();
};

} // namespace dropzone
