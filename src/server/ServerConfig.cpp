#include "server/ServerConfig.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <cstdlib>

namespace dropzone {

namespace {

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

uint16_t parsePort(const std::string& text) {
    if (!allDigits(text) || text.size() > 5) {
        throw ConfigError("Invalid port: " + text);
    }
    unsigned long value = std::stoul(text);
    if (value > 65535) {
        throw ConfigError("Port out of range: " + text);
    }
    return static_cast<uint16_t>(value);
}

} // namespace

ServerConfig::EnvLookup ServerConfig::processEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

ServerConfig ServerConfig::fromCommandLine(const std::vector<std::string>& args,
                                           const EnvLookup& env,
                                           const std::filesystem::path& cwd) {
    ServerConfig config;
    bool portSeen = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--no-tls") {
            config.tlsEnabled = false;
        } else if (arg == "--flat") {
            config.flat = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigError("Unknown option: " + arg);
        } else if (i == 0 && !portSeen) {
            config.port = parsePort(arg);
            portSeen = true;
        } else {
            throw ConfigError("Unexpected argument: " + arg);
        }
    }

    config.uploadRoot = config.flat ? cwd : cwd / UPLOAD_DIR_NAME;

    if (config.tlsEnabled) {
        auto cert = env(ENV_CERT_PATH);
        auto key = env(ENV_CERT_KEY_PATH);
        config.certPath = (cert && !cert->empty()) ? std::filesystem::path(*cert) : cwd / DEFAULT_CERT_FILE;
        config.keyPath = (key && !key->empty()) ? std::filesystem::path(*key) : cwd / DEFAULT_KEY_FILE;
    }

    if (auto maxBody = env(ENV_MAX_BODY_SIZE)) {
        if (!allDigits(*maxBody) || maxBody->size() > 19) {
            throw ConfigError(std::string(ENV_MAX_BODY_SIZE) + " must be a positive integer, got: " + *maxBody);
        }
        uint64_t value = std::stoull(*maxBody);
        if (value == 0) {
            throw ConfigError(std::string(ENV_MAX_BODY_SIZE) + " must be greater than zero");
        }
        config.maxBodySize = value;
    }

    return config;
}

} // namespace dropzone
