#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

namespace dropzone {

/**
 * Everything the server needs to start. Built once, never mutated.
 */
struct ServerConfig {
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    uint16_t port = DEFAULT_PORT;
    std::string bindAddress = "0.0.0.0";
    bool tlsEnabled = true;
    std::filesystem::path certPath;
    std::filesystem::path keyPath;
    std::filesystem::path uploadRoot;
    bool flat = false;
    std::optional<uint64_t> maxBodySize;
    std::size_t maxMessageSize = MAX_MESSAGE_SIZE;
    std::chrono::seconds idleTimeout{IDLE_TIMEOUT_SECONDS};

    /**
     * Build from "program [port] [--no-tls] [--flat]" plus environment.
     * @param args Arguments after the program name
     * @param env Environment lookup (use processEnv() in production)
     * @param cwd Directory uploads and default certificates are resolved against
     * @throws ConfigError on an invalid port, flag or size
     */
    static ServerConfig fromCommandLine(const std::vector<std::string>& args,
                                        const EnvLookup& env,
                                        const std::filesystem::path& cwd);

    static EnvLookup processEnv();

    std::string scheme() const { return tlsEnabled ? "https" : "http"; }
};

} // namespace dropzone
