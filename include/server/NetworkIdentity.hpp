#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dropzone {

struct InterfaceAddress {
    std::string interfaceName;
    std::string address;
    bool isIPv6 = false;
    bool isUp = true;
    bool isLoopback = false;
};

/**
 * Finds the addresses other devices on the LAN can use to reach us.
 */
class NetworkIdentity {
public:
    // Enumerates interfaces and applies selectLanAddresses(). Never throws.
    static std::vector<std::string> discoverLanAddresses();

    /**
     * Drops down, loopback, link-local and container bridge addresses.
     * Falls back to 127.0.0.1 when nothing routable is left.
     */
    static std::vector<std::string> selectLanAddresses(const std::vector<InterfaceAddress>& candidates);

    static bool isLinkLocal(const std::string& address, bool isIPv6);

    // "http://10.0.0.5:8080", "https://[fd00::1]:8443"
    static std::string urlFor(const std::string& scheme, const std::string& address, uint16_t port);

private:
    static std::vector<InterfaceAddress> enumerateInterfaces();
};

} // namespace dropzone
