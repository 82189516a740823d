#include "server/NetworkIdentity.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace dropzone {

namespace {

bool isVirtualBridge(const std::string& name) {
    return name.rfind("docker", 0) == 0 || name.rfind("br-", 0) == 0 || name.rfind("veth", 0) == 0;
}

} // namespace

bool NetworkIdentity::isLinkLocal(const std::string& address, bool isIPv6) {
    if (isIPv6) {
        std::string lower = address;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower.rfind("fe8", 0) == 0 || lower.rfind("fe9", 0) == 0 ||
               lower.rfind("fea", 0) == 0 || lower.rfind("feb", 0) == 0;
    }
    return address.rfind("169.254.", 0) == 0;
}

std::vector<std::string> NetworkIdentity::selectLanAddresses(const std::vector<InterfaceAddress>& candidates) {
    std::vector<std::string> v4;
    std::vector<std::string> v6;

    for (const auto& c : candidates) {
        if (!c.isUp || c.isLoopback) continue;
        if (isVirtualBridge(c.interfaceName)) continue;
        if (isLinkLocal(c.address, c.isIPv6)) continue;

        auto& bucket = c.isIPv6 ? v6 : v4;
        if (std::find(bucket.begin(), bucket.end(), c.address) == bucket.end()) {
            bucket.push_back(c.address);
        }
    }

    std::vector<std::string> out = v4;
    out.insert(out.end(), v6.begin(), v6.end());
    if (out.empty()) {
        out.push_back("127.0.0.1");
    }
    return out;
}

std::vector<InterfaceAddress> NetworkIdentity::enumerateInterfaces() {
    std::vector<InterfaceAddress> out;

    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1 || !ifaddr) {
        Log::warn(std::string("Could not enumerate network interfaces: ") + std::strerror(errno));
        return out;
    }

    for (ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        int family = ifa->ifa_addr->sa_family;
        if (family != AF_INET && family != AF_INET6) continue;

        socklen_t len = family == AF_INET ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
        char host[NI_MAXHOST] = {0};
        if (getnameinfo(ifa->ifa_addr, len, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0) {
            continue;
        }

        InterfaceAddress entry;
        entry.interfaceName = ifa->ifa_name ? ifa->ifa_name : "";
        entry.address = host;
        // Strip the "%eth0" zone suffix getnameinfo adds to scoped IPv6 addresses
        auto zone = entry.address.find('%');
        if (zone != std::string::npos) entry.address.erase(zone);
        entry.isIPv6 = family == AF_INET6;
        entry.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        entry.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        out.push_back(std::move(entry));
    }

    freeifaddrs(ifaddr);
    return out;
}

std::vector<std::string> NetworkIdentity::discoverLanAddresses() {
    std::vector<std::string> addresses = selectLanAddresses(enumerateInterfaces());
    if (addresses.size() == 1 && addresses.front() == "127.0.0.1") {
        Log::warn("No LAN address found, only reachable from this machine");
    }
    return addresses;
}

std::string NetworkIdentity::urlFor(const std::string& scheme, const std::string& address, uint16_t port) {
    std::string host = address.find(':') != std::string::npos ? "[" + address + "]" : address;
    return scheme + "://" + host + ":" + std::to_string(port);
}

} // namespace dropzone
