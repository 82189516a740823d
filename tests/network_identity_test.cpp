#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "server/NetworkIdentity.hpp"

using namespace dropzone;

namespace {

InterfaceAddress iface(const std::string& name, const std::string& addr, bool v6 = false,
                       bool up = true, bool loopback = false) {
    InterfaceAddress a;
    a.interfaceName = name;
    a.address = addr;
    a.isIPv6 = v6;
    a.isUp = up;
    a.isLoopback = loopback;
    return a;
}

} // namespace

TEST(NetworkIdentity, PrefersRoutableAddressesOverLoopback) {
    std::vector<std::string> selected = NetworkIdentity::selectLanAddresses({
        iface("lo", "127.0.0.1", false, true, true),
        iface("lo", "::1", true, true, true),
        iface("eth0", "fe80::1c2d:3e4f", true),
        iface("eth0", "192.168.1.42"),
        iface("wlan0", "fd00::42", true),
        iface("wlan0", "10.0.0.7"),
    });

    EXPECT_EQ(selected, (std::vector<std::string>{"192.168.1.42", "10.0.0.7", "fd00::42"}));
}

TEST(NetworkIdentity, SkipsDownLinkLocalAndBridges) {
    std::vector<std::string> selected = NetworkIdentity::selectLanAddresses({
        iface("eth1", "192.168.5.5", false, false),
        iface("eth2", "169.254.10.20"),
        iface("docker0", "172.17.0.1"),
        iface("br-1a2b3c", "172.18.0.1"),
        iface("veth12ab", "172.19.0.1"),
        iface("eth0", "192.168.1.42"),
    });

    EXPECT_EQ(selected, std::vector<std::string>{"192.168.1.42"});
}

TEST(NetworkIdentity, FallsBackToLoopback) {
    EXPECT_EQ(NetworkIdentity::selectLanAddresses({}), std::vector<std::string>{"127.0.0.1"});
    EXPECT_EQ(NetworkIdentity::selectLanAddresses({iface("lo", "127.0.0.1", false, true, true),
                                                   iface("eth0", "169.254.1.1")}),
              std::vector<std::string>{"127.0.0.1"});
}

TEST(NetworkIdentity, DeduplicatesAddresses) {
    std::vector<std::string> selected = NetworkIdentity::selectLanAddresses({
        iface("eth0", "192.168.1.42"),
        iface("eth0", "192.168.1.42"),
    });
    EXPECT_EQ(selected.size(), 1u);
}

TEST(NetworkIdentity, LinkLocalDetection) {
    EXPECT_TRUE(NetworkIdentity::isLinkLocal("169.254.0.1", false));
    EXPECT_FALSE(NetworkIdentity::isLinkLocal("192.168.0.1", false));
    EXPECT_TRUE(NetworkIdentity::isLinkLocal("FE80::1", true));
    EXPECT_TRUE(NetworkIdentity::isLinkLocal("febf::1", true));
    EXPECT_FALSE(NetworkIdentity::isLinkLocal("fec0::1", true));
    EXPECT_FALSE(NetworkIdentity::isLinkLocal("2001:db8::1", true));
}

TEST(NetworkIdentity, UrlFor) {
    EXPECT_EQ(NetworkIdentity::urlFor("http", "10.0.0.5", 8080), "http://10.0.0.5:8080");
    EXPECT_EQ(NetworkIdentity::urlFor("https", "fd00::1", 8443), "https://[fd00::1]:8443");
}

TEST(NetworkIdentity, DiscoveryAlwaysReturnsSomething) {
    std::vector<std::string> addresses = NetworkIdentity::discoverLanAddresses();
    EXPECT_FALSE(addresses.empty());
}
