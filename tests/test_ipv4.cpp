#include <doctest/doctest.h>
#include "discovery/Ipv4.hpp"
#include "discovery/InterfaceEnumerator.hpp"

using namespace netwake;
using namespace netwake::discovery;

TEST_CASE("ComputeSubnet matches standard CIDR arithmetic") {
    struct Case {
        const char *ip, *mask, *network, *broadcast, *subnet;
    };
    const Case cases[] = {
        {"192.168.0.23", "255.255.255.0", "192.168.0.0", "192.168.0.255", "192.168.0.0/24"},
        {"10.1.2.3", "255.0.0.0", "10.0.0.0", "10.255.255.255", "10.0.0.0/8"},
        {"172.16.40.9", "255.255.240.0", "172.16.32.0", "172.16.47.255", "172.16.32.0/20"},
        {"134.124.231.77", "255.255.254.0", "134.124.230.0", "134.124.231.255", "134.124.230.0/23"},
        {"192.168.1.6", "255.255.255.252", "192.168.1.4", "192.168.1.7", "192.168.1.4/30"},
    };

    for (const auto &c : cases) {
        CAPTURE(c.ip);
        auto iface = ComputeSubnet("en0", c.ip, c.mask);
        REQUIRE(iface.has_value());
        CHECK(iface->network == c.network);
        CHECK(iface->broadcast == c.broadcast);
        CHECK(iface->subnet == c.subnet);
        CHECK(iface->ip == c.ip);
        CHECK_FALSE(iface->discovered);
    }
}

TEST_CASE("ComputeSubnet rejects malformed input") {
    CHECK_FALSE(ComputeSubnet("en0", "not-an-ip", "255.255.255.0").has_value());
    CHECK_FALSE(ComputeSubnet("en0", "192.168.0.1", "").has_value());
}

TEST_CASE("Prefix length and mask are inverse") {
    for (int prefix = 0; prefix <= 32; ++prefix) {
        CHECK(PrefixLength(MaskFromPrefix(prefix)) == prefix);
    }
    CHECK(MaskFromPrefix(24) == 0xFFFFFF00u);
}

TEST_CASE("Addresses survive the host-order conversion") {
    auto value = ParseAddress("192.168.0.1");
    REQUIRE(value.has_value());
    CHECK(*value == 0xC0A80001u);
    CHECK(FormatAddress(0xC0A80001u) == "192.168.0.1");
    CHECK_FALSE(ParseAddress("").has_value());
    CHECK_FALSE(ParseAddress("fe80::1").has_value());
}

TEST_CASE("ParseCidr clears host bits") {
    auto cidr = ParseCidr("192.168.0.77/24");
    REQUIRE(cidr.has_value());
    CHECK(FormatCidr(*cidr) == "192.168.0.0/24");
    CHECK(cidr->Broadcast() == 0xC0A800FFu);

    CHECK_FALSE(ParseCidr("192.168.0.0").has_value());
    CHECK_FALSE(ParseCidr("192.168.0.0/33").has_value());
    CHECK_FALSE(ParseCidr("192.168.0.0/x").has_value());
}

TEST_CASE("CidrContains uses a prefix test") {
    CHECK(CidrContains("134.124.230.0/24", "134.124.230.5"));
    CHECK_FALSE(CidrContains("134.124.230.0/24", "134.124.231.5"));
    CHECK(CidrContains("10.0.0.0/8", "10.200.3.4"));
    CHECK_FALSE(CidrContains("garbage", "10.0.0.1"));
}

TEST_CASE("EnumerateHosts excludes network and broadcast") {
    auto hosts = EnumerateHosts("192.168.0.0/24");
    REQUIRE(hosts.size() == 254);
    CHECK(hosts.front() == "192.168.0.1");
    CHECK(hosts.back() == "192.168.0.254");

    auto small = EnumerateHosts("10.0.0.4/30");
    REQUIRE(small.size() == 2);
    CHECK(small[0] == "10.0.0.5");
    CHECK(small[1] == "10.0.0.6");
}

TEST_CASE("EnumerateHosts keeps /31 and /32 addresses as-is") {
    auto pair = EnumerateHosts("10.0.0.8/31");
    REQUIRE(pair.size() == 2);
    CHECK(pair[0] == "10.0.0.8");
    CHECK(pair[1] == "10.0.0.9");

    auto single = EnumerateHosts("10.0.0.9/32");
    REQUIRE(single.size() == 1);
    CHECK(single[0] == "10.0.0.9");

    CHECK(EnumerateHosts("bogus").empty());
}

TEST_CASE("HostsOf counts a /22 across chunk boundaries") {
    auto cidr = ParseCidr("10.20.0.0/22");
    REQUIRE(cidr.has_value());
    HostRange range = HostsOf(*cidr);
    CHECK(range.Count() == 1022);
    CHECK(FormatAddress(range.first) == "10.20.0.1");
    CHECK(FormatAddress(range.last) == "10.20.3.254");
}
