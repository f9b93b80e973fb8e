#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <tins/ip_address.h>

namespace netwake::discovery
{
    struct Cidr
    {
        uint32_t network = 0; // host byte order
        uint32_t mask = 0;    // host byte order
        int prefix = 0;

        uint32_t Broadcast() const { return network | ~mask; }
    };

    // Inclusive range of scan targets, host byte order.
    struct HostRange
    {
        uint32_t first = 0;
        uint32_t last = 0;
        bool empty = true;

        uint64_t Count() const { return empty ? 0 : static_cast<uint64_t>(last) - first + 1; }
    };

    uint32_t ToHostOrder(const Tins::IPv4Address &address);
    Tins::IPv4Address FromHostOrder(uint32_t value);

    std::optional<uint32_t> ParseAddress(const std::string &text);
    std::string FormatAddress(uint32_t value);

    int PrefixLength(uint32_t mask);
    uint32_t MaskFromPrefix(int prefix);

    // Accepts "a.b.c.d/n"; host bits are cleared like a non-strict network parse.
    std::optional<Cidr> ParseCidr(const std::string &subnet);
    std::string FormatCidr(const Cidr &cidr);

    bool CidrContains(const std::string &subnet, const std::string &ip);

    // Usable hosts: network and broadcast excluded, except for /31 and /32.
    HostRange HostsOf(const Cidr &cidr);
    std::vector<std::string> EnumerateHosts(const std::string &subnet);
}
