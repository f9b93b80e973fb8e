#include "Ipv4.hpp"

#include <tins/endianness.h>

namespace netwake::discovery
{
    uint32_t ToHostOrder(const Tins::IPv4Address &address)
    {
        return Tins::Endian::be_to_host(static_cast<uint32_t>(address));
    }

    Tins::IPv4Address FromHostOrder(uint32_t value)
    {
        return Tins::IPv4Address(Tins::Endian::host_to_be(value));
    }

    std::optional<uint32_t> ParseAddress(const std::string &text)
    {
        if (text.empty() || text.find_first_not_of("0123456789.") != std::string::npos)
            return std::nullopt;
        try
        {
            return ToHostOrder(Tins::IPv4Address(text));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    std::string FormatAddress(uint32_t value)
    {
        return FromHostOrder(value).to_string();
    }

    int PrefixLength(uint32_t mask)
    {
        int bits = 0;
        while (mask)
        {
            bits += static_cast<int>(mask & 1u);
            mask >>= 1;
        }
        return bits;
    }

    uint32_t MaskFromPrefix(int prefix)
    {
        if (prefix <= 0)
            return 0;
        if (prefix >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    std::optional<Cidr> ParseCidr(const std::string &subnet)
    {
        auto slash = subnet.find('/');
        if (slash == std::string::npos)
            return std::nullopt;

        auto address = ParseAddress(subnet.substr(0, slash));
        if (!address)
            return std::nullopt;

        std::string bits = subnet.substr(slash + 1);
        if (bits.empty() || bits.size() > 2 || bits.find_first_not_of("0123456789") != std::string::npos)
            return std::nullopt;

        int prefix = std::stoi(bits);
        if (prefix > 32)
            return std::nullopt;

        Cidr cidr;
        cidr.prefix = prefix;
        cidr.mask = MaskFromPrefix(prefix);
        cidr.network = *address & cidr.mask;
        return cidr;
    }

    std::string FormatCidr(const Cidr &cidr)
    {
        return FormatAddress(cidr.network) + "/" + std::to_string(cidr.prefix);
    }

    bool CidrContains(const std::string &subnet, const std::string &ip)
    {
        auto cidr = ParseCidr(subnet);
        auto address = ParseAddress(ip);
        if (!cidr || !address)
            return false;
        return (*address & cidr->mask) == cidr->network;
    }

    HostRange HostsOf(const Cidr &cidr)
    {
        HostRange range;
        if (cidr.prefix >= 31)
        {
            range.first = cidr.network;
            range.last = cidr.Broadcast();
        }
        else
        {
            range.first = cidr.network + 1;
            range.last = cidr.Broadcast() - 1;
        }
        range.empty = false;
        return range;
    }

    std::vector<std::string> EnumerateHosts(const std::string &subnet)
    {
        std::vector<std::string> hosts;
        auto cidr = ParseCidr(subnet);
        if (!cidr)
            return hosts;

        HostRange range = HostsOf(*cidr);
        hosts.reserve(static_cast<size_t>(range.Count()));
        for (uint64_t value = range.first; value <= range.last; ++value)
            hosts.push_back(FormatAddress(static_cast<uint32_t>(value)));
        return hosts;
    }
}
