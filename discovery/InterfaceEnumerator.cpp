#include "InterfaceEnumerator.hpp"
#include "Ipv4.hpp"
#include "../common/Debug.hpp"

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <unistd.h>
#include <tins/network_interface.h>

namespace netwake::discovery
{
    namespace
    {
        bool LooksLikeLoopback(const std::string &name)
        {
            return name.rfind("lo", 0) == 0 || name.find("Loopback") != std::string::npos;
        }

        std::string StripToken(std::string token)
        {
            while (!token.empty() && (token.front() == '(' || token.front() == '['))
                token.erase(token.begin());
            while (!token.empty() && (token.back() == ')' || token.back() == ']' || token.back() == ','))
                token.pop_back();
            return token;
        }

        size_t CountDots(const std::string &token)
        {
            size_t dots = 0;
            for (char c : token)
                if (c == '.')
                    ++dots;
            return dots;
        }

        // True when `name` appears as a whole whitespace-separated field.
        bool MentionsInterface(const std::string &line, const std::string &name)
        {
            std::istringstream ss(line);
            std::string field;
            while (ss >> field)
            {
                if (StripToken(field) == name)
                    return true;
            }
            return false;
        }
    }

    std::optional<common::NetworkInterface> ComputeSubnet(const std::string &name,
                                                          const std::string &ip,
                                                          const std::string &netmask)
    {
        auto address = ParseAddress(ip);
        auto mask = ParseAddress(netmask);
        if (!address || !mask)
            return std::nullopt;

        Cidr cidr;
        cidr.mask = *mask;
        cidr.prefix = PrefixLength(*mask);
        cidr.network = *address & *mask;

        common::NetworkInterface iface;
        iface.name = name;
        iface.ip = ip;
        iface.netmask = netmask;
        iface.network = FormatAddress(cidr.network);
        iface.broadcast = FormatAddress(cidr.Broadcast());
        iface.subnet = FormatCidr(cidr);
        iface.discovered = false;
        return iface;
    }

    std::vector<common::NetworkInterface> InferDiscoveredNetworks(const common::NetworkInterface &primary,
                                                                  const std::vector<std::string> &neighborLines)
    {
        std::vector<common::NetworkInterface> discovered;
        std::set<std::string> seen;

        for (const auto &line : neighborLines)
        {
            if (primary.name.empty() || !MentionsInterface(line, primary.name))
                continue;

            std::istringstream ss(line);
            std::string raw;
            while (ss >> raw)
            {
                std::string token = StripToken(raw);
                if (CountDots(token) != 3)
                    continue;

                auto address = ParseAddress(token);
                if (!address)
                    continue;
                if (CidrContains(primary.subnet, token))
                    continue;

                // Every foreign neighbor is assumed to sit in a full /24.
                uint32_t network = *address & 0xFFFFFF00u;
                std::string subnet = FormatAddress(network) + "/24";
                if (!seen.insert(subnet).second)
                    continue;

                common::NetworkInterface iface;
                iface.name = primary.name;
                iface.ip = primary.ip;
                iface.netmask = "255.255.255.0";
                iface.network = FormatAddress(network);
                iface.broadcast = FormatAddress(network | 0xFFu);
                iface.subnet = subnet;
                iface.discovered = true;
                discovered.push_back(iface);
            }
        }
        return discovered;
    }

    std::string FormatNetworkRange(const std::string &subnet)
    {
        auto cidr = ParseCidr(subnet);
        if (!cidr)
            return subnet;

        std::string network = FormatAddress(cidr->network);
        std::vector<std::string> parts;
        std::stringstream ss(network);
        std::string part;
        while (std::getline(ss, part, '.'))
            parts.push_back(part);

        switch (cidr->prefix)
        {
        case 24:
            return parts[0] + "." + parts[1] + "." + parts[2] + ".*";
        case 16:
            return parts[0] + "." + parts[1] + ".*.*";
        case 8:
            return parts[0] + ".*.*.*";
        default:
            return network + " → " + FormatAddress(cidr->Broadcast());
        }
    }

    std::vector<NetworkSummary> SummarizeNetworks(const std::vector<common::NetworkInterface> &interfaces,
                                                  uint64_t &totalAddresses)
    {
        std::vector<NetworkSummary> summary;
        totalAddresses = 0;

        for (const auto &iface : interfaces)
        {
            auto cidr = ParseCidr(iface.subnet);
            if (!cidr)
                continue;

            NetworkSummary entry;
            entry.interface_name = iface.name;
            entry.range = FormatNetworkRange(iface.subnet);
            entry.address_count = HostsOf(*cidr).Count() + 2;
            entry.host_ip = iface.ip;
            totalAddresses += entry.address_count;
            summary.push_back(entry);
        }
        return summary;
    }

    InterfaceEnumerator::InterfaceEnumerator(std::shared_ptr<common::CommandRunner> runner,
                                             std::string neighborTablePath)
        : m_runner(std::move(runner)), m_neighborTablePath(std::move(neighborTablePath))
    {
    }

    std::vector<common::NetworkInterface> InterfaceEnumerator::ListPrimaryInterfaces()
    {
        std::vector<common::NetworkInterface> interfaces;

        std::vector<Tins::NetworkInterface> all;
        try
        {
            all = Tins::NetworkInterface::all();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Interfaces] Enumeration failed: " << e.what() << "\n";
            return interfaces;
        }

        for (const auto &tinsIface : all)
        {
            try
            {
                std::string name = tinsIface.name();
                if (LooksLikeLoopback(name) || tinsIface.is_loopback())
                    continue;

                Tins::NetworkInterface::Info info = tinsIface.info();
                std::string ip = info.ip_addr.to_string();
                std::string netmask = info.netmask.to_string();
                if (ip == "0.0.0.0" || ip == "127.0.0.1" || netmask == "0.0.0.0")
                    continue;

                auto iface = ComputeSubnet(name, ip, netmask);
                if (iface)
                    interfaces.push_back(*iface);
            }
            catch (const std::exception &e)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Interfaces] Skipping interface: " << e.what() << "\n";
            }
        }
        return interfaces;
    }

    std::vector<std::string> InterfaceEnumerator::ReadNeighborCache()
    {
        std::vector<std::string> lines;

        std::ifstream table(m_neighborTablePath);
        if (table.is_open())
        {
            std::string line;
            std::getline(table, line); // header
            while (std::getline(table, line))
            {
                if (!line.empty())
                    lines.push_back(line);
            }
            return lines;
        }

        if (!m_runner)
            return lines;

        common::CommandResult result = m_runner->Run({"arp", "-a"}, std::chrono::seconds(5));
        if (!result.Succeeded())
        {
            if (common::DebugEnabled())
                std::cerr << "[Interfaces] Neighbor cache query failed\n";
            return lines;
        }

        std::istringstream ss(result.output);
        std::string line;
        while (std::getline(ss, line))
        {
            if (!line.empty())
                lines.push_back(line);
        }
        return lines;
    }

    std::vector<common::NetworkInterface> InterfaceEnumerator::ListInterfaces(bool includeDiscovered)
    {
        std::vector<common::NetworkInterface> interfaces = ListPrimaryInterfaces();
        if (!includeDiscovered || interfaces.empty())
            return interfaces;

        std::vector<common::NetworkInterface> additional;
        try
        {
            std::vector<std::string> neighbors = ReadNeighborCache();
            for (const auto &iface : interfaces)
            {
                auto found = InferDiscoveredNetworks(iface, neighbors);
                additional.insert(additional.end(), found.begin(), found.end());
            }
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[Interfaces] Neighbor inspection failed: " << e.what() << "\n";
        }

        if (common::DebugEnabled())
        {
            std::cerr << "[Interfaces] Found " << interfaces.size() << " primary interfaces and "
                      << additional.size() << " discovered networks\n";
        }

        interfaces.insert(interfaces.end(), additional.begin(), additional.end());
        return interfaces;
    }

    HostMachineInfo InterfaceEnumerator::GetHostMachineInfo()
    {
        HostMachineInfo info;

        char name[256] = {0};
        if (gethostname(name, sizeof(name) - 1) == 0)
            info.hostname = name;
        else
            info.hostname = "Unknown";

        for (const auto &iface : ListPrimaryInterfaces())
        {
            bool duplicate = false;
            for (const auto &ip : info.local_ips)
                duplicate = duplicate || ip == iface.ip;
            if (!duplicate)
                info.local_ips.push_back(iface.ip);
        }
        return info;
    }
}
