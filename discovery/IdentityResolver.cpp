#include "IdentityResolver.hpp"
#include "AppleOui.hpp"
#include "../common/Debug.hpp"

#include <cstring>
#include <iostream>
#include <sstream>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace netwake::discovery
{
    namespace
    {
        std::string Trim(const std::string &text)
        {
            auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        bool AcceptableHostname(const std::optional<std::string> &hostname, const std::string &ip)
        {
            return hostname && *hostname != ip && hostname->size() > 2;
        }
    }

    std::optional<std::string> SystemReverseLookup(const std::string &ip)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST] = {0};
        int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }

    bool PlatformHasNameTools()
    {
#ifdef __APPLE__
        return true;
#else
        return false;
#endif
    }

    // --- DNS ---

    DnsResolver::DnsResolver(ReverseLookup lookup)
        : m_lookup(std::move(lookup))
    {
    }

    std::optional<std::string> DnsResolver::TryResolve(const std::string &ip)
    {
        if (!m_lookup)
            return std::nullopt;
        auto hostname = m_lookup(ip);
        if (AcceptableHostname(hostname, ip))
            return hostname;
        return std::nullopt;
    }

    // --- NetBIOS ---

    NetbiosResolver::NetbiosResolver(std::shared_ptr<common::CommandRunner> runner, bool enabled)
        : m_runner(std::move(runner)), m_enabled(enabled)
    {
    }

    std::optional<std::string> NetbiosResolver::ParseServerName(const std::string &output, const std::string &ip)
    {
        std::istringstream ss(output);
        std::string line;
        while (std::getline(ss, line))
        {
            if (line.rfind("Server:", 0) != 0)
                continue;
            std::string name = Trim(line.substr(std::strlen("Server:")));
            if (!name.empty() && name != ip)
                return name;
        }
        return std::nullopt;
    }

    std::optional<std::string> NetbiosResolver::TryResolve(const std::string &ip)
    {
        if (!m_enabled || !m_runner)
            return std::nullopt;

        common::CommandResult result = m_runner->Run({"smbutil", "status", ip}, std::chrono::seconds(10));
        if (!result.Succeeded())
            return std::nullopt;

        auto name = ParseServerName(result.output, ip);
        if (name && common::DebugEnabled())
            std::cerr << "[Identity] NetBIOS name for " << ip << ": " << *name << "\n";
        return name;
    }

    // --- mDNS / Bonjour ---

    MdnsResolver::MdnsResolver(std::shared_ptr<common::CommandRunner> runner,
                               ReverseLookup lookup,
                               std::shared_ptr<MacResolver> macResolver,
                               bool enabled)
        : m_runner(std::move(runner)), m_lookup(std::move(lookup)),
          m_macResolver(std::move(macResolver)), m_enabled(enabled)
    {
    }

    std::optional<std::string> MdnsResolver::ParseDeviceInfo(const std::string &output)
    {
        std::istringstream ss(output);
        std::string line;
        while (std::getline(ss, line))
        {
            if (line.find("device-info") == std::string::npos)
                continue;
            auto eq = line.find('=');
            if (eq == std::string::npos)
                continue;

            std::string rest = line.substr(eq + 1);
            std::string name = Trim(rest.substr(0, rest.find('=')));
            if (name.size() > 2)
                return name;
        }
        return std::nullopt;
    }

    bool MdnsResolver::HasLocalSuffix(const std::string &hostname)
    {
        static const char *suffixes[] = {".local", ".home", ".lan", ".home.arpa"};
        for (const char *suffix : suffixes)
        {
            if (hostname.find(suffix) != std::string::npos)
                return true;
        }
        return false;
    }

    std::optional<std::string> MdnsResolver::QueryDeviceInfo(const std::string &ip)
    {
        if (!m_runner)
            return std::nullopt;
        common::CommandResult result = m_runner->Run(
            {"dns-sd", "-G", "v4", ip, "_device-info._tcp", "local."}, std::chrono::seconds(5));
        if (!result.Succeeded() || result.output.empty())
            return std::nullopt;
        return ParseDeviceInfo(result.output);
    }

    std::optional<std::string> MdnsResolver::LocalHostname(const std::string &ip)
    {
        if (!m_lookup)
            return std::nullopt;
        auto hostname = m_lookup(ip);
        if (AcceptableHostname(hostname, ip) && HasLocalSuffix(*hostname))
            return hostname;
        return std::nullopt;
    }

    std::optional<std::string> MdnsResolver::AppleByMac(const std::string &ip)
    {
        if (!m_macResolver)
            return std::nullopt;
        auto mac = m_macResolver->Resolve(ip);
        if (!mac || mac->size() < 8)
            return std::nullopt;
        if (!IsAppleOui(mac->substr(0, 8)))
            return std::nullopt;
        return "Apple-" + common::LastOctet(ip);
    }

    std::optional<std::string> MdnsResolver::TryResolve(const std::string &ip)
    {
        if (!m_enabled)
            return std::nullopt;

        try
        {
            if (auto name = QueryDeviceInfo(ip))
                return name;
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[Identity] dns-sd query failed for " << ip << ": " << e.what() << "\n";
        }

        try
        {
            if (auto name = LocalHostname(ip))
                return name;
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[Identity] Local name lookup failed for " << ip << ": " << e.what() << "\n";
        }

        return AppleByMac(ip);
    }

    // --- Open-port fingerprint ---

    PortFingerprintResolver::PortFingerprintResolver(std::shared_ptr<HostCheck> hosts,
                                                     std::chrono::milliseconds timeout)
        : m_hosts(std::move(hosts)), m_timeout(timeout)
    {
    }

    const std::vector<std::pair<int, std::string>> &PortFingerprintResolver::ServicePorts()
    {
        static const std::vector<std::pair<int, std::string>> services = {
            {22, "SSH"},
            {23, "Telnet"},
            {80, "HTTP"},
            {443, "HTTPS"},
            {3389, "RDP"},
            {5900, "VNC"},
            {8080, "HTTP-Alt"},
            {8443, "HTTPS-Alt"}};
        return services;
    }

    std::optional<std::string> PortFingerprintResolver::TryResolve(const std::string &ip)
    {
        if (!m_hosts)
            return std::nullopt;

        for (const auto &[port, service] : ServicePorts())
        {
            try
            {
                if (m_hosts->IsPortOpen(ip, port, m_timeout))
                    return service + "-" + common::LastOctet(ip);
            }
            catch (const std::exception &e)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Identity] Port " << port << " check failed for " << ip << ": " << e.what() << "\n";
            }
        }
        return std::nullopt;
    }

    // --- MAC vendor ---

    VendorResolver::VendorResolver(std::shared_ptr<MacResolver> macResolver, std::shared_ptr<VendorLookup> vendors)
        : m_macResolver(std::move(macResolver)), m_vendors(std::move(vendors))
    {
    }

    std::optional<std::string> VendorResolver::TryResolve(const std::string &ip)
    {
        if (!m_macResolver || !m_vendors)
            return std::nullopt;

        auto mac = m_macResolver->Resolve(ip);
        if (!mac)
            return std::nullopt;

        std::string vendor = m_vendors->Lookup(*mac);
        if (vendor.empty() || vendor == kUnknownVendor)
            return std::nullopt;
        return vendor + "-" + common::LastOctet(ip);
    }

    // --- Chain ---

    void IdentityResolver::AddStrategy(std::unique_ptr<IdentityStrategy> strategy)
    {
        if (strategy)
            m_strategies.push_back(std::move(strategy));
    }

    std::optional<std::string> IdentityResolver::Resolve(const std::string &ip) const
    {
        for (const auto &strategy : m_strategies)
        {
            try
            {
                auto name = strategy->TryResolve(ip);
                if (name && !name->empty())
                    return name;
            }
            catch (const std::exception &e)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Identity] " << strategy->Name() << " failed for " << ip << ": " << e.what() << "\n";
            }
        }
        return std::nullopt;
    }

    std::string IdentityResolver::ResolveLabel(const std::string &ip) const
    {
        if (auto name = Resolve(ip))
            return *name;
        return "." + common::LastOctet(ip);
    }

    std::unique_ptr<IdentityResolver> CreateDefaultResolver(const IdentityDependencies &deps)
    {
        auto resolver = std::make_unique<IdentityResolver>();
        resolver->AddStrategy(std::make_unique<DnsResolver>(deps.reverseLookup));
        resolver->AddStrategy(std::make_unique<NetbiosResolver>(deps.runner, deps.platformNameTools));
        resolver->AddStrategy(std::make_unique<MdnsResolver>(deps.runner, deps.reverseLookup,
                                                             deps.macResolver, deps.platformNameTools));
        resolver->AddStrategy(std::make_unique<PortFingerprintResolver>(deps.hosts, deps.fingerprintTimeout));
        resolver->AddStrategy(std::make_unique<VendorResolver>(deps.macResolver, deps.vendors));
        return resolver;
    }

    std::string PriorityDisplay(const common::Device &device)
    {
        std::string display = device.ip;
        std::string octet = common::LastOctet(device.ip);

        if (common::HasValue(device.mac))
            display += " [" + *device.mac + "]";

        std::string identifier;
        if (common::HasValue(device.hostname) &&
            *device.hostname != "Device-" + octet &&
            *device.hostname != "Standby-" + octet)
        {
            identifier = *device.hostname;
        }

        if (identifier.empty() && common::HasValue(device.vendor) && *device.vendor != kUnknownVendor)
            identifier = *device.vendor;

        if (identifier.empty())
        {
            if (device.status == common::DeviceStatus::Standby)
                identifier = "Standby-" + octet;
            else if (octet == "1" || octet == "254")
                identifier = "Gateway-" + octet;
            else if (octet == "100" || octet == "101" || octet == "200" || octet == "201")
                identifier = "Server-" + octet;
            else
                identifier = "Device-" + octet;
        }

        return display + " " + identifier;
    }
}
