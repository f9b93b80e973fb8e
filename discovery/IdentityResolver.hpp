#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "HostCheck.hpp"
#include "MacResolver.hpp"
#include "VendorLookup.hpp"
#include "../common/CommandRunner.hpp"
#include "../common/Device.hpp"

namespace netwake::discovery
{
    using ReverseLookup = std::function<std::optional<std::string>(const std::string &ip)>;

    // getnameinfo() with NI_NAMEREQD; nullopt when the address has no PTR record.
    std::optional<std::string> SystemReverseLookup(const std::string &ip);

    class IdentityStrategy
    {
    public:
        virtual ~IdentityStrategy() = default;
        virtual const char *Name() const = 0;
        virtual std::optional<std::string> TryResolve(const std::string &ip) = 0;
    };

    class DnsResolver : public IdentityStrategy
    {
    public:
        explicit DnsResolver(ReverseLookup lookup = SystemReverseLookup);
        const char *Name() const override { return "dns"; }
        std::optional<std::string> TryResolve(const std::string &ip) override;

    private:
        ReverseLookup m_lookup;
    };

    // `smbutil status` answers with a "Server: NAME" line for SMB hosts.
    class NetbiosResolver : public IdentityStrategy
    {
    public:
        NetbiosResolver(std::shared_ptr<common::CommandRunner> runner, bool enabled);
        const char *Name() const override { return "netbios"; }
        std::optional<std::string> TryResolve(const std::string &ip) override;

        static std::optional<std::string> ParseServerName(const std::string &output, const std::string &ip);

    private:
        std::shared_ptr<common::CommandRunner> m_runner;
        bool m_enabled;
    };

    class MdnsResolver : public IdentityStrategy
    {
    public:
        MdnsResolver(std::shared_ptr<common::CommandRunner> runner,
                     ReverseLookup lookup,
                     std::shared_ptr<MacResolver> macResolver,
                     bool enabled);
        const char *Name() const override { return "mdns"; }
        std::optional<std::string> TryResolve(const std::string &ip) override;

        static std::optional<std::string> ParseDeviceInfo(const std::string &output);
        static bool HasLocalSuffix(const std::string &hostname);

    private:
        std::optional<std::string> QueryDeviceInfo(const std::string &ip);
        std::optional<std::string> LocalHostname(const std::string &ip);
        std::optional<std::string> AppleByMac(const std::string &ip);

        std::shared_ptr<common::CommandRunner> m_runner;
        ReverseLookup m_lookup;
        std::shared_ptr<MacResolver> m_macResolver;
        bool m_enabled;
    };

    class PortFingerprintResolver : public IdentityStrategy
    {
    public:
        PortFingerprintResolver(std::shared_ptr<HostCheck> hosts, std::chrono::milliseconds timeout);
        const char *Name() const override { return "ports"; }
        std::optional<std::string> TryResolve(const std::string &ip) override;

        static const std::vector<std::pair<int, std::string>> &ServicePorts();

    private:
        std::shared_ptr<HostCheck> m_hosts;
        std::chrono::milliseconds m_timeout;
    };

    class VendorResolver : public IdentityStrategy
    {
    public:
        VendorResolver(std::shared_ptr<MacResolver> macResolver, std::shared_ptr<VendorLookup> vendors);
        const char *Name() const override { return "vendor"; }
        std::optional<std::string> TryResolve(const std::string &ip) override;

    private:
        std::shared_ptr<MacResolver> m_macResolver;
        std::shared_ptr<VendorLookup> m_vendors;
    };

    // Ordered fallback chain: the first strategy that yields a name wins. A strategy
    // that throws counts as "no result" and the chain moves on.
    class IdentityResolver
    {
    public:
        void AddStrategy(std::unique_ptr<IdentityStrategy> strategy);

        std::optional<std::string> Resolve(const std::string &ip) const;

        // Resolve() or ".{lastOctet}".
        std::string ResolveLabel(const std::string &ip) const;

        size_t StrategyCount() const { return m_strategies.size(); }

    private:
        std::vector<std::unique_ptr<IdentityStrategy>> m_strategies;
    };

    struct IdentityDependencies
    {
        std::shared_ptr<common::CommandRunner> runner;
        std::shared_ptr<HostCheck> hosts;
        std::shared_ptr<MacResolver> macResolver;
        std::shared_ptr<VendorLookup> vendors;
        ReverseLookup reverseLookup = SystemReverseLookup;
        std::chrono::milliseconds fingerprintTimeout{500};
        bool platformNameTools = false;
    };

    // DNS, NetBIOS, mDNS, port fingerprint, vendor, in that order.
    std::unique_ptr<IdentityResolver> CreateDefaultResolver(const IdentityDependencies &deps);

    bool PlatformHasNameTools();

    // "ip [MAC] identifier" with hostname > vendor > generic label precedence.
    std::string PriorityDisplay(const common::Device &device);
}
