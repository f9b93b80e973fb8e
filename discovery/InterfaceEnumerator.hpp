#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../common/CommandRunner.hpp"
#include "../common/Device.hpp"

namespace netwake::discovery
{
    struct NetworkSummary
    {
        std::string interface_name;
        std::string range;
        uint64_t address_count = 0;
        std::string host_ip;
    };

    struct HostMachineInfo
    {
        std::string hostname;
        std::vector<std::string> local_ips;
    };

    // Fills network/broadcast/subnet from an address and netmask.
    std::optional<common::NetworkInterface> ComputeSubnet(const std::string &name,
                                                          const std::string &ip,
                                                          const std::string &netmask);

    // Neighbor-cache lines mentioning `primary.name` whose addresses fall outside its
    // subnet each imply the surrounding /24, reachable through that interface.
    std::vector<common::NetworkInterface> InferDiscoveredNetworks(const common::NetworkInterface &primary,
                                                                  const std::vector<std::string> &neighborLines);

    std::string FormatNetworkRange(const std::string &subnet);

    std::vector<NetworkSummary> SummarizeNetworks(const std::vector<common::NetworkInterface> &interfaces,
                                                  uint64_t &totalAddresses);

    class InterfaceEnumerator
    {
    public:
        explicit InterfaceEnumerator(std::shared_ptr<common::CommandRunner> runner,
                                     std::string neighborTablePath = "/proc/net/arp");

        // Never throws; returns whatever could be enumerated.
        std::vector<common::NetworkInterface> ListInterfaces(bool includeDiscovered = true);

        std::vector<std::string> ReadNeighborCache();

        HostMachineInfo GetHostMachineInfo();

    private:
        std::vector<common::NetworkInterface> ListPrimaryInterfaces();

        std::shared_ptr<common::CommandRunner> m_runner;
        std::string m_neighborTablePath;
    };
}
