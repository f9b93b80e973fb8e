#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netwake::common
{
    enum class DeviceStatus
    {
        Online,
        Standby,
        Offline,
        Hidden
    };

    enum class NetworkContext
    {
        Primary,
        DiscoveredOnline,
        DiscoveredOffline
    };

    struct NetworkInterface
    {
        std::string name;
        std::string ip;
        std::string netmask;
        std::string network;
        std::string broadcast;
        std::string subnet;
        bool discovered = false;
    };

    struct Device
    {
        std::string ip;
        std::optional<std::string> hostname;
        std::optional<std::string> mac;
        std::optional<std::string> vendor;
        DeviceStatus status = DeviceStatus::Offline;
        bool pingable = false;
        double last_seen = 0.0;
        NetworkContext network_context = NetworkContext::Primary;
        bool historical = false;
        bool current_scan = true;

        bool operator==(const Device &other) const;
        bool operator!=(const Device &other) const { return !(*this == other); }
    };

    // Interface name -> devices in first-seen order.
    using KnownDeviceStore = std::map<std::string, std::vector<Device>>;

    const char *ToString(DeviceStatus status);
    const char *ToString(NetworkContext context);
    DeviceStatus ParseStatus(const std::string &text);
    NetworkContext ParseContext(const std::string &text);

    bool IsReachable(DeviceStatus status);

    // "192.168.0.23" -> "23". Returns the input unchanged if it has no dot.
    std::string LastOctet(const std::string &ip);

    // Empty optionals and empty strings both count as "no value".
    bool HasValue(const std::optional<std::string> &field);

    double NowSeconds();
}
