#include "Device.hpp"

#include <chrono>

namespace netwake::common
{
    bool Device::operator==(const Device &other) const
    {
        return ip == other.ip &&
               hostname == other.hostname &&
               mac == other.mac &&
               vendor == other.vendor &&
               status == other.status &&
               pingable == other.pingable &&
               last_seen == other.last_seen &&
               network_context == other.network_context &&
               historical == other.historical &&
               current_scan == other.current_scan;
    }

    const char *ToString(DeviceStatus status)
    {
        switch (status)
        {
        case DeviceStatus::Online:
            return "online";
        case DeviceStatus::Standby:
            return "standby";
        case DeviceStatus::Offline:
            return "offline";
        case DeviceStatus::Hidden:
            return "hidden";
        }
        return "offline";
    }

    const char *ToString(NetworkContext context)
    {
        switch (context)
        {
        case NetworkContext::Primary:
            return "primary";
        case NetworkContext::DiscoveredOnline:
            return "discovered_online";
        case NetworkContext::DiscoveredOffline:
            return "discovered_offline";
        }
        return "primary";
    }

    DeviceStatus ParseStatus(const std::string &text)
    {
        if (text == "online")
            return DeviceStatus::Online;
        if (text == "standby")
            return DeviceStatus::Standby;
        if (text == "hidden")
            return DeviceStatus::Hidden;
        return DeviceStatus::Offline;
    }

    NetworkContext ParseContext(const std::string &text)
    {
        if (text == "discovered_online")
            return NetworkContext::DiscoveredOnline;
        if (text == "discovered_offline")
            return NetworkContext::DiscoveredOffline;
        return NetworkContext::Primary;
    }

    bool IsReachable(DeviceStatus status)
    {
        return status == DeviceStatus::Online || status == DeviceStatus::Standby;
    }

    std::string LastOctet(const std::string &ip)
    {
        auto pos = ip.find_last_of('.');
        if (pos == std::string::npos)
            return ip;
        return ip.substr(pos + 1);
    }

    bool HasValue(const std::optional<std::string> &field)
    {
        return field.has_value() && !field->empty();
    }

    double NowSeconds()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }
}
