#include "DeviceMerge.hpp"
#include "Ipv4.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace netwake::discovery
{
    namespace
    {
        std::string SlashTwentyFour(const std::string &ip)
        {
            auto address = ParseAddress(ip);
            if (!address)
                return ip;
            Cidr cidr;
            cidr.prefix = 24;
            cidr.mask = MaskFromPrefix(24);
            cidr.network = *address & cidr.mask;
            return FormatCidr(cidr);
        }

        NetworkGroup &GroupFor(std::vector<NetworkGroup> &groups, const std::string &key)
        {
            for (auto &group : groups)
            {
                if (group.key == key)
                    return group;
            }
            groups.push_back(NetworkGroup{key, {}});
            return groups.back();
        }

        void ApplyContext(common::Device &device, const std::string &key, const InterfaceContext &context)
        {
            if (!context.active)
                return;

            if (key == context.subnet)
            {
                device.network_context = common::NetworkContext::Primary;
            }
            else if (device.pingable)
            {
                device.network_context = common::NetworkContext::DiscoveredOnline;
            }
            else
            {
                device.status = common::DeviceStatus::Offline;
                device.network_context = common::NetworkContext::DiscoveredOffline;
            }
        }
    }

    std::string ResolveNetworkKey(const std::string &ip,
                                  const std::string &interfaceSubnet,
                                  const std::vector<std::string> &networkKeys)
    {
        for (const auto &key : networkKeys)
        {
            if (CidrContains(key, ip))
                return key;
        }
        if (interfaceSubnet.empty())
            return SlashTwentyFour(ip);
        return interfaceSubnet;
    }

    common::Device MergeDevice(const common::Device &persisted, const common::Device &fresh)
    {
        common::Device merged = fresh;
        if (!common::HasValue(merged.hostname) && common::HasValue(persisted.hostname))
            merged.hostname = persisted.hostname;
        if (!common::HasValue(merged.mac) && common::HasValue(persisted.mac))
            merged.mac = persisted.mac;
        if (!common::HasValue(merged.vendor) && common::HasValue(persisted.vendor))
            merged.vendor = persisted.vendor;
        merged.last_seen = std::max(persisted.last_seen, fresh.last_seen);
        return merged;
    }

    std::vector<NetworkGroup> MergeInterface(const InterfaceContext &context,
                                             const std::vector<common::Device> &persisted,
                                             const std::vector<common::Device> &fresh,
                                             const std::vector<std::string> &networkKeys)
    {
        const std::string subnet = context.active ? context.subnet : std::string();

        std::unordered_map<std::string, const common::Device *> persistedByIp;
        for (const auto &device : persisted)
        {
            if (!device.ip.empty())
                persistedByIp.emplace(device.ip, &device);
        }

        std::vector<NetworkGroup> groups;
        std::set<std::string> seen;

        for (const auto &device : fresh)
        {
            if (device.ip.empty() || device.status == common::DeviceStatus::Hidden)
                continue;
            if (!seen.insert(device.ip).second)
                continue;

            common::Device merged = device;
            auto stored = persistedByIp.find(device.ip);
            if (stored != persistedByIp.end())
                merged = MergeDevice(*stored->second, device);

            merged.current_scan = true;
            merged.historical = false;

            const std::string key = ResolveNetworkKey(merged.ip, subnet, networkKeys);
            ApplyContext(merged, key, context);
            GroupFor(groups, key).devices.push_back(merged);
        }

        for (const auto &device : persisted)
        {
            if (device.ip.empty() || device.status == common::DeviceStatus::Hidden)
                continue;
            if (!seen.insert(device.ip).second)
                continue;

            common::Device offline = device;
            offline.status = common::DeviceStatus::Offline;
            offline.pingable = false;
            offline.current_scan = false;
            offline.historical = !context.active;

            const std::string key = ResolveNetworkKey(offline.ip, subnet, networkKeys);
            ApplyContext(offline, key, context);
            GroupFor(groups, key).devices.push_back(offline);
        }

        return groups;
    }

    std::vector<InterfaceView> MergeAll(const std::vector<common::NetworkInterface> &interfaces,
                                        const common::KnownDeviceStore &fresh,
                                        const common::KnownDeviceStore &store,
                                        const std::vector<std::string> &networkKeys)
    {
        std::vector<InterfaceContext> active;
        for (const auto &iface : interfaces)
        {
            auto existing = std::find_if(active.begin(), active.end(),
                                         [&](const InterfaceContext &c) { return c.name == iface.name; });
            if (existing == active.end())
            {
                active.push_back(InterfaceContext{iface.name, iface.subnet, true});
            }
            else if (!iface.discovered && existing->subnet.empty())
            {
                existing->subnet = iface.subnet;
            }
        }

        static const std::vector<common::Device> kNone;
        auto lookup = [](const common::KnownDeviceStore &map, const std::string &name) -> const std::vector<common::Device> &
        {
            auto it = map.find(name);
            return it == map.end() ? kNone : it->second;
        };

        std::vector<InterfaceView> views;
        for (const auto &context : active)
        {
            InterfaceView view;
            view.name = context.name;
            view.networks = MergeInterface(context, lookup(store, context.name), lookup(fresh, context.name), networkKeys);
            views.push_back(std::move(view));
        }

        for (const auto &[name, devices] : store)
        {
            bool isActive = std::any_of(active.begin(), active.end(),
                                        [&](const InterfaceContext &c) { return c.name == name; });
            if (isActive)
                continue;

            InterfaceView view;
            view.name = name;
            view.historical = true;
            view.networks = MergeInterface(InterfaceContext{name, "", false}, devices, {}, networkKeys);
            views.push_back(std::move(view));
        }

        return views;
    }

    std::vector<common::Device> Flatten(const std::vector<NetworkGroup> &groups)
    {
        std::vector<common::Device> devices;
        for (const auto &group : groups)
            devices.insert(devices.end(), group.devices.begin(), group.devices.end());
        return devices;
    }

    size_t AddMissingDevices(common::KnownDeviceStore &store, const common::KnownDeviceStore &incoming)
    {
        size_t added = 0;
        for (const auto &[name, devices] : incoming)
        {
            std::vector<common::Device> &target = store[name];
            std::set<std::string> known;
            for (const auto &device : target)
                known.insert(device.ip);

            for (const auto &device : devices)
            {
                if (device.status == common::DeviceStatus::Hidden || !ParseAddress(device.ip))
                    continue;
                if (!known.insert(device.ip).second)
                    continue;

                common::Device copy = device;
                copy.current_scan = false;
                target.push_back(std::move(copy));
                ++added;
            }

            if (target.empty())
                store.erase(name);
        }
        return added;
    }
}
