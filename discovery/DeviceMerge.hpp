#pragma once

#include <string>
#include <vector>
#include "../common/Device.hpp"

namespace netwake::discovery
{
    struct InterfaceContext
    {
        std::string name;
        std::string subnet; // primary subnet of the interface, empty when unknown
        bool active = true;
    };

    struct NetworkGroup
    {
        std::string key;
        std::vector<common::Device> devices;
    };

    struct InterfaceView
    {
        std::string name;
        bool historical = false;
        std::vector<NetworkGroup> networks;
    };

    // First key whose network contains `ip`, else the interface subnet. An empty
    // interface subnet falls back to the /24 around the address.
    std::string ResolveNetworkKey(const std::string &ip,
                                  const std::string &interfaceSubnet,
                                  const std::vector<std::string> &networkKeys);

    // Fresh record with hostname, MAC and vendor filled from `persisted` where the
    // fresh scan came back empty. last_seen is the later of the two.
    common::Device MergeDevice(const common::Device &persisted, const common::Device &fresh);

    std::vector<NetworkGroup> MergeInterface(const InterfaceContext &context,
                                             const std::vector<common::Device> &persisted,
                                             const std::vector<common::Device> &fresh,
                                             const std::vector<std::string> &networkKeys);

    // Active interfaces in enumeration order (entries sharing a name are folded into
    // one view), then every stored interface that is no longer present.
    std::vector<InterfaceView> MergeAll(const std::vector<common::NetworkInterface> &interfaces,
                                        const common::KnownDeviceStore &fresh,
                                        const common::KnownDeviceStore &store,
                                        const std::vector<std::string> &networkKeys);

    // Flattens groups back to one device list, as stored per interface.
    std::vector<common::Device> Flatten(const std::vector<NetworkGroup> &groups);

    // Appends every incoming device whose IP is not yet known on its interface.
    // Existing records win; hidden entries and malformed addresses are skipped.
    // Returns the number of devices added.
    size_t AddMissingDevices(common::KnownDeviceStore &store, const common::KnownDeviceStore &incoming);
}
