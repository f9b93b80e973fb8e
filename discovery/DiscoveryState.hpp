#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "DeviceMerge.hpp"
#include "VendorLookup.hpp"
#include "../common/Device.hpp"
#include "../storage/DeviceStorage.hpp"

namespace netwake::discovery
{
    // Only an Owner writes to storage. Every write is checked against the store
    // revision, so history edited by another process (a clear, an import) is
    // picked up instead of overwritten.
    enum class StateRole
    {
        Owner,
        ReadOnly
    };

    // Known devices, the latest interface table and the latest scan results, shared
    // between the scan loop and whoever presents them.
    class DiscoveryState
    {
    public:
        DiscoveryState(std::shared_ptr<storage::DeviceStorage> storage,
                       StateRole role,
                       std::vector<std::string> networkKeys,
                       std::shared_ptr<VendorLookup> vendors = nullptr);

        // Replaces the in-memory history with the stored one. Returns the number of
        // interfaces loaded; storage failures leave the history empty.
        size_t Load();

        // Stored devices for one interface, flagged as not seen in the current scan.
        std::vector<common::Device> KnownDevices(const std::string &interfaceName) const;
        common::KnownDeviceStore Snapshot() const;

        void RecordInterfaces(const std::vector<common::NetworkInterface> &interfaces);

        // Merges one interface's scan output into history. Entries the scan did not
        // reach (current_scan == false) only contribute as history.
        void RecordScan(const std::string &interfaceName, const std::vector<common::Device> &devices);

        // Saves the history. If another process changed the store since it was
        // read, the stored history is reloaded and the latest scan results are
        // merged over it before saving again.
        bool Persist();

        bool ClearHistory();

        // Adds the imported devices whose IP is not yet known on their interface.
        // Works on the stored history; returns the number added, nullopt on failure.
        std::optional<size_t> Import(const common::KnownDeviceStore &imported);

        // Configured keys followed by the subnets discovered in the latest cycle.
        std::vector<std::string> NetworkKeys() const;

        std::vector<InterfaceView> BuildView() const;

        StateRole Role() const { return m_role; }

    private:
        std::string PrimarySubnetLocked(const std::string &interfaceName) const;
        std::vector<std::string> NetworkKeysLocked() const;
        std::vector<common::Device> MergeScanLocked(const std::string &interfaceName,
                                                    const std::vector<common::Device> &persisted,
                                                    const std::vector<common::Device> &fresh) const;
        bool CanWrite(const char *action) const;
        void ReloadAndReplay();

        std::shared_ptr<storage::DeviceStorage> m_storage;
        StateRole m_role;
        std::vector<std::string> m_baseKeys;
        std::shared_ptr<VendorLookup> m_vendors;

        mutable std::mutex m_mutex;
        common::KnownDeviceStore m_known;
        common::KnownDeviceStore m_fresh;
        std::vector<common::NetworkInterface> m_interfaces;
        uint64_t m_revision = 0;
    };
}
