#include "DiscoveryState.hpp"
#include "../common/Debug.hpp"

#include <algorithm>
#include <iostream>

namespace netwake::discovery
{
    namespace
    {
        constexpr int kMaxSaveAttempts = 3;
    }

    DiscoveryState::DiscoveryState(std::shared_ptr<storage::DeviceStorage> storage,
                                   StateRole role,
                                   std::vector<std::string> networkKeys,
                                   std::shared_ptr<VendorLookup> vendors)
        : m_storage(std::move(storage)), m_role(role),
          m_baseKeys(std::move(networkKeys)), m_vendors(std::move(vendors))
    {
    }

    size_t DiscoveryState::Load()
    {
        common::KnownDeviceStore loaded;
        uint64_t revision = 0;
        if (m_storage)
        {
            // Revision first: a save landing in between only costs a reload later.
            revision = m_storage->Revision();
            loaded = m_storage->Load();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_known = std::move(loaded);
        m_fresh.clear();
        m_revision = revision;

        if (common::DebugEnabled())
        {
            size_t devices = 0;
            for (const auto &[name, list] : m_known)
                devices += list.size();
            std::cerr << "[State] Loaded " << devices << " devices on " << m_known.size() << " interfaces\n";
        }
        return m_known.size();
    }

    std::vector<common::Device> DiscoveryState::KnownDevices(const std::string &interfaceName) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_known.find(interfaceName);
        if (it == m_known.end())
            return {};

        std::vector<common::Device> devices = it->second;
        for (auto &device : devices)
            device.current_scan = false;
        return devices;
    }

    common::KnownDeviceStore DiscoveryState::Snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_known;
    }

    void DiscoveryState::RecordInterfaces(const std::vector<common::NetworkInterface> &interfaces)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interfaces = interfaces;
    }

    std::string DiscoveryState::PrimarySubnetLocked(const std::string &interfaceName) const
    {
        std::string fallback;
        for (const auto &iface : m_interfaces)
        {
            if (iface.name != interfaceName)
                continue;
            if (!iface.discovered)
                return iface.subnet;
            if (fallback.empty())
                fallback = iface.subnet;
        }
        return fallback;
    }

    std::vector<std::string> DiscoveryState::NetworkKeysLocked() const
    {
        std::vector<std::string> keys = m_baseKeys;
        for (const auto &iface : m_interfaces)
        {
            if (iface.discovered && std::find(keys.begin(), keys.end(), iface.subnet) == keys.end())
                keys.push_back(iface.subnet);
        }
        return keys;
    }

    std::vector<std::string> DiscoveryState::NetworkKeys() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return NetworkKeysLocked();
    }

    std::vector<common::Device> DiscoveryState::MergeScanLocked(const std::string &interfaceName,
                                                                const std::vector<common::Device> &persisted,
                                                                const std::vector<common::Device> &fresh) const
    {
        InterfaceContext context{interfaceName, PrimarySubnetLocked(interfaceName), true};
        std::vector<common::Device> merged = Flatten(MergeInterface(context, persisted, fresh, NetworkKeysLocked()));

        if (m_vendors)
        {
            for (auto &device : merged)
            {
                if (common::HasValue(device.vendor) || !common::HasValue(device.mac))
                    continue;
                std::string vendor = m_vendors->Lookup(*device.mac);
                if (vendor != kUnknownVendor)
                    device.vendor = vendor;
            }
        }
        return merged;
    }

    void DiscoveryState::RecordScan(const std::string &interfaceName, const std::vector<common::Device> &devices)
    {
        std::vector<common::Device> fresh;
        for (const auto &device : devices)
        {
            if (device.current_scan && device.status != common::DeviceStatus::Hidden)
                fresh.push_back(device);
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        auto existing = m_known.find(interfaceName);
        const std::vector<common::Device> persisted =
            existing == m_known.end() ? std::vector<common::Device>() : existing->second;

        m_known[interfaceName] = MergeScanLocked(interfaceName, persisted, fresh);
        m_fresh[interfaceName] = std::move(fresh);
    }

    bool DiscoveryState::CanWrite(const char *action) const
    {
        if (m_role == StateRole::Owner && m_storage && m_storage->IsWritable())
            return true;
        if (common::DebugEnabled())
            std::cerr << "[State] Not " << action << ": this process does not own the store\n";
        return false;
    }

    void DiscoveryState::ReloadAndReplay()
    {
        uint64_t revision = m_storage->Revision();
        common::KnownDeviceStore stored = m_storage->Load();

        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[name, fresh] : m_fresh)
        {
            auto existing = stored.find(name);
            const std::vector<common::Device> persisted =
                existing == stored.end() ? std::vector<common::Device>() : existing->second;
            stored[name] = MergeScanLocked(name, persisted, fresh);
        }
        m_known = std::move(stored);
        m_revision = revision;
    }

    bool DiscoveryState::Persist()
    {
        if (!CanWrite("persisting"))
            return false;

        for (int attempt = 0; attempt < kMaxSaveAttempts; ++attempt)
        {
            common::KnownDeviceStore snapshot;
            uint64_t expected = 0;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                snapshot = m_known;
                expected = m_revision;
            }

            switch (m_storage->SaveIfRevision(snapshot, expected))
            {
            case storage::SaveResult::Saved:
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_revision == expected)
                    m_revision = expected + 1;
                return true;
            }
            case storage::SaveResult::Failed:
                return false;
            case storage::SaveResult::Conflict:
                std::cerr << "[State] Device history was changed by another process; reloading it\n";
                ReloadAndReplay();
                break;
            }
        }

        std::cerr << "[State] Gave up saving after " << kMaxSaveAttempts << " conflicting writes\n";
        return false;
    }

    bool DiscoveryState::ClearHistory()
    {
        if (!CanWrite("clearing history"))
        {
            std::cerr << "[State] Clearing history requires a writable store\n";
            return false;
        }

        for (int attempt = 0; attempt < kMaxSaveAttempts; ++attempt)
        {
            uint64_t expected = m_storage->Revision();
            storage::SaveResult result = m_storage->SaveIfRevision({}, expected);
            if (result == storage::SaveResult::Failed)
                return false;
            if (result == storage::SaveResult::Saved)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_known.clear();
                m_fresh.clear();
                m_revision = expected + 1;
                return true;
            }
        }
        return false;
    }

    std::optional<size_t> DiscoveryState::Import(const common::KnownDeviceStore &imported)
    {
        if (!CanWrite("importing"))
        {
            std::cerr << "[State] Importing requires a writable store\n";
            return std::nullopt;
        }

        for (int attempt = 0; attempt < kMaxSaveAttempts; ++attempt)
        {
            uint64_t expected = m_storage->Revision();
            common::KnownDeviceStore stored = m_storage->Load();
            size_t added = AddMissingDevices(stored, imported);

            storage::SaveResult result = m_storage->SaveIfRevision(stored, expected);
            if (result == storage::SaveResult::Failed)
                return std::nullopt;
            if (result == storage::SaveResult::Saved)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_known = std::move(stored);
                m_revision = expected + 1;
                return added;
            }
        }
        return std::nullopt;
    }

    std::vector<InterfaceView> DiscoveryState::BuildView() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return MergeAll(m_interfaces, m_fresh, m_known, NetworkKeysLocked());
    }
}
