#include "HostScanner.hpp"
#include "../common/Debug.hpp"

#include <iostream>

namespace netwake::discovery
{
    HostScanner::HostScanner(std::shared_ptr<StatusClassifier> classifier,
                             std::shared_ptr<IdentityResolver> identity,
                             std::shared_ptr<MacResolver> macResolver,
                             std::shared_ptr<VendorLookup> vendors)
        : m_classifier(std::move(classifier)), m_identity(std::move(identity)),
          m_macResolver(std::move(macResolver)), m_vendors(std::move(vendors))
    {
    }

    common::Device HostScanner::ScanHost(const std::string &ip, const common::Device *known) const
    {
        common::Device device;
        device.ip = ip;
        device.current_scan = true;
        device.status = m_classifier->Classify(ip, known != nullptr);

        if (device.status == common::DeviceStatus::Hidden)
            return device;

        if (!common::IsReachable(device.status))
        {
            // Recorded before, silent now: carry the stored identity forward.
            device.hostname = known->hostname;
            device.mac = known->mac;
            device.vendor = known->vendor;
            device.last_seen = known->last_seen;
            device.pingable = false;
            return device;
        }

        device.pingable = device.status == common::DeviceStatus::Online;
        device.last_seen = common::NowSeconds();

        std::optional<std::string> name;
        if (m_identity)
            name = m_identity->Resolve(ip);
        if (name)
            device.hostname = name;
        else if (known && common::HasValue(known->hostname))
            device.hostname = known->hostname;
        else
            device.hostname = "." + common::LastOctet(ip);

        std::optional<std::string> mac;
        if (m_macResolver)
            mac = m_macResolver->Resolve(ip);
        if (mac)
            device.mac = mac;
        else if (known)
            device.mac = known->mac;

        if (common::HasValue(device.mac) && m_vendors)
        {
            std::string vendor = m_vendors->Lookup(*device.mac);
            if (vendor != kUnknownVendor)
                device.vendor = vendor;
        }
        if (!common::HasValue(device.vendor) && known)
            device.vendor = known->vendor;

        if (common::DebugEnabled())
        {
            std::cerr << "[Scanner] " << ip << " " << common::ToString(device.status)
                      << " " << device.hostname.value_or("") << "\n";
        }
        return device;
    }
}
