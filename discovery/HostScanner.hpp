#pragma once

#include <memory>
#include <string>
#include "IdentityResolver.hpp"
#include "MacResolver.hpp"
#include "StatusClassifier.hpp"
#include "VendorLookup.hpp"
#include "../common/Device.hpp"

namespace netwake::discovery
{
    // Full per-host pass: status, then identity, MAC and vendor for reachable hosts.
    // Stored values fill whatever the scan could not rediscover.
    class HostScanner
    {
    public:
        HostScanner(std::shared_ptr<StatusClassifier> classifier,
                    std::shared_ptr<IdentityResolver> identity,
                    std::shared_ptr<MacResolver> macResolver,
                    std::shared_ptr<VendorLookup> vendors);

        common::Device ScanHost(const std::string &ip, const common::Device *known) const;

    private:
        std::shared_ptr<StatusClassifier> m_classifier;
        std::shared_ptr<IdentityResolver> m_identity;
        std::shared_ptr<MacResolver> m_macResolver;
        std::shared_ptr<VendorLookup> m_vendors;
    };
}
