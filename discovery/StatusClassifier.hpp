#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "HostCheck.hpp"
#include "../common/Device.hpp"

namespace netwake::discovery
{
    class StatusClassifier
    {
    public:
        StatusClassifier(std::shared_ptr<HostCheck> hosts, std::chrono::milliseconds portTimeout);

        // Ping first, then the standby ports in order. A silent host is Offline only
        // when `previouslyRecorded`; a never-seen silent host is Hidden.
        common::DeviceStatus Classify(const std::string &ip, bool previouslyRecorded) const;

        static const std::vector<int> &StandbyPorts();

    private:
        bool AnswersOnStandbyPort(const std::string &ip) const;

        std::shared_ptr<HostCheck> m_hosts;
        std::chrono::milliseconds m_portTimeout;
    };
}
