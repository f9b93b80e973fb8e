#include "StatusClassifier.hpp"
#include "../common/Debug.hpp"

#include <iostream>

namespace netwake::discovery
{
    StatusClassifier::StatusClassifier(std::shared_ptr<HostCheck> hosts, std::chrono::milliseconds portTimeout)
        : m_hosts(std::move(hosts)), m_portTimeout(portTimeout)
    {
    }

    const std::vector<int> &StatusClassifier::StandbyPorts()
    {
        // HTTP, HTTPS, SSH, Telnet, RDP, VNC
        static const std::vector<int> ports = {80, 443, 22, 23, 3389, 5900};
        return ports;
    }

    bool StatusClassifier::AnswersOnStandbyPort(const std::string &ip) const
    {
        for (int port : StandbyPorts())
        {
            try
            {
                if (m_hosts->IsPortOpen(ip, port, m_portTimeout))
                    return true;
            }
            catch (const std::exception &e)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Status] Port " << port << " check failed for " << ip << ": " << e.what() << "\n";
            }
        }
        return false;
    }

    common::DeviceStatus StatusClassifier::Classify(const std::string &ip, bool previouslyRecorded) const
    {
        if (m_hosts)
        {
            bool pingable = false;
            try
            {
                pingable = m_hosts->Ping(ip);
            }
            catch (const std::exception &e)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Status] Ping failed for " << ip << ": " << e.what() << "\n";
                pingable = false;
            }

            if (pingable)
                return common::DeviceStatus::Online;
            if (AnswersOnStandbyPort(ip))
                return common::DeviceStatus::Standby;
        }

        return previouslyRecorded ? common::DeviceStatus::Offline : common::DeviceStatus::Hidden;
    }
}
