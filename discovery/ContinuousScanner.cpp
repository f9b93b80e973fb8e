#include "ContinuousScanner.hpp"
#include "../common/Debug.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace netwake::discovery
{
    std::vector<std::pair<std::string, std::vector<common::NetworkInterface>>>
    GroupByInterface(const std::vector<common::NetworkInterface> &interfaces)
    {
        std::vector<std::pair<std::string, std::vector<common::NetworkInterface>>> groups;
        for (const auto &iface : interfaces)
        {
            auto group = std::find_if(groups.begin(), groups.end(),
                                      [&](const auto &g) { return g.first == iface.name; });
            if (group == groups.end())
            {
                groups.push_back({iface.name, {iface}});
            }
            else if (!iface.discovered)
            {
                group->second.insert(group->second.begin(), iface);
            }
            else
            {
                group->second.push_back(iface);
            }
        }
        return groups;
    }

    ContinuousScanner::ContinuousScanner(InterfaceSource interfaces,
                                         std::shared_ptr<DiscoveryState> state,
                                         std::shared_ptr<ScanScheduler> scheduler,
                                         CycleTiming timing)
        : m_interfaces(std::move(interfaces)), m_state(std::move(state)),
          m_scheduler(std::move(scheduler)), m_timing(timing),
          m_running(false), m_cancel(false), m_cycles(0), m_stopping(false)
    {
    }

    ContinuousScanner::~ContinuousScanner()
    {
        Stop();
    }

    void ContinuousScanner::Start()
    {
        if (m_running)
            return;
        {
            std::lock_guard<std::mutex> lock(m_cancelMutex);
            m_stopping = false;
            m_cancel = false;
        }
        m_running = true;
        m_thread = std::thread(&ContinuousScanner::ScanLoop, this);
    }

    void ContinuousScanner::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_cancelMutex);
            m_stopping = true;
            m_cancel = true;
        }
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    void ContinuousScanner::WaitFor(std::chrono::milliseconds duration)
    {
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (m_running && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void ContinuousScanner::Cancel()
    {
        std::lock_guard<std::mutex> lock(m_cancelMutex);
        m_cancel = true;
    }

    void ContinuousScanner::ResetCancel()
    {
        std::lock_guard<std::mutex> lock(m_cancelMutex);
        m_cancel = m_stopping;
    }

    bool ContinuousScanner::RunCycle()
    {
        bool completed = false;
        try
        {
            completed = ScanAll();
        }
        catch (const std::exception &)
        {
            ResetCancel();
            throw;
        }
        ResetCancel();
        return completed;
    }

    bool ContinuousScanner::ScanAll()
    {
        if (!m_interfaces)
            throw std::logic_error("ContinuousScanner has no interface source");

        std::vector<common::NetworkInterface> interfaces = m_interfaces();
        m_state->RecordInterfaces(interfaces);

        if (interfaces.empty())
            std::cerr << "[Scanner] No usable IPv4 interfaces found\n";

        for (const auto &[name, subnets] : GroupByInterface(interfaces))
        {
            if (m_cancel)
                return false;

            std::vector<common::Device> devices = m_state->KnownDevices(name);
            for (const auto &iface : subnets)
            {
                if (m_cancel)
                    break;
                devices = m_scheduler->ScanSubnet(iface, devices, m_cancel);
            }

            // Partial results from a cancelled scan still count.
            m_state->RecordScan(name, devices);
        }

        if (m_cancel)
            return false;

        if (m_state->Role() == StateRole::Owner && !m_state->Persist())
            std::cerr << "[Scanner] Failed to persist known devices\n";

        ++m_cycles;
        if (m_cycleCallback)
            m_cycleCallback(m_cycles);
        return true;
    }

    void ContinuousScanner::ScanLoop()
    {
        if (common::DebugEnabled())
            std::cerr << "[Scanner] Continuous scanning started\n";

        bool first = true;
        while (m_running)
        {
            try
            {
                RunCycle();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Scanner] Scan cycle failed: " << e.what() << "\n";
                WaitFor(m_timing.error_backoff);
                continue;
            }

            WaitFor(first ? m_timing.first_cycle_delay : m_timing.cycle_interval);
            first = false;
        }

        if (common::DebugEnabled())
            std::cerr << "[Scanner] Continuous scanning stopped\n";
    }
}
