#include "ScanScheduler.hpp"
#include "Ipv4.hpp"
#include "WorkerPool.hpp"
#include "../common/Debug.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace netwake::discovery
{
    namespace
    {
        struct ScanSlot
        {
            std::optional<common::Device> device;
            bool finished = false;
            bool abandoned = false;
        };
    }

    ScanScheduler::ScanScheduler(ScheduleOptions options, ScanFunction scan)
        : m_options(options), m_scan(std::move(scan))
    {
        if (m_options.chunk_size == 0)
            m_options.chunk_size = 1;
        if (m_options.workers == 0)
            m_options.workers = 1;
    }

    void ScanScheduler::DeliverLive(const common::Device &device, const std::string &interfaceName)
    {
        if (m_options.mode != DeliveryMode::Live || !m_liveCallback)
            return;
        try
        {
            m_liveCallback(device, interfaceName);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] Live callback failed for " << device.ip << ": " << e.what() << "\n";
        }
    }

    void ScanScheduler::ReportProgress(size_t completed, size_t total, const std::string &interfaceName)
    {
        if (!m_progressCallback)
            return;
        try
        {
            m_progressCallback(completed, total, interfaceName);
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[Scanner] Progress callback failed: " << e.what() << "\n";
        }
    }

    std::vector<common::Device> ScanScheduler::ScanSubnet(const common::NetworkInterface &iface,
                                                          const std::vector<common::Device> &known,
                                                          const std::atomic<bool> &cancel)
    {
        std::vector<common::Device> devices = known;
        std::unordered_map<std::string, size_t> position;
        std::unordered_map<std::string, const common::Device *> knownByIp;
        for (size_t i = 0; i < known.size(); ++i)
        {
            position.emplace(known[i].ip, i);
            knownByIp.emplace(known[i].ip, &known[i]);
        }

        auto cidr = ParseCidr(iface.subnet);
        if (!cidr || !m_scan)
        {
            std::cerr << "[Scanner] Cannot scan " << iface.name << ": invalid subnet '" << iface.subnet << "'\n";
            return devices;
        }

        const HostRange range = HostsOf(*cidr);
        const uint64_t total = range.Count();
        const uint64_t chunk_size = m_options.chunk_size;
        std::atomic<size_t> completed{0};

        if (common::DebugEnabled())
        {
            std::cerr << "[Scanner] " << iface.name << " " << iface.subnet << ": " << total
                      << " hosts, " << m_options.workers << " workers per chunk of " << chunk_size << "\n";
        }

        for (uint64_t offset = 0; offset < total; offset += chunk_size)
        {
            if (cancel)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Scanner] Cancelled before chunk at offset " << offset << "\n";
                break;
            }

            const size_t count = static_cast<size_t>(std::min<uint64_t>(chunk_size, total - offset));
            std::vector<ScanSlot> slots(count);
            std::mutex slot_mutex;
            std::vector<std::future<void>> futures;
            futures.reserve(count);

            {
                WorkerPool pool(std::min(m_options.workers, count));

                for (size_t i = 0; i < count; ++i)
                {
                    if (cancel)
                        break;

                    std::string ip = FormatAddress(static_cast<uint32_t>(range.first + offset + i));
                    auto found = knownByIp.find(ip);
                    const common::Device *knownDevice = found == knownByIp.end() ? nullptr : found->second;

                    futures.push_back(pool.Submit([this, &cancel, &slots, &slot_mutex, &completed, &iface,
                                                   total, i, ip, knownDevice]()
                                                  {
                        if (cancel)
                            return;

                        common::Device device = m_scan(ip, knownDevice);

                        bool accepted = false;
                        {
                            std::lock_guard<std::mutex> lock(slot_mutex);
                            if (!slots[i].abandoned)
                            {
                                slots[i].device = device;
                                slots[i].finished = true;
                                accepted = true;
                            }
                        }

                        if (accepted && device.status != common::DeviceStatus::Hidden)
                            DeliverLive(device, iface.name);

                        ReportProgress(++completed, static_cast<size_t>(total), iface.name); }));
                }

                for (size_t i = 0; i < futures.size(); ++i)
                {
                    if (futures[i].wait_for(m_options.task_timeout) != std::future_status::ready)
                    {
                        std::lock_guard<std::mutex> lock(slot_mutex);
                        if (!slots[i].finished)
                        {
                            slots[i].abandoned = true;
                            if (common::DebugEnabled())
                                std::cerr << "[Scanner] Host check timed out in " << iface.name << " slot " << offset + i << "\n";
                        }
                        continue;
                    }

                    try
                    {
                        futures[i].get();
                    }
                    catch (const std::exception &e)
                    {
                        ReportProgress(++completed, static_cast<size_t>(total), iface.name);
                        if (common::DebugEnabled())
                            std::cerr << "[Scanner] Host check failed: " << e.what() << "\n";
                    }
                }

                pool.Stop();
            }

            for (auto &slot : slots)
            {
                if (!slot.device || slot.device->status == common::DeviceStatus::Hidden)
                    continue;

                auto existing = position.find(slot.device->ip);
                if (existing != position.end())
                {
                    devices[existing->second] = *slot.device;
                }
                else
                {
                    position.emplace(slot.device->ip, devices.size());
                    devices.push_back(*slot.device);
                }
            }

            if (offset + count < total && !cancel)
                std::this_thread::sleep_for(m_options.chunk_pause);
        }

        return devices;
    }
}
