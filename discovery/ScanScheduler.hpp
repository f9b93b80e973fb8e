#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "../common/Device.hpp"

namespace netwake::discovery
{
    enum class DeliveryMode
    {
        Batch,
        Live
    };

    struct ScheduleOptions
    {
        DeliveryMode mode = DeliveryMode::Batch;
        size_t chunk_size = 255;
        size_t workers = 50;
        std::chrono::milliseconds task_timeout{3000};
        std::chrono::milliseconds chunk_pause{100};
    };

    // Scans one host. `known` is the stored record for that IP, or nullptr.
    using ScanFunction = std::function<common::Device(const std::string &ip, const common::Device *known)>;
    using LiveCallback = std::function<void(const common::Device &device, const std::string &interfaceName)>;
    using ProgressCallback = std::function<void(size_t completed, size_t total, const std::string &interfaceName)>;

    // Splits a subnet into ordered chunks and runs each chunk through a fresh
    // WorkerPool, waiting for it to drain before the next chunk starts.
    class ScanScheduler
    {
    public:
        ScanScheduler(ScheduleOptions options, ScanFunction scan);

        void SetLiveCallback(LiveCallback callback) { m_liveCallback = std::move(callback); }
        void SetProgressCallback(ProgressCallback callback) { m_progressCallback = std::move(callback); }

        // Returns the interface's known devices updated in place by IP, followed by
        // newly seen hosts. Hidden results are never included or delivered.
        std::vector<common::Device> ScanSubnet(const common::NetworkInterface &iface,
                                               const std::vector<common::Device> &known,
                                               const std::atomic<bool> &cancel);

    private:
        void DeliverLive(const common::Device &device, const std::string &interfaceName);
        void ReportProgress(size_t completed, size_t total, const std::string &interfaceName);

        ScheduleOptions m_options;
        ScanFunction m_scan;
        LiveCallback m_liveCallback;
        ProgressCallback m_progressCallback;
    };
}
