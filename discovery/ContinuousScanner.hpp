#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "DiscoveryState.hpp"
#include "ScanScheduler.hpp"
#include "../common/Device.hpp"

namespace netwake::discovery
{
    struct CycleTiming
    {
        std::chrono::milliseconds first_cycle_delay{5000};
        std::chrono::milliseconds cycle_interval{30000};
        std::chrono::milliseconds error_backoff{10000};
    };

    // Called on the scan thread after every completed cycle.
    using CycleCallback = std::function<void(size_t cycle)>;

    // Interfaces to scan this cycle, discovered subnets included.
    using InterfaceSource = std::function<std::vector<common::NetworkInterface>()>;

    // Groups interface entries by name: the primary subnet first, then the subnets
    // discovered behind the same interface.
    std::vector<std::pair<std::string, std::vector<common::NetworkInterface>>>
    GroupByInterface(const std::vector<common::NetworkInterface> &interfaces);

    // Enumerate -> scan every subnet -> record -> persist, on its own thread or once
    // on the caller's.
    class ContinuousScanner
    {
    public:
        ContinuousScanner(InterfaceSource interfaces,
                          std::shared_ptr<DiscoveryState> state,
                          std::shared_ptr<ScanScheduler> scheduler,
                          CycleTiming timing = CycleTiming());
        ~ContinuousScanner();

        void SetCycleCallback(CycleCallback callback) { m_cycleCallback = std::move(callback); }

        void Start();
        void Stop();

        // Ends the running cycle at the next chunk boundary without joining, or the
        // next cycle if none is running. Later cycles run normally.
        void Cancel();

        // One full cycle on the calling thread. Returns false if cancelled midway.
        bool RunCycle();

    private:
        bool ScanAll();
        void ResetCancel();
        void ScanLoop();
        void WaitFor(std::chrono::milliseconds duration);

        InterfaceSource m_interfaces;
        std::shared_ptr<DiscoveryState> m_state;
        std::shared_ptr<ScanScheduler> m_scheduler;
        CycleTiming m_timing;
        CycleCallback m_cycleCallback;

        std::atomic<bool> m_running;
        std::atomic<bool> m_cancel;
        std::atomic<size_t> m_cycles;

        std::mutex m_cancelMutex;
        bool m_stopping;
        std::thread m_thread;
    };
}
