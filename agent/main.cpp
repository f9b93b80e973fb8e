#include "../common/CommandRunner.hpp"
#include "../common/Config.hpp"
#include "../common/Debug.hpp"
#include "../common/ThreadSafeQueue.hpp"
#include "../discovery/ContinuousScanner.hpp"
#include "../discovery/DiscoveryState.hpp"
#include "../discovery/HostCheck.hpp"
#include "../discovery/HostScanner.hpp"
#include "../discovery/IdentityResolver.hpp"
#include "../discovery/InterfaceEnumerator.hpp"
#include "../discovery/MacResolver.hpp"
#include "../discovery/ScanScheduler.hpp"
#include "../discovery/StatusClassifier.hpp"
#include "../discovery/VendorLookup.hpp"
#include "../storage/JsonExchange.hpp"
#include "../storage/SqliteDeviceStorage.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace netwake;

namespace
{
    std::atomic<bool> g_stopRequested{false};

    void HandleSignal(int)
    {
        g_stopRequested = true;
    }

    struct AgentEvent
    {
        enum class Kind
        {
            DeviceFound,
            CycleDone
        };

        Kind kind;
        common::Device device;
        std::string interface_name;
        size_t cycle = 0;
    };

    // Everything a scan needs, wired from the configuration.
    struct Engine
    {
        std::shared_ptr<common::CommandRunner> runner;
        std::shared_ptr<discovery::InterfaceEnumerator> enumerator;
        std::shared_ptr<discovery::VendorLookup> vendors;
        std::shared_ptr<discovery::HostScanner> hostScanner;
    };

    Engine BuildEngine(const common::Config &config)
    {
        Engine engine;
        engine.runner = std::make_shared<common::SystemCommandRunner>();
        engine.enumerator = std::make_shared<discovery::InterfaceEnumerator>(engine.runner);
        engine.vendors = std::make_shared<discovery::VendorLookup>(config.oui_database_path);

        auto hosts = std::make_shared<discovery::SystemHostCheck>(engine.runner, config.ping_timeout,
                                                                  config.ping_process_timeout);
        auto macResolver = std::make_shared<discovery::MacResolver>(engine.runner);
        auto classifier = std::make_shared<discovery::StatusClassifier>(hosts, config.standby_port_timeout);

        discovery::IdentityDependencies deps;
        deps.runner = engine.runner;
        deps.hosts = hosts;
        deps.macResolver = macResolver;
        deps.vendors = engine.vendors;
        deps.fingerprintTimeout = config.fingerprint_timeout;
        deps.platformNameTools = discovery::PlatformHasNameTools();
        std::shared_ptr<discovery::IdentityResolver> identity = discovery::CreateDefaultResolver(deps);

        engine.hostScanner = std::make_shared<discovery::HostScanner>(classifier, identity, macResolver, engine.vendors);
        return engine;
    }

    std::shared_ptr<discovery::ScanScheduler> BuildScheduler(const common::Config &config,
                                                             const Engine &engine,
                                                             discovery::DeliveryMode mode)
    {
        discovery::ScheduleOptions options;
        options.mode = mode;
        options.chunk_size = config.chunk_size;
        options.workers = mode == discovery::DeliveryMode::Live ? config.live_workers : config.batch_workers;
        options.task_timeout = config.task_timeout;
        options.chunk_pause = config.chunk_pause;

        auto hostScanner = engine.hostScanner;
        return std::make_shared<discovery::ScanScheduler>(
            options, [hostScanner](const std::string &ip, const common::Device *known)
            { return hostScanner->ScanHost(ip, known); });
    }

    discovery::InterfaceSource InterfacesOf(const Engine &engine)
    {
        auto enumerator = engine.enumerator;
        return [enumerator]()
        { return enumerator->ListInterfaces(true); };
    }

    std::string FormatLastSeen(double seconds)
    {
        if (seconds <= 0.0)
            return "never";
        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void PrintDevice(const common::Device &device)
    {
        std::cout << "    " << std::left << std::setw(8) << common::ToString(device.status)
                  << discovery::PriorityDisplay(device);
        if (device.network_context != common::NetworkContext::Primary)
            std::cout << " (" << common::ToString(device.network_context) << ")";
        if (!device.current_scan)
            std::cout << "  last seen " << FormatLastSeen(device.last_seen);
        std::cout << "\n";
    }

    void PrintView(const std::vector<discovery::InterfaceView> &views)
    {
        if (views.empty())
        {
            std::cout << "No devices recorded yet.\n";
            return;
        }

        for (const auto &view : views)
        {
            std::cout << view.name << (view.historical ? " (not connected)" : "") << "\n";
            for (const auto &group : view.networks)
            {
                std::cout << "  " << discovery::FormatNetworkRange(group.key)
                          << "  [" << group.devices.size() << " devices]\n";
                for (const auto &device : group.devices)
                    PrintDevice(device);
            }
        }
    }

    std::shared_ptr<storage::SqliteDeviceStorage> OpenStorage(const common::Config &config, storage::AccessMode mode)
    {
        if (mode == storage::AccessMode::ReadWrite)
        {
            std::error_code ec;
            std::filesystem::create_directories(config.data_dir, ec);
            if (ec)
                std::cerr << "[Agent] Cannot create " << config.data_dir << ": " << ec.message() << "\n";
        }
        return std::make_shared<storage::SqliteDeviceStorage>(config.database_path, mode);
    }

    void ApplyStoredDebugSetting(storage::DeviceStorage &storage, const common::Config &config)
    {
        if (config.debug)
        {
            if (storage.IsWritable())
                storage.SaveSetting("debug_mode", "1");
            return;
        }
        auto stored = storage.LoadSetting("debug_mode");
        if (stored && *stored == "1")
            common::SetDebugEnabled(true);
    }

    int RunWatch(const common::Config &config)
    {
        auto storage = OpenStorage(config, storage::AccessMode::ReadWrite);
        ApplyStoredDebugSetting(*storage, config);

        Engine engine = BuildEngine(config);
        auto state = std::make_shared<discovery::DiscoveryState>(storage, discovery::StateRole::Owner,
                                                                 config.network_keys, engine.vendors);
        state->Load();

        common::ThreadSafeQueue<AgentEvent> events;
        auto scheduler = BuildScheduler(config, engine, discovery::DeliveryMode::Live);
        scheduler->SetLiveCallback([&events](const common::Device &device, const std::string &iface)
                                   { events.Push(AgentEvent{AgentEvent::Kind::DeviceFound, device, iface, 0}); });

        discovery::CycleTiming timing;
        timing.first_cycle_delay = config.first_cycle_delay;
        timing.cycle_interval = config.cycle_interval;
        timing.error_backoff = config.cycle_error_backoff;

        discovery::ContinuousScanner scanner(InterfacesOf(engine), state, scheduler, timing);
        scanner.SetCycleCallback([&events](size_t cycle)
                                 { events.Push(AgentEvent{AgentEvent::Kind::CycleDone, {}, "", cycle}); });

        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        std::cout << "[Agent] Watching. Storing history in " << config.database_path << " (Ctrl-C to stop)\n";
        scanner.Start();

        while (!g_stopRequested)
        {
            auto event = events.PopFor(std::chrono::milliseconds(200));
            if (!event)
                continue;

            if (event->kind == AgentEvent::Kind::DeviceFound)
            {
                std::cout << "[Live] " << event->interface_name << " "
                          << common::ToString(event->device.status) << " "
                          << discovery::PriorityDisplay(event->device) << "\n";
            }
            else
            {
                std::cout << "\n[Agent] Cycle " << event->cycle << " complete\n";
                PrintView(state->BuildView());
            }
        }

        std::cout << "\n[Agent] Stopping...\n";
        events.Shutdown();
        scanner.Stop();
        return 0;
    }

    int RunScan(const common::Config &config)
    {
        auto storage = OpenStorage(config, storage::AccessMode::ReadOnly);
        ApplyStoredDebugSetting(*storage, config);

        Engine engine = BuildEngine(config);
        auto state = std::make_shared<discovery::DiscoveryState>(storage, discovery::StateRole::ReadOnly,
                                                                 config.network_keys, engine.vendors);
        state->Load();

        auto scheduler = BuildScheduler(config, engine, discovery::DeliveryMode::Batch);
        scheduler->SetProgressCallback([](size_t completed, size_t total, const std::string &iface)
                                       {
            if (completed == total || completed % 64 == 0)
                std::cerr << "\r[Scanner] " << iface << " " << completed << "/" << total << std::flush; });

        discovery::ContinuousScanner scanner(InterfacesOf(engine), state, scheduler);

        std::signal(SIGINT, HandleSignal);
        std::atomic<bool> scanDone{false};
        std::thread watchdog([&scanner, &scanDone]()
                             {
            while (!scanDone)
            {
                if (g_stopRequested)
                {
                    scanner.Cancel();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            } });

        bool complete = false;
        try
        {
            complete = scanner.RunCycle();
        }
        catch (const std::exception &e)
        {
            std::cerr << "\n[Agent] Scan failed: " << e.what() << "\n";
        }

        scanDone = true;
        watchdog.join();

        std::cerr << "\n";
        if (!complete)
            std::cout << "[Agent] Scan interrupted; showing partial results\n";
        PrintView(state->BuildView());
        return complete ? 0 : 1;
    }

    int RunList(const common::Config &config)
    {
        auto storage = OpenStorage(config, storage::AccessMode::ReadOnly);
        ApplyStoredDebugSetting(*storage, config);

        discovery::DiscoveryState state(storage, discovery::StateRole::ReadOnly, config.network_keys);
        state.Load();
        PrintView(state.BuildView());
        return 0;
    }

    int RunInterfaces(const common::Config &config)
    {
        auto runner = std::make_shared<common::SystemCommandRunner>();
        discovery::InterfaceEnumerator enumerator(runner);

        discovery::HostMachineInfo host = enumerator.GetHostMachineInfo();
        std::cout << "Host: " << host.hostname << "\n";
        for (const auto &ip : host.local_ips)
            std::cout << "  " << ip << "\n";

        std::vector<common::NetworkInterface> interfaces = enumerator.ListInterfaces(true);
        std::cout << "\n"
                  << std::left << std::setw(12) << "Interface" << std::setw(18) << "Address"
                  << std::setw(20) << "Subnet" << "Origin\n";
        for (const auto &iface : interfaces)
        {
            std::cout << std::setw(12) << iface.name << std::setw(18) << iface.ip
                      << std::setw(20) << iface.subnet << (iface.discovered ? "neighbor cache" : "local") << "\n";
        }

        uint64_t total = 0;
        std::vector<discovery::NetworkSummary> summary = discovery::SummarizeNetworks(interfaces, total);
        std::cout << "\nBroadcast targets:\n";
        for (const auto &entry : summary)
        {
            std::cout << "  " << std::setw(12) << entry.interface_name << std::setw(20) << entry.range
                      << entry.address_count << " addresses via " << entry.host_ip << "\n";
        }
        std::cout << "  Total: " << total << " addresses\n";
        return 0;
    }

    int RunClear(const common::Config &config)
    {
        auto storage = OpenStorage(config, storage::AccessMode::ReadWrite);
        discovery::DiscoveryState state(storage, discovery::StateRole::Owner, config.network_keys);
        if (!state.ClearHistory())
        {
            std::cerr << "[Agent] Could not clear " << config.database_path << "\n";
            return 1;
        }
        std::cout << "[Agent] Device history cleared\n";
        return 0;
    }

    int RunExport(const common::Config &config)
    {
        auto storage = OpenStorage(config, storage::AccessMode::ReadOnly);
        ApplyStoredDebugSetting(*storage, config);

        discovery::DiscoveryState state(storage, discovery::StateRole::ReadOnly, config.network_keys);
        state.Load();
        common::KnownDeviceStore snapshot = state.Snapshot();

        const double now = std::chrono::duration<double>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        std::string document = storage::ExportJson(snapshot, common::DebugEnabled(), now);

        if (config.exchange_file.empty())
        {
            std::cout << document << "\n";
            return 0;
        }

        std::ofstream out(config.exchange_file);
        out << document << "\n";
        out.close();
        if (!out)
        {
            std::cerr << "[Agent] Could not write " << config.exchange_file << "\n";
            return 1;
        }

        size_t total = 0;
        for (const auto &[name, devices] : snapshot)
            total += devices.size();
        std::cout << "[Agent] Exported " << total << " devices to " << config.exchange_file << "\n";
        return 0;
    }

    int RunImport(const common::Config &config)
    {
        std::ifstream in(config.exchange_file);
        if (!in.is_open())
        {
            std::cerr << "[Agent] Cannot open " << config.exchange_file << "\n";
            return 1;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        common::KnownDeviceStore imported;
        try
        {
            imported = storage::ImportJson(buffer.str());
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "[Agent] " << config.exchange_file << ": " << e.what() << "\n";
            return 1;
        }

        auto storage = OpenStorage(config, storage::AccessMode::ReadWrite);
        discovery::DiscoveryState state(storage, discovery::StateRole::Owner, config.network_keys);
        std::optional<size_t> added = state.Import(imported);
        if (!added)
        {
            std::cerr << "[Agent] Could not import into " << config.database_path << "\n";
            return 1;
        }
        std::cout << "[Agent] Imported " << *added << " new devices from " << config.exchange_file << "\n";
        return 0;
    }
}

int main(int argc, char *argv[])
{
    common::Config config;
    try
    {
        config = common::ParseArguments(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n\n"
                  << common::Usage();
        return 2;
    }

    common::SetDebugEnabled(config.debug);

    try
    {
        switch (config.command)
        {
        case common::AgentCommand::Watch:
            return RunWatch(config);
        case common::AgentCommand::Scan:
            return RunScan(config);
        case common::AgentCommand::List:
            return RunList(config);
        case common::AgentCommand::Interfaces:
            return RunInterfaces(config);
        case common::AgentCommand::Clear:
            return RunClear(config);
        case common::AgentCommand::Export:
            return RunExport(config);
        case common::AgentCommand::Import:
            return RunImport(config);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Agent] Fatal error: " << e.what() << '\n';
        return -1;
    }
    return 0;
}
