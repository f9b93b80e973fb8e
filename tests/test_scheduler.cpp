#include <doctest/doctest.h>
#include "discovery/Ipv4.hpp"
#include "discovery/ScanScheduler.hpp"
#include "discovery/WorkerPool.hpp"
#include "Fakes.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

using namespace netwake;
using namespace netwake::discovery;

namespace {
    common::NetworkInterface Subnet(const std::string &subnet) {
        common::NetworkInterface iface;
        iface.name = "en0";
        iface.subnet = subnet;
        return iface;
    }

    ScheduleOptions FastOptions(size_t chunk, size_t workers) {
        ScheduleOptions options;
        options.chunk_size = chunk;
        options.workers = workers;
        options.task_timeout = std::chrono::milliseconds(3000);
        options.chunk_pause = std::chrono::milliseconds(0);
        return options;
    }

    // Answers for hosts whose last octet is even.
    common::Device EvenHostsOnline(const std::string &ip, const common::Device *known) {
        int octet = std::stoi(common::LastOctet(ip));
        if (octet % 2 == 0)
            return testing::MakeDevice(ip);
        common::Device silent;
        silent.ip = ip;
        silent.status = known ? common::DeviceStatus::Offline : common::DeviceStatus::Hidden;
        return silent;
    }
}

TEST_CASE("WorkerPool runs every submitted job") {
    WorkerPool pool(3);
    CHECK(pool.WorkerCount() == 3);

    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i)
        futures.push_back(pool.Submit([&ran]() { ++ran; }));
    for (auto &f : futures)
        f.get();
    pool.Stop();
    CHECK(ran.load() == 20);
}

TEST_CASE("WorkerPool reports job exceptions through the future") {
    WorkerPool pool(1);
    auto future = pool.Submit([]() { throw std::runtime_error("boom"); });
    CHECK_THROWS_AS(future.get(), std::runtime_error);
}

TEST_CASE("Batch scan returns non-hidden hosts in address order") {
    ScanScheduler scheduler(FastOptions(255, 8), EvenHostsOnline);
    std::atomic<bool> cancel{false};

    auto devices = scheduler.ScanSubnet(Subnet("10.0.0.0/28"), {}, cancel);
    // .1 - .14, even octets answer
    REQUIRE(devices.size() == 7);
    CHECK(devices.front().ip == "10.0.0.2");
    CHECK(devices.back().ip == "10.0.0.14");
    for (const auto &d : devices)
        CHECK(d.status == common::DeviceStatus::Online);
}

TEST_CASE("In-flight host checks never exceed the worker count") {
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};

    auto scan = [&](const std::string &ip, const common::Device *) {
        int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --inFlight;
        return testing::MakeDevice(ip);
    };

    ScanScheduler scheduler(FastOptions(40, 5), scan);
    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("10.0.1.0/25"), {}, cancel);

    CHECK(devices.size() == 126);
    CHECK(maxInFlight.load() <= 5);
    CHECK(maxInFlight.load() >= 1);
}

TEST_CASE("A chunk starts only after the previous chunk has finished") {
    const size_t chunk = 16;
    std::atomic<size_t> finished{0};
    std::atomic<int> violations{0};

    auto scan = [&](const std::string &ip, const common::Device *) {
        auto address = ParseAddress(ip);
        size_t index = static_cast<size_t>(*address - *ParseAddress("10.0.2.1"));
        size_t chunkIndex = index / chunk;
        if (finished.load() < chunkIndex * chunk)
            ++violations;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++finished;
        return testing::MakeDevice(ip);
    };

    ScanScheduler scheduler(FastOptions(chunk, 4), scan);
    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("10.0.2.0/26"), {}, cancel);

    CHECK(devices.size() == 62);
    CHECK(violations.load() == 0);
}

TEST_CASE("Cancellation stops further chunks but keeps finished results") {
    std::atomic<bool> cancel{false};
    std::atomic<int> scanned{0};

    auto scan = [&](const std::string &ip, const common::Device *) {
        if (++scanned >= 3)
            cancel = true;
        return testing::MakeDevice(ip);
    };

    ScanScheduler scheduler(FastOptions(10, 1), scan);
    auto devices = scheduler.ScanSubnet(Subnet("10.0.3.0/24"), {}, cancel);

    CHECK(scanned.load() <= 10);
    CHECK(devices.size() == static_cast<size_t>(scanned.load()));
    CHECK(devices.size() >= 3);
}

TEST_CASE("A cancelled scan starts nothing") {
    std::atomic<bool> cancel{true};
    std::atomic<int> scanned{0};
    ScanScheduler scheduler(FastOptions(10, 2), [&](const std::string &ip, const common::Device *) {
        ++scanned;
        return testing::MakeDevice(ip);
    });

    auto devices = scheduler.ScanSubnet(Subnet("10.0.4.0/24"), {}, cancel);
    CHECK(scanned.load() == 0);
    CHECK(devices.empty());
}

TEST_CASE("Live mode delivers each visible host as it completes") {
    ScheduleOptions options = FastOptions(255, 4);
    options.mode = DeliveryMode::Live;
    ScanScheduler scheduler(options, EvenHostsOnline);

    std::mutex mutex;
    std::vector<std::string> delivered;
    std::vector<std::string> interfaces;
    scheduler.SetLiveCallback([&](const common::Device &device, const std::string &iface) {
        std::lock_guard<std::mutex> lock(mutex);
        interfaces.push_back(iface);
        delivered.push_back(device.ip);
    });

    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("10.0.5.0/28"), {}, cancel);

    std::sort(delivered.begin(), delivered.end());
    CHECK(delivered.size() == 7);
    CHECK(devices.size() == 7);
    CHECK(std::find(delivered.begin(), delivered.end(), "10.0.5.3") == delivered.end());
    CHECK(std::all_of(interfaces.begin(), interfaces.end(), [](const std::string &i) { return i == "en0"; }));
}

TEST_CASE("Batch mode never invokes the live callback") {
    ScanScheduler scheduler(FastOptions(255, 4), EvenHostsOnline);
    std::atomic<int> calls{0};
    scheduler.SetLiveCallback([&](const common::Device &, const std::string &) { ++calls; });

    std::atomic<bool> cancel{false};
    scheduler.ScanSubnet(Subnet("10.0.6.0/29"), {}, cancel);
    CHECK(calls.load() == 0);
}

TEST_CASE("A throwing live callback does not disturb the scan") {
    ScheduleOptions options = FastOptions(255, 2);
    options.mode = DeliveryMode::Live;
    ScanScheduler scheduler(options, EvenHostsOnline);
    scheduler.SetLiveCallback([](const common::Device &, const std::string &) {
        throw std::runtime_error("presentation went away");
    });

    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("10.0.7.0/29"), {}, cancel);
    CHECK(devices.size() == 3);
}

TEST_CASE("Known devices are updated in place and kept when silent") {
    common::Device outside = testing::MakeDevice("172.16.0.9", common::DeviceStatus::Offline, false);
    common::Device quiet = testing::MakeDevice("10.0.8.3", common::DeviceStatus::Online, true);
    quiet.hostname = "old-name";
    common::Device loud = testing::MakeDevice("10.0.8.4", common::DeviceStatus::Offline, false);

    std::vector<const common::Device *> knownSeen;
    std::mutex mutex;
    auto scan = [&](const std::string &ip, const common::Device *known) {
        if (known) {
            std::lock_guard<std::mutex> lock(mutex);
            knownSeen.push_back(known);
        }
        return EvenHostsOnline(ip, known);
    };

    ScanScheduler scheduler(FastOptions(255, 2), scan);
    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("10.0.8.0/29"), {outside, quiet, loud}, cancel);

    REQUIRE(devices.size() == 5);
    CHECK(devices[0].ip == "172.16.0.9");
    CHECK(devices[1].ip == "10.0.8.3");
    CHECK(devices[1].status == common::DeviceStatus::Offline);
    CHECK(devices[2].ip == "10.0.8.4");
    CHECK(devices[2].status == common::DeviceStatus::Online);
    CHECK(devices[3].ip == "10.0.8.2");
    CHECK(devices[4].ip == "10.0.8.6");
    CHECK(knownSeen.size() == 2);
}

TEST_CASE("Late results are discarded after the task timeout") {
    ScheduleOptions options = FastOptions(255, 4);
    options.task_timeout = std::chrono::milliseconds(50);

    auto scan = [](const std::string &ip, const common::Device *) {
        if (ip == "10.0.9.2")
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return testing::MakeDevice(ip);
    };

    ScanScheduler scheduler(options, scan);
    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("10.0.9.0/29"), {}, cancel);

    CHECK(devices.size() == 5);
    for (const auto &d : devices)
        CHECK(d.ip != "10.0.9.2");
}

TEST_CASE("Progress reaches the host total") {
    ScanScheduler scheduler(FastOptions(5, 2), EvenHostsOnline);
    std::atomic<size_t> last{0};
    std::atomic<size_t> reportedTotal{0};
    scheduler.SetProgressCallback([&](size_t completed, size_t total, const std::string &) {
        size_t seen = last.load();
        while (completed > seen && !last.compare_exchange_weak(seen, completed)) {
        }
        reportedTotal = total;
    });

    std::atomic<bool> cancel{false};
    scheduler.ScanSubnet(Subnet("10.0.10.0/28"), {}, cancel);
    CHECK(last.load() == 14);
    CHECK(reportedTotal.load() == 14);
}

TEST_CASE("An invalid subnet returns the known devices untouched") {
    ScanScheduler scheduler(FastOptions(5, 2), EvenHostsOnline);
    std::atomic<bool> cancel{false};
    auto devices = scheduler.ScanSubnet(Subnet("not-a-subnet"), {testing::MakeDevice("1.2.3.4")}, cancel);
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].ip == "1.2.3.4");
}
