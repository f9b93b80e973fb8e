#include <doctest/doctest.h>
#include "discovery/HostScanner.hpp"
#include "Fakes.hpp"

using namespace netwake;
using namespace netwake::discovery;
using common::DeviceStatus;

namespace {
    class FixedName : public IdentityStrategy {
    public:
        explicit FixedName(std::map<std::string, std::string> names) : m_names(std::move(names)) {}
        const char *Name() const override { return "fixed"; }
        std::optional<std::string> TryResolve(const std::string &ip) override {
            auto it = m_names.find(ip);
            if (it == m_names.end())
                return std::nullopt;
            return it->second;
        }

    private:
        std::map<std::string, std::string> m_names;
    };

    struct Rig {
        std::shared_ptr<testing::FakeHostCheck> hosts = std::make_shared<testing::FakeHostCheck>();
        std::shared_ptr<testing::FakeCommandRunner> runner = std::make_shared<testing::FakeCommandRunner>();
        std::shared_ptr<IdentityResolver> identity = std::make_shared<IdentityResolver>();

        HostScanner Build() {
            return HostScanner(std::make_shared<StatusClassifier>(hosts, std::chrono::milliseconds(5)),
                               identity,
                               std::make_shared<MacResolver>(runner),
                               std::make_shared<VendorLookup>("/nonexistent/netwake/oui.txt"));
        }
    };
}

TEST_CASE("An online host gets name, MAC and vendor") {
    Rig rig;
    rig.hosts->pingable.insert("192.168.0.20");
    rig.runner->Script("arp -n 192.168.0.20", 0, "? (192.168.0.20) at 08:00:27:01:02:03 on en0\n");
    rig.identity->AddStrategy(std::make_unique<FixedName>(std::map<std::string, std::string>{{"192.168.0.20", "vm.lan"}}));

    auto device = rig.Build().ScanHost("192.168.0.20", nullptr);
    CHECK(device.status == DeviceStatus::Online);
    CHECK(device.pingable);
    CHECK(device.hostname == std::optional<std::string>("vm.lan"));
    CHECK(device.mac == std::optional<std::string>("08:00:27:01:02:03"));
    CHECK(device.vendor == std::optional<std::string>("VirtualBox"));
    CHECK(device.last_seen > 0.0);
    CHECK(device.current_scan);
}

TEST_CASE("Known values fill what a reachable host did not reveal") {
    Rig rig;
    rig.hosts->open_ports["192.168.0.21"] = {22};

    common::Device known = testing::MakeDevice("192.168.0.21", DeviceStatus::Offline, false);
    known.hostname = "nas.local";
    known.mac = "AA:BB:CC:DD:EE:FF";
    known.vendor = "Synology";
    known.last_seen = 1000.0;

    auto device = rig.Build().ScanHost("192.168.0.21", &known);
    CHECK(device.status == DeviceStatus::Standby);
    CHECK_FALSE(device.pingable);
    CHECK(device.hostname == known.hostname);
    CHECK(device.mac == known.mac);
    CHECK(device.vendor == known.vendor);
    CHECK(device.last_seen > known.last_seen);
}

TEST_CASE("An unnamed new host is labelled by its last octet") {
    Rig rig;
    rig.hosts->pingable.insert("192.168.0.22");
    auto device = rig.Build().ScanHost("192.168.0.22", nullptr);
    CHECK(device.hostname == std::optional<std::string>(".22"));
    CHECK_FALSE(device.mac.has_value());
}

TEST_CASE("A silent known host keeps its stored identity") {
    Rig rig;
    common::Device known = testing::MakeDevice("192.168.0.23");
    known.hostname = "desktop";
    known.mac = "11:22:33:44:55:66";
    known.last_seen = 42.0;

    auto device = rig.Build().ScanHost("192.168.0.23", &known);
    CHECK(device.status == DeviceStatus::Offline);
    CHECK_FALSE(device.pingable);
    CHECK(device.hostname == known.hostname);
    CHECK(device.mac == known.mac);
    CHECK(device.last_seen == 42.0);
}

TEST_CASE("A silent unknown host is hidden and carries nothing") {
    Rig rig;
    auto device = rig.Build().ScanHost("192.168.0.24", nullptr);
    CHECK(device.status == DeviceStatus::Hidden);
    CHECK_FALSE(device.hostname.has_value());
    CHECK_FALSE(device.mac.has_value());
}
