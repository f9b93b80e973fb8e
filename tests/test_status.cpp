#include <doctest/doctest.h>
#include "discovery/StatusClassifier.hpp"
#include "Fakes.hpp"

using namespace netwake;
using namespace netwake::discovery;
using common::DeviceStatus;

TEST_CASE("A ping answer means online") {
    auto hosts = std::make_shared<testing::FakeHostCheck>();
    hosts->pingable.insert("10.0.0.2");
    StatusClassifier classifier(hosts, std::chrono::milliseconds(10));

    CHECK(classifier.Classify("10.0.0.2", false) == DeviceStatus::Online);
    CHECK(hosts->port_checks.load() == 0);
}

TEST_CASE("An open standby port without ping means standby") {
    auto hosts = std::make_shared<testing::FakeHostCheck>();
    hosts->open_ports["10.0.0.3"] = {5900};
    StatusClassifier classifier(hosts, std::chrono::milliseconds(10));

    CHECK(classifier.Classify("10.0.0.3", false) == DeviceStatus::Standby);
    CHECK(hosts->port_checks.load() == 6);
}

TEST_CASE("Standby ports are tried in order and stop at the first success") {
    CHECK(StatusClassifier::StandbyPorts() == std::vector<int>{80, 443, 22, 23, 3389, 5900});

    auto hosts = std::make_shared<testing::FakeHostCheck>();
    hosts->open_ports["10.0.0.4"] = {443, 22};
    StatusClassifier classifier(hosts, std::chrono::milliseconds(10));

    CHECK(classifier.Classify("10.0.0.4", true) == DeviceStatus::Standby);
    CHECK(hosts->port_checks.load() == 2);
}

TEST_CASE("A silent never-seen host is hidden, a silent known host is offline") {
    auto hosts = std::make_shared<testing::FakeHostCheck>();
    StatusClassifier classifier(hosts, std::chrono::milliseconds(10));

    CHECK(classifier.Classify("10.0.0.9", false) == DeviceStatus::Hidden);
    CHECK(classifier.Classify("10.0.0.9", true) == DeviceStatus::Offline);
}

TEST_CASE("Host check exceptions count as no signal") {
    auto hosts = std::make_shared<testing::FakeHostCheck>();
    hosts->throwing.insert("10.0.0.5");
    StatusClassifier classifier(hosts, std::chrono::milliseconds(10));

    CHECK(classifier.Classify("10.0.0.5", false) == DeviceStatus::Hidden);
    CHECK(classifier.Classify("10.0.0.5", true) == DeviceStatus::Offline);
}
