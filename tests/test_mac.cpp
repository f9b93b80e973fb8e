#include <doctest/doctest.h>
#include "discovery/MacResolver.hpp"
#include "Fakes.hpp"

using namespace netwake;
using namespace netwake::discovery;

TEST_CASE("PadMacAddress restores dropped leading zeros") {
    CHECK(PadMacAddress("0:3e:e1:b7:57:54") == "00:3E:E1:B7:57:54");
}

TEST_CASE("PadMacAddress leaves a well-formed address unchanged") {
    CHECK(PadMacAddress("AA:BB:CC:DD:EE:FF") == "AA:BB:CC:DD:EE:FF");
    CHECK(PadMacAddress("aa-bb-cc-dd-ee-ff") == "AA:BB:CC:DD:EE:FF");
}

TEST_CASE("PadMacAddress truncates more than twelve hex digits") {
    CHECK(PadMacAddress("AA:BB:CC:DD:EE:FF:1") == "AA:BB:CC:DD:EE:FF");
    CHECK(PadMacAddress("aabbccddeeff12") == "AA:BB:CC:DD:EE:FF");
}

TEST_CASE("PadMacAddress pads the joined digits, not each group") {
    // Separators are removed first, so the zeros land at the front.
    CHECK(PadMacAddress("a:b:c:d:e:f") == "00:00:00:AB:CD:EF");
    CHECK(PadMacAddress("") == "");
}

TEST_CASE("ExtractMac finds the first address in BSD and Windows output") {
    auto bsd = ExtractMac("? (192.168.0.1) at 0:3e:e1:b7:57:54 on en0 ifscope [ethernet]");
    REQUIRE(bsd.has_value());
    CHECK(*bsd == "00:3E:E1:B7:57:54");

    auto win = ExtractMac("  192.168.0.7           08-00-27-aa-bb-cc     dynamic");
    REQUIRE(win.has_value());
    CHECK(*win == "08:00:27:AA:BB:CC");

    CHECK_FALSE(ExtractMac("? (192.168.0.9) at (incomplete) on en0").has_value());
}

TEST_CASE("MacResolver prefers the direct neighbor query") {
    auto runner = std::make_shared<testing::FakeCommandRunner>();
    runner->Script("arp -n 192.168.0.5", 0, "? (192.168.0.5) at 52:54:00:12:34:56 on en0\n");
    runner->Script("arp -a", 0, "? (192.168.0.5) at 11:11:11:11:11:11 on en0\n");

    MacResolver resolver(runner);
    auto mac = resolver.Resolve("192.168.0.5");
    REQUIRE(mac.has_value());
    CHECK(*mac == "52:54:00:12:34:56");
    CHECK(runner->Calls().size() == 1);
}

TEST_CASE("MacResolver falls back to the full table on a failed direct query") {
    auto runner = std::make_shared<testing::FakeCommandRunner>();
    runner->Script("arp -n 192.168.0.5", 1, "");
    runner->Script("arp -a", 0,
                   "? (192.168.0.4) at 22:22:22:22:22:22 on en0\n"
                   "? (192.168.0.5) at aa:bb:cc:dd:ee:ff on en0\n");

    MacResolver resolver(runner);
    auto mac = resolver.Resolve("192.168.0.5");
    REQUIRE(mac.has_value());
    CHECK(*mac == "AA:BB:CC:DD:EE:FF");
}

TEST_CASE("MacResolver falls back when the direct answer has no address") {
    auto runner = std::make_shared<testing::FakeCommandRunner>();
    runner->Script("arp -n 192.168.0.5", 0, "192.168.0.5 (192.168.0.5) -- no entry\n");
    runner->Script("arp -a", 0, "? (192.168.0.5) at 0:11:32:4:5:6 on en0\n");

    MacResolver resolver(runner);
    auto mac = resolver.Resolve("192.168.0.5");
    REQUIRE(mac.has_value());
    CHECK(*mac == "00:00:01:13:24:56");
}

TEST_CASE("MacResolver gives nothing when every query fails") {
    auto runner = std::make_shared<testing::FakeCommandRunner>();
    MacResolver resolver(runner);
    CHECK_FALSE(resolver.Resolve("192.168.0.5").has_value());
}
