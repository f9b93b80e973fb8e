#include <doctest/doctest.h>
#include "common/Config.hpp"
#include "common/Device.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace netwake::common;

namespace {
    Config Parse(std::vector<std::string> args) {
        std::vector<char *> argv;
        for (auto &arg : args)
            argv.push_back(arg.data());
        return ParseArguments(static_cast<int>(argv.size()), argv.data());
    }

    struct CleanEnvironment {
        CleanEnvironment() {
            unsetenv("NETWAKE_HOME");
            unsetenv("NETWAKE_OUI_DB");
            unsetenv("NETWAKE_DEBUG");
        }
        ~CleanEnvironment() {
            unsetenv("NETWAKE_HOME");
            unsetenv("NETWAKE_OUI_DB");
            unsetenv("NETWAKE_DEBUG");
        }
    };
}

TEST_CASE("Defaults follow the scanning model") {
    CleanEnvironment env;
    Config config = DefaultConfig();
    CHECK(config.chunk_size == 255);
    CHECK(config.live_workers == 20);
    CHECK(config.batch_workers == 50);
    CHECK(config.task_timeout == std::chrono::milliseconds(3000));
    CHECK(config.chunk_pause == std::chrono::milliseconds(100));
    CHECK(config.cycle_interval == std::chrono::seconds(30));
    CHECK(config.first_cycle_delay == std::chrono::seconds(5));
    CHECK(config.network_keys.size() == 3);
    CHECK(config.database_path == config.data_dir + "/known_devices.db");
    CHECK(config.oui_database_path == config.data_dir + "/oui_database.txt");
}

TEST_CASE("Command line flags override defaults") {
    CleanEnvironment env;
    Config config = Parse({"netwake-agent", "watch", "--interval", "45", "--workers", "8",
                           "--data-dir", "/tmp/nw", "--debug"});
    CHECK(config.command == AgentCommand::Watch);
    CHECK(config.cycle_interval == std::chrono::seconds(45));
    CHECK(config.live_workers == 8);
    CHECK(config.batch_workers == 8);
    CHECK(config.database_path == "/tmp/nw/known_devices.db");
    CHECK(config.oui_database_path == "/tmp/nw/oui_database.txt");
    CHECK(config.debug);
}

TEST_CASE("An explicit OUI path survives a data directory change") {
    CleanEnvironment env;
    Config config = Parse({"netwake-agent", "scan", "--oui", "/opt/oui.txt", "--data-dir", "/tmp/nw"});
    CHECK(config.command == AgentCommand::Scan);
    CHECK(config.oui_database_path == "/opt/oui.txt");
}

TEST_CASE("Environment overrides apply before flags") {
    CleanEnvironment env;
    setenv("NETWAKE_HOME", "/srv/netwake", 1);
    setenv("NETWAKE_DEBUG", "1", 1);
    Config config = Parse({"netwake-agent", "list"});
    CHECK(config.command == AgentCommand::List);
    CHECK(config.database_path == "/srv/netwake/known_devices.db");
    CHECK(config.debug);
}

TEST_CASE("Bad arguments are rejected") {
    CleanEnvironment env;
    CHECK_THROWS_AS(Parse({"netwake-agent"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "explode"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "watch", "--workers"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "watch", "--workers", "zero"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "watch", "--interval", "0"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "watch", "--frobnicate"}), std::invalid_argument);
    CHECK(Usage().find("watch") != std::string::npos);
}

TEST_CASE("Export and import take a file argument") {
    CleanEnvironment env;
    Config exported = Parse({"netwake-agent", "export"});
    CHECK(exported.command == AgentCommand::Export);
    CHECK(exported.exchange_file.empty());

    Config imported = Parse({"netwake-agent", "import", "devices.json", "--debug"});
    CHECK(imported.command == AgentCommand::Import);
    CHECK(imported.exchange_file == "devices.json");
    CHECK(imported.debug);

    CHECK_THROWS_AS(Parse({"netwake-agent", "import"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "export", "a.json", "b.json"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"netwake-agent", "list", "a.json"}), std::invalid_argument);
}

TEST_CASE("Status and context strings round trip, unknown text is conservative") {
    CHECK(std::string(ToString(DeviceStatus::Standby)) == "standby");
    CHECK(ParseStatus("standby") == DeviceStatus::Standby);
    CHECK(ParseStatus("weird") == DeviceStatus::Offline);
    CHECK(std::string(ToString(NetworkContext::DiscoveredOffline)) == "discovered_offline");
    CHECK(ParseContext("discovered_online") == NetworkContext::DiscoveredOnline);
    CHECK(ParseContext("") == NetworkContext::Primary);
    CHECK(LastOctet("192.168.0.23") == "23");
    CHECK_FALSE(HasValue(std::optional<std::string>("")));
}
