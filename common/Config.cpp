#include "Config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace netwake::common
{
    namespace
    {
        std::string HomeDirectory()
        {
            const char *home = std::getenv("HOME");
            if (home && *home)
                return home;
            return ".";
        }

        bool IsTruthy(const char *value)
        {
            return value && (*value == '1' || *value == 't' || *value == 'T' ||
                             *value == 'y' || *value == 'Y');
        }

        void DerivePaths(Config &config, bool keepDatabase, bool keepOui)
        {
            if (!keepDatabase)
                config.database_path = config.data_dir + "/known_devices.db";
            if (!keepOui)
                config.oui_database_path = config.data_dir + "/oui_database.txt";
        }

        size_t ParseCount(const std::string &flag, const std::string &value)
        {
            size_t consumed = 0;
            long parsed = 0;
            try
            {
                parsed = std::stol(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            }
            if (consumed != value.size() || parsed <= 0)
                throw std::invalid_argument(flag + " expects a positive number, got '" + value + "'");
            return static_cast<size_t>(parsed);
        }

        AgentCommand ParseCommand(const std::string &name)
        {
            if (name == "watch")
                return AgentCommand::Watch;
            if (name == "scan")
                return AgentCommand::Scan;
            if (name == "list")
                return AgentCommand::List;
            if (name == "interfaces")
                return AgentCommand::Interfaces;
            if (name == "clear")
                return AgentCommand::Clear;
            if (name == "export")
                return AgentCommand::Export;
            if (name == "import")
                return AgentCommand::Import;
            throw std::invalid_argument("Unknown command '" + name + "'");
        }
    }

    Config DefaultConfig()
    {
        Config config;
        config.data_dir = HomeDirectory() + "/.netwake";
        DerivePaths(config, false, false);
        return config;
    }

    void ApplyEnvironment(Config &config)
    {
        if (const char *home = std::getenv("NETWAKE_HOME"); home && *home)
        {
            config.data_dir = home;
            DerivePaths(config, false, false);
        }
        if (const char *oui = std::getenv("NETWAKE_OUI_DB"); oui && *oui)
            config.oui_database_path = oui;
        if (IsTruthy(std::getenv("NETWAKE_DEBUG")))
            config.debug = true;
    }

    Config ParseArguments(int argc, char *argv[])
    {
        Config config = DefaultConfig();
        ApplyEnvironment(config);

        if (argc < 2)
            throw std::invalid_argument("Missing command");

        config.command = ParseCommand(argv[1]);

        bool explicitOui = std::getenv("NETWAKE_OUI_DB") != nullptr;

        for (int i = 2; i < argc; ++i)
        {
            std::string flag = argv[i];
            auto nextValue = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument(flag + " requires a value");
                return argv[++i];
            };

            if (flag == "--debug")
            {
                config.debug = true;
            }
            else if (flag == "--interval")
            {
                config.cycle_interval = std::chrono::seconds(ParseCount(flag, nextValue()));
            }
            else if (flag == "--workers")
            {
                size_t workers = ParseCount(flag, nextValue());
                config.live_workers = workers;
                config.batch_workers = workers;
            }
            else if (flag == "--data-dir")
            {
                config.data_dir = nextValue();
                DerivePaths(config, false, explicitOui);
            }
            else if (flag == "--oui")
            {
                config.oui_database_path = nextValue();
                explicitOui = true;
            }
            else if (flag.rfind("--", 0) != 0 && config.exchange_file.empty() &&
                     (config.command == AgentCommand::Export || config.command == AgentCommand::Import))
            {
                config.exchange_file = flag;
            }
            else
            {
                throw std::invalid_argument("Unknown option '" + flag + "'");
            }
        }

        if (config.command == AgentCommand::Import && config.exchange_file.empty())
            throw std::invalid_argument("import requires a JSON file");

        return config;
    }

    std::string Usage()
    {
        std::ostringstream ss;
        ss << "Usage: netwake-agent <command> [file] [options]\n"
           << "Commands:\n"
           << "  watch       Scan continuously and keep the device history (owner)\n"
           << "  scan        One-shot scan of all interfaces (read-only)\n"
           << "  list        Show the stored device history (read-only)\n"
           << "  interfaces  Show local interfaces and discovered networks\n"
           << "  clear       Forget every recorded device\n"
           << "  export [F]  Write the device history as JSON to F or stdout\n"
           << "  import F    Add the devices of a JSON export to the history\n"
           << "Options:\n"
           << "  --interval S   Seconds between scan cycles (watch)\n"
           << "  --workers N    Worker pool size\n"
           << "  --data-dir P   Directory holding known_devices.db\n"
           << "  --oui P        OUI vendor database (tab separated)\n"
           << "  --debug        Verbose diagnostics\n";
        return ss.str();
    }
}
