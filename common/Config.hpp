#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netwake::common
{
    enum class AgentCommand
    {
        Watch,
        Scan,
        List,
        Interfaces,
        Clear,
        Export,
        Import
    };

    struct Config
    {
        AgentCommand command = AgentCommand::List;

        size_t chunk_size = 255;
        size_t live_workers = 20;
        size_t batch_workers = 50;
        std::chrono::milliseconds task_timeout{3000};
        std::chrono::milliseconds chunk_pause{100};

        std::chrono::seconds ping_timeout{1};
        std::chrono::milliseconds ping_process_timeout{3000};
        std::chrono::milliseconds standby_port_timeout{1000};
        std::chrono::milliseconds fingerprint_timeout{500};

        std::chrono::seconds first_cycle_delay{5};
        std::chrono::seconds cycle_interval{30};
        std::chrono::seconds cycle_error_backoff{10};

        std::string data_dir;
        std::string database_path;
        std::string oui_database_path;

        // JSON file for export (stdout when empty) and import.
        std::string exchange_file;

        std::vector<std::string> network_keys{
            "192.168.0.0/24",
            "134.124.230.0/24",
            "134.124.231.0/24"};

        bool debug = false;
    };

    Config DefaultConfig();

    // NETWAKE_HOME, NETWAKE_OUI_DB, NETWAKE_DEBUG.
    void ApplyEnvironment(Config &config);

    // Throws std::invalid_argument on unknown commands, flags or bad numbers.
    Config ParseArguments(int argc, char *argv[]);

    std::string Usage();
}
