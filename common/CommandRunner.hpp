#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netwake::common
{
    struct CommandResult
    {
        bool started = false;
        bool timed_out = false;
        int exit_code = -1;
        std::string output;

        bool Succeeded() const { return started && !timed_out && exit_code == 0; }
    };

    // Runs an OS utility and captures its stdout. Implementations must enforce the
    // timeout: a hung child is killed, never waited on indefinitely.
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;
        virtual CommandResult Run(const std::vector<std::string> &argv,
                                  std::chrono::milliseconds timeout) = 0;
    };

    class SystemCommandRunner : public CommandRunner
    {
    public:
        CommandResult Run(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout) override;
    };
}
