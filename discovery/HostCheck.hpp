#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "../common/CommandRunner.hpp"

namespace netwake::discovery
{
    // Reachability primitives. Both calls report failure as `false`, never throw.
    class HostCheck
    {
    public:
        virtual ~HostCheck() = default;
        virtual bool Ping(const std::string &ip) = 0;
        virtual bool IsPortOpen(const std::string &ip, int port, std::chrono::milliseconds timeout) = 0;
    };

    class SystemHostCheck : public HostCheck
    {
    public:
        SystemHostCheck(std::shared_ptr<common::CommandRunner> runner,
                        std::chrono::seconds pingTimeout,
                        std::chrono::milliseconds processTimeout);

        bool Ping(const std::string &ip) override;
        bool IsPortOpen(const std::string &ip, int port, std::chrono::milliseconds timeout) override;

    private:
        std::shared_ptr<common::CommandRunner> m_runner;
        std::chrono::seconds m_pingTimeout;
        std::chrono::milliseconds m_processTimeout;
    };

    // Non-blocking connect() bounded by poll(); true once the handshake completes.
    bool TcpConnect(const std::string &ip, int port, std::chrono::milliseconds timeout);
}
