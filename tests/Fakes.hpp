#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/CommandRunner.hpp"
#include "discovery/HostCheck.hpp"
#include "storage/DeviceStorage.hpp"

namespace netwake::testing
{
    inline std::string JoinArgs(const std::vector<std::string> &argv)
    {
        std::string joined;
        for (const auto &arg : argv)
        {
            if (!joined.empty())
                joined += ' ';
            joined += arg;
        }
        return joined;
    }

    // Scripted command output keyed by the full command line.
    class FakeCommandRunner : public common::CommandRunner
    {
    public:
        void Script(const std::string &commandLine, int exitCode, const std::string &output)
        {
            common::CommandResult result;
            result.started = true;
            result.exit_code = exitCode;
            result.output = output;
            m_results[commandLine] = result;
        }

        common::CommandResult Run(const std::vector<std::string> &argv,
                                  std::chrono::milliseconds) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::string line = JoinArgs(argv);
            m_calls.push_back(line);
            auto it = m_results.find(line);
            if (it == m_results.end())
                return common::CommandResult{};
            return it->second;
        }

        std::vector<std::string> Calls() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, common::CommandResult> m_results;
        std::vector<std::string> m_calls;
    };

    class FakeHostCheck : public discovery::HostCheck
    {
    public:
        std::set<std::string> pingable;
        std::map<std::string, std::set<int>> open_ports;
        std::set<std::string> throwing;
        std::atomic<int> port_checks{0};

        bool Ping(const std::string &ip) override
        {
            if (throwing.count(ip))
                throw std::runtime_error("ping exploded");
            return pingable.count(ip) > 0;
        }

        bool IsPortOpen(const std::string &ip, int port, std::chrono::milliseconds) override
        {
            ++port_checks;
            if (throwing.count(ip))
                throw std::runtime_error("connect exploded");
            auto it = open_ports.find(ip);
            return it != open_ports.end() && it->second.count(port) > 0;
        }
    };

    class MemoryStorage : public storage::DeviceStorage
    {
    public:
        explicit MemoryStorage(bool writable = true) : m_writable(writable) {}

        common::KnownDeviceStore Load() override { return stored; }

        uint64_t Revision() override { return revision; }

        bool Save(const common::KnownDeviceStore &store) override
        {
            if (!m_writable)
                return false;
            ++saves;
            ++revision;
            stored = store;
            return true;
        }

        storage::SaveResult SaveIfRevision(const common::KnownDeviceStore &store, uint64_t expected) override
        {
            if (!m_writable)
                return storage::SaveResult::Failed;
            if (expected != revision)
            {
                ++conflicts;
                return storage::SaveResult::Conflict;
            }
            Save(store);
            return storage::SaveResult::Saved;
        }

        bool IsWritable() const override { return m_writable; }

        std::optional<std::string> LoadSetting(const std::string &key) override
        {
            auto it = settings.find(key);
            if (it == settings.end())
                return std::nullopt;
            return it->second;
        }

        bool SaveSetting(const std::string &key, const std::string &value) override
        {
            if (!m_writable)
                return false;
            settings[key] = value;
            return true;
        }

        common::KnownDeviceStore stored;
        std::map<std::string, std::string> settings;
        int saves = 0;
        int conflicts = 0;
        uint64_t revision = 0;

    private:
        bool m_writable;
    };

    inline common::Device MakeDevice(const std::string &ip,
                                     common::DeviceStatus status = common::DeviceStatus::Online,
                                     bool pingable = true)
    {
        common::Device device;
        device.ip = ip;
        device.status = status;
        device.pingable = pingable;
        return device;
    }
}
