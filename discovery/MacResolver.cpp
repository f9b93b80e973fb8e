#include "MacResolver.hpp"
#include "../common/Debug.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <sstream>

namespace netwake::discovery
{
    namespace
    {
        const std::chrono::seconds kArpTimeout{2};

        const std::regex &MacPattern()
        {
            static const std::regex pattern("([0-9a-fA-F]{1,2}[:-]){5}[0-9a-fA-F]{1,2}");
            return pattern;
        }

        std::string ToUpper(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return text;
        }

        std::string WithColons(const std::string &hex12)
        {
            std::string formatted;
            for (size_t i = 0; i < 12; i += 2)
            {
                if (i > 0)
                    formatted += ':';
                formatted += hex12.substr(i, 2);
            }
            return formatted;
        }

        bool ContainsMac(const std::string &text)
        {
            return std::regex_search(text, MacPattern());
        }

        bool IsBlank(const std::string &text)
        {
            return std::all_of(text.begin(), text.end(),
                               [](unsigned char c)
                               { return std::isspace(c) != 0; });
        }
    }

    std::string PadMacAddress(const std::string &mac)
    {
        if (mac.empty())
            return mac;

        std::string clean;
        for (char c : mac)
        {
            if (c != ':' && c != '-')
                clean += c;
        }
        clean = ToUpper(clean);

        if (clean.size() == 12)
            return WithColons(clean);

        if (clean.size() < 12)
        {
            size_t needed = 12 - clean.size();
            std::string padded = std::string(needed, '0') + clean;
            std::string formatted = WithColons(padded);
            if (common::DebugEnabled())
            {
                std::cerr << "[MacResolver] Padding applied: " << mac << " -> " << formatted
                          << " (added " << needed << " leading zeros)\n";
            }
            return formatted;
        }

        if (common::DebugEnabled())
        {
            std::cerr << "[MacResolver] " << mac << " has " << clean.size()
                      << " characters, truncating to 12\n";
        }
        return WithColons(clean.substr(0, 12));
    }

    std::optional<std::string> ExtractMac(const std::string &text)
    {
        std::smatch match;
        if (!std::regex_search(text, match, MacPattern()))
            return std::nullopt;

        std::string mac = ToUpper(match.str(0));
        std::replace(mac.begin(), mac.end(), '-', ':');
        return PadMacAddress(mac);
    }

    MacResolver::MacResolver(std::shared_ptr<common::CommandRunner> runner)
        : m_runner(std::move(runner))
    {
    }

    std::optional<std::string> MacResolver::QueryDirect(const std::string &ip) const
    {
#ifdef _WIN32
        std::vector<std::string> cmd = {"arp", "-a", ip};
#else
        std::vector<std::string> cmd = {"arp", "-n", ip};
#endif
        common::CommandResult result = m_runner->Run(cmd, kArpTimeout);
        if (!result.Succeeded() || IsBlank(result.output))
            return std::nullopt;
        if (!ContainsMac(result.output))
            return std::nullopt;
        return ExtractMac(result.output);
    }

    std::optional<std::string> MacResolver::ScanFullTable(const std::string &ip) const
    {
        common::CommandResult result = m_runner->Run({"arp", "-a"}, kArpTimeout);
        if (!result.Succeeded() || result.output.find(ip) == std::string::npos)
            return std::nullopt;

        std::istringstream ss(result.output);
        std::string line;
        while (std::getline(ss, line))
        {
            if (line.find(ip) == std::string::npos)
                continue;
            auto mac = ExtractMac(line);
            if (mac)
                return mac;
        }
        return std::nullopt;
    }

    std::optional<std::string> MacResolver::Resolve(const std::string &ip) const
    {
        if (!m_runner)
            return std::nullopt;

        try
        {
            auto mac = QueryDirect(ip);
            if (mac)
                return mac;
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[MacResolver] Direct query for " << ip << " failed: " << e.what() << "\n";
        }

        try
        {
            return ScanFullTable(ip);
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[MacResolver] Table scan for " << ip << " failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
