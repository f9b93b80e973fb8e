#include "VendorLookup.hpp"
#include "../common/Debug.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

namespace netwake::discovery
{
    namespace
    {
        std::string Trim(const std::string &text)
        {
            auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        std::string ToUpper(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return text;
        }

        std::vector<std::string> SplitGroups(const std::string &mac)
        {
            std::vector<std::string> groups;
            std::stringstream ss(mac);
            std::string group;
            while (std::getline(ss, group, ':'))
                groups.push_back(group);
            return groups;
        }

        // "00AABB" -> "00:AA:BB"; anything else is returned unchanged.
        std::string ColonPrefix(const std::string &prefix)
        {
            if (prefix.size() != 6)
                return prefix;
            return prefix.substr(0, 2) + ":" + prefix.substr(2, 2) + ":" + prefix.substr(4, 2);
        }
    }

    std::optional<std::string> OuiPrefix(const std::string &mac)
    {
        auto groups = SplitGroups(mac);
        if (groups.size() < 3)
            return std::nullopt;
        return ToUpper(groups[0] + groups[1] + groups[2]);
    }

    VendorLookup::VendorLookup(std::string databasePath)
        : m_path(std::move(databasePath))
    {
    }

    std::optional<std::string> VendorLookup::FallbackVendor(const std::string &colonPrefix)
    {
        static const std::map<std::string, std::string> common_vendors = {
            {"00:50:56", "VMware"},
            {"00:0C:29", "VMware"},
            {"00:1A:11", "Google"},
            {"00:16:3E", "Xen"},
            {"52:54:00", "QEMU"},
            {"08:00:27", "VirtualBox"},
            {"0E:C6:63", "ASIX ELECTRONICS CORP."}};

        auto it = common_vendors.find(ToUpper(colonPrefix));
        if (it == common_vendors.end())
            return std::nullopt;
        return it->second;
    }

    void VendorLookup::EnsureLoaded()
    {
        if (m_loaded)
            return;
        m_loaded = true;

        std::ifstream file(m_path);
        if (!file.is_open())
        {
            if (common::DebugEnabled())
                std::cerr << "[Vendor] OUI database not available at " << m_path << "\n";
            return;
        }

        std::string line;
        while (std::getline(file, line))
        {
            line = Trim(line);
            if (!line.empty())
                m_lines.push_back(line);
        }

        if (file.bad())
            std::cerr << "[Vendor] OUI database read error: " << m_path << "\n";
    }

    std::optional<std::string> VendorLookup::SearchDatabase(const std::string &prefix) const
    {
        for (const auto &line : m_lines)
        {
            if (line.find(prefix) == std::string::npos)
                continue;

            auto tab = line.find('\t');
            if (tab == std::string::npos)
                continue;

            std::string rest = line.substr(tab + 1);
            std::string vendor = Trim(rest.substr(0, rest.find('\t')));
            if (!vendor.empty())
                return vendor;
        }
        return std::nullopt;
    }

    std::string VendorLookup::Lookup(const std::string &mac)
    {
        auto oui = OuiPrefix(mac);
        if (!oui)
            return kUnknownVendor;
        const std::string &prefix = *oui;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto cached = m_cache.find(prefix);
        if (cached != m_cache.end())
            return cached->second;

        EnsureLoaded();

        std::string vendor = kUnknownVendor;
        if (auto found = SearchDatabase(prefix))
            vendor = *found;
        else if (auto fallback = FallbackVendor(ColonPrefix(prefix)))
            vendor = *fallback;

        m_cache[prefix] = vendor;
        return vendor;
    }
}
