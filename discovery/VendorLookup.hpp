#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netwake::discovery
{
    constexpr const char *kUnknownVendor = "unknown";

    // "00:3E:E1:B7:57:54" -> "003EE1". Returns nullopt for fewer than three groups.
    std::optional<std::string> OuiPrefix(const std::string &mac);

    // OUI -> vendor name from a tab-separated "<prefix>\t<vendor>" file, with a small
    // built-in table of virtualization vendors as fallback.
    class VendorLookup
    {
    public:
        explicit VendorLookup(std::string databasePath);

        // Vendor name, or kUnknownVendor.
        std::string Lookup(const std::string &mac);

        static std::optional<std::string> FallbackVendor(const std::string &colonPrefix);

    private:
        void EnsureLoaded();
        std::optional<std::string> SearchDatabase(const std::string &prefix) const;

        std::string m_path;
        std::mutex m_mutex;
        bool m_loaded = false;
        std::vector<std::string> m_lines;
        std::unordered_map<std::string, std::string> m_cache;
    };
}
