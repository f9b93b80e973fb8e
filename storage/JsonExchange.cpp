#include "JsonExchange.hpp"
#include "../common/Debug.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace netwake::storage
{
    namespace
    {
        constexpr const char *kExportVersion = "1.0";
        constexpr const char *kUnnamedInterface = "imported";

        std::string FormatTimestamp(double seconds)
        {
            std::time_t t = static_cast<std::time_t>(seconds);
            std::tm tm_buf{};
            localtime_r(&t, &tm_buf);
            char buffer[32];
            if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf) == 0)
                return "";
            return buffer;
        }

        void PutOptional(json &j, const char *key, const std::optional<std::string> &value)
        {
            if (common::HasValue(value))
                j[key] = *value;
        }

        std::optional<std::string> GetOptional(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            std::string value = it->get<std::string>();
            if (value.empty())
                return std::nullopt;
            return value;
        }

        json DeviceToJson(const common::Device &device, const std::string &interfaceName)
        {
            json j;
            j["ip"] = device.ip;
            PutOptional(j, "mac", device.mac);
            PutOptional(j, "hostname", device.hostname);
            PutOptional(j, "vendor", device.vendor);
            j["status"] = common::ToString(device.status);
            j["pingable"] = device.pingable;
            if (device.last_seen > 0.0)
                j["last_seen"] = device.last_seen;
            j["network_context"] = common::ToString(device.network_context);
            j["interface"] = interfaceName;
            return j;
        }

        common::Device DeviceFromJson(const json &j)
        {
            common::Device device;
            device.ip = j.at("ip").get<std::string>();
            device.mac = GetOptional(j, "mac");
            device.hostname = GetOptional(j, "hostname");
            device.vendor = GetOptional(j, "vendor");
            device.status = common::ParseStatus(j.value("status", std::string("offline")));
            device.pingable = j.value("pingable", false);
            device.network_context = common::ParseContext(j.value("network_context", std::string("primary")));
            device.current_scan = false;

            // Older exports wrote last_seen as text; those count as never seen.
            auto lastSeen = j.find("last_seen");
            if (lastSeen != j.end() && lastSeen->is_number())
                device.last_seen = lastSeen->get<double>();
            return device;
        }

        void AddEntry(common::KnownDeviceStore &store, const json &entry, const std::string &interfaceName)
        {
            if (!entry.is_object())
                return;
            try
            {
                common::Device device = DeviceFromJson(entry);
                store[interfaceName].push_back(std::move(device));
            }
            catch (const json::exception &e)
            {
                std::cerr << "[Import] Skipping malformed device entry: " << e.what() << "\n";
            }
        }
    }

    std::string ExportJson(const common::KnownDeviceStore &store, bool debugMode, double exportedAt)
    {
        json devices = json::array();
        for (const auto &[name, list] : store)
        {
            for (const auto &device : list)
            {
                if (device.ip.empty() || device.status == common::DeviceStatus::Hidden)
                    continue;
                devices.push_back(DeviceToJson(device, name));
            }
        }

        json document;
        document["export_date"] = FormatTimestamp(exportedAt);
        document["export_version"] = kExportVersion;
        document["total_devices"] = devices.size();
        document["debug_mode"] = debugMode;
        document["scan_history"] = {{"total_devices", devices.size()}, {"last_scan", exportedAt}};
        document["devices"] = std::move(devices);
        return document.dump(2);
    }

    common::KnownDeviceStore ImportJson(const std::string &text)
    {
        json document;
        try
        {
            document = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw std::invalid_argument(std::string("Invalid JSON: ") + e.what());
        }

        if (!document.is_object())
            throw std::invalid_argument("Expected a JSON object at the top level");

        common::KnownDeviceStore store;

        auto devices = document.find("devices");
        if (devices != document.end() && devices->is_array())
        {
            for (const auto &entry : *devices)
            {
                std::string name = kUnnamedInterface;
                if (entry.is_object())
                {
                    auto iface = entry.find("interface");
                    if (iface != entry.end() && iface->is_string() && !iface->get<std::string>().empty())
                        name = iface->get<std::string>();
                }
                AddEntry(store, entry, name);
            }
            return store;
        }

        for (const char *key : {"known_devices", "persistent_data"})
        {
            auto byInterface = document.find(key);
            if (byInterface == document.end() || !byInterface->is_object())
                continue;

            for (const auto &item : byInterface->items())
            {
                const std::string &name = item.key();
                const json &list = item.value();
                if (!list.is_array())
                {
                    if (common::DebugEnabled())
                        std::cerr << "[Import] Ignoring non-list entry for " << name << "\n";
                    continue;
                }
                for (const auto &entry : list)
                    AddEntry(store, entry, name);
            }
            return store;
        }

        throw std::invalid_argument("No \"devices\" array or device map in the document");
    }
}
