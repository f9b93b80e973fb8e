#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "../common/Device.hpp"

namespace netwake::storage
{
    enum class SaveResult
    {
        Saved,
        Conflict,
        Failed
    };

    // Durable home of the KnownDeviceStore. Implementations report their own
    // failures and answer with an empty store or false instead of throwing.
    class DeviceStorage
    {
    public:
        virtual ~DeviceStorage() = default;

        virtual common::KnownDeviceStore Load() = 0;

        // Counter bumped by every successful save; 0 until the first one.
        virtual uint64_t Revision() = 0;

        // Replaces everything previously saved.
        virtual bool Save(const common::KnownDeviceStore &store) = 0;

        // Same as Save, but only while the stored revision is still `expected`.
        // Otherwise nothing is written and Conflict is returned.
        virtual SaveResult SaveIfRevision(const common::KnownDeviceStore &store, uint64_t expected) = 0;

        virtual bool IsWritable() const = 0;

        virtual std::optional<std::string> LoadSetting(const std::string &key) = 0;
        virtual bool SaveSetting(const std::string &key, const std::string &value) = 0;
    };
}
