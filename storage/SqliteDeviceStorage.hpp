#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>
#include "DeviceStorage.hpp"

namespace netwake::storage
{
    enum class AccessMode
    {
        ReadWrite,
        ReadOnly
    };

    class SqliteDeviceStorage : public DeviceStorage
    {
    private:
        std::string path_;
        AccessMode mode_;
        sqlite3 *db_;
        std::mutex db_mutex_;

        bool OpenLocked();
        void CloseLocked();
        std::optional<uint64_t> ReadRevisionLocked();
        SaveResult SaveLocked(const common::KnownDeviceStore &store, std::optional<uint64_t> expected);

    public:
        SqliteDeviceStorage(std::string path, AccessMode mode);
        ~SqliteDeviceStorage() override;

        SqliteDeviceStorage(const SqliteDeviceStorage &) = delete;
        SqliteDeviceStorage &operator=(const SqliteDeviceStorage &) = delete;

        // Opens lazily on first use; safe to call again.
        bool Open();
        void Close();

        common::KnownDeviceStore Load() override;
        uint64_t Revision() override;
        bool Save(const common::KnownDeviceStore &store) override;
        SaveResult SaveIfRevision(const common::KnownDeviceStore &store, uint64_t expected) override;
        bool IsWritable() const override { return mode_ == AccessMode::ReadWrite; }

        std::optional<std::string> LoadSetting(const std::string &key) override;
        bool SaveSetting(const std::string &key, const std::string &value) override;
    };
}
