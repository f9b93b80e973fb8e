#include "SqliteDeviceStorage.hpp"
#include "../common/Debug.hpp"

#include <iostream>

namespace netwake::storage
{
    namespace
    {
        void BindOptional(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
        {
            if (common::HasValue(value))
                sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(stmt, index);
        }

        std::optional<std::string> ColumnOptional(sqlite3_stmt *stmt, int index)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
            if (!text || text[0] == '\0')
                return std::nullopt;
            return std::string(text);
        }

        std::string ColumnText(sqlite3_stmt *stmt, int index)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
            return text ? std::string(text) : std::string();
        }

        bool Exec(sqlite3 *db, const char *sql)
        {
            char *err_msg = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
            {
                std::cerr << "[Storage] " << (err_msg ? err_msg : sqlite3_errmsg(db)) << std::endl;
                sqlite3_free(err_msg);
                return false;
            }
            return true;
        }

        constexpr const char *kRevisionKey = "store_revision";
    }

    SqliteDeviceStorage::SqliteDeviceStorage(std::string path, AccessMode mode)
        : path_(std::move(path)), mode_(mode), db_(nullptr)
    {
    }

    SqliteDeviceStorage::~SqliteDeviceStorage()
    {
        Close();
    }

    bool SqliteDeviceStorage::Open()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return OpenLocked();
    }

    void SqliteDeviceStorage::Close()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        CloseLocked();
    }

    bool SqliteDeviceStorage::OpenLocked()
    {
        if (db_)
            return true;

        const int flags = mode_ == AccessMode::ReadOnly
                              ? SQLITE_OPEN_READONLY
                              : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

        int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            // A reader that finds no database yet simply has no history.
            if (mode_ == AccessMode::ReadOnly && rc == SQLITE_CANTOPEN)
            {
                if (common::DebugEnabled())
                    std::cerr << "[Storage] No database at " << path_ << std::endl;
            }
            else
            {
                std::cerr << "[Storage] Open failed: " << (db_ ? sqlite3_errmsg(db_) : "out of memory") << std::endl;
            }
            CloseLocked();
            return false;
        }

        sqlite3_busy_timeout(db_, 2000);

        if (mode_ == AccessMode::ReadOnly)
            return true;

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS known_devices ("
            "interface TEXT NOT NULL, "
            "position INTEGER NOT NULL, "
            "ip TEXT NOT NULL, "
            "hostname TEXT, "
            "mac TEXT, "
            "vendor TEXT, "
            "status TEXT NOT NULL DEFAULT 'offline', "
            "pingable INTEGER NOT NULL DEFAULT 0, "
            "last_seen REAL NOT NULL DEFAULT 0, "
            "network_context TEXT NOT NULL DEFAULT 'primary', "
            "UNIQUE(interface, ip)"
            ");"

            "CREATE TABLE IF NOT EXISTS settings ("
            "key TEXT PRIMARY KEY, "
            "value TEXT"
            ");";

        if (!Exec(db_, sql_tables))
        {
            CloseLocked();
            return false;
        }
        return true;
    }

    void SqliteDeviceStorage::CloseLocked()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    common::KnownDeviceStore SqliteDeviceStorage::Load()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        common::KnownDeviceStore store;
        if (!OpenLocked())
            return store;

        const char *sql = "SELECT interface, ip, hostname, mac, vendor, status, pingable, last_seen, network_context "
                          "FROM known_devices ORDER BY interface, position;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            // A reader opened before the first save sees no table.
            if (common::DebugEnabled() || mode_ == AccessMode::ReadWrite)
                std::cerr << "[Storage] Load failed: " << sqlite3_errmsg(db_) << std::endl;
            return store;
        }

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            common::Device d;
            std::string iface = ColumnText(stmt, 0);
            d.ip = ColumnText(stmt, 1);
            d.hostname = ColumnOptional(stmt, 2);
            d.mac = ColumnOptional(stmt, 3);
            d.vendor = ColumnOptional(stmt, 4);
            d.status = common::ParseStatus(ColumnText(stmt, 5));
            d.pingable = sqlite3_column_int(stmt, 6) != 0;
            d.last_seen = sqlite3_column_double(stmt, 7);
            d.network_context = common::ParseContext(ColumnText(stmt, 8));
            d.current_scan = false;
            if (d.ip.empty() || d.status == common::DeviceStatus::Hidden)
                continue;
            store[iface].push_back(d);
        }
        if (rc != SQLITE_DONE)
        {
            std::cerr << "[Storage] Load interrupted: " << sqlite3_errmsg(db_) << std::endl;
            store.clear();
        }
        sqlite3_finalize(stmt);
        return store;
    }

    std::optional<uint64_t> SqliteDeviceStorage::ReadRevisionLocked()
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;
        sqlite3_bind_text(stmt, 1, kRevisionKey, -1, SQLITE_STATIC);

        std::optional<uint64_t> revision = 0;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
            revision = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        else if (rc != SQLITE_DONE)
            revision = std::nullopt;
        sqlite3_finalize(stmt);
        return revision;
    }

    uint64_t SqliteDeviceStorage::Revision()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!OpenLocked())
            return 0;
        // A reader opened before the first save has no settings table yet.
        return ReadRevisionLocked().value_or(0);
    }

    bool SqliteDeviceStorage::Save(const common::KnownDeviceStore &store)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return SaveLocked(store, std::nullopt) == SaveResult::Saved;
    }

    SaveResult SqliteDeviceStorage::SaveIfRevision(const common::KnownDeviceStore &store, uint64_t expected)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return SaveLocked(store, expected);
    }

    SaveResult SqliteDeviceStorage::SaveLocked(const common::KnownDeviceStore &store, std::optional<uint64_t> expected)
    {
        if (mode_ != AccessMode::ReadWrite)
        {
            std::cerr << "[Storage] Refusing to write through a read-only handle" << std::endl;
            return SaveResult::Failed;
        }
        if (!OpenLocked())
            return SaveResult::Failed;

        if (!Exec(db_, "BEGIN IMMEDIATE;"))
            return SaveResult::Failed;

        std::optional<uint64_t> current = ReadRevisionLocked();
        if (!current)
        {
            std::cerr << "[Storage] Cannot read store revision: " << sqlite3_errmsg(db_) << std::endl;
            Exec(db_, "ROLLBACK;");
            return SaveResult::Failed;
        }
        if (expected && *current != *expected)
        {
            if (common::DebugEnabled())
                std::cerr << "[Storage] Store revision is " << *current << ", expected " << *expected << std::endl;
            Exec(db_, "ROLLBACK;");
            return SaveResult::Conflict;
        }

        if (!Exec(db_, "DELETE FROM known_devices;"))
        {
            Exec(db_, "ROLLBACK;");
            return SaveResult::Failed;
        }

        const char *sql = "INSERT OR REPLACE INTO known_devices "
                          "(interface, position, ip, hostname, mac, vendor, status, pingable, last_seen, network_context) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Storage] Save failed: " << sqlite3_errmsg(db_) << std::endl;
            Exec(db_, "ROLLBACK;");
            return SaveResult::Failed;
        }

        bool ok = true;
        for (const auto &[iface, devices] : store)
        {
            int position = 0;
            for (const auto &d : devices)
            {
                if (d.ip.empty() || d.status == common::DeviceStatus::Hidden)
                    continue;

                sqlite3_bind_text(stmt, 1, iface.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int(stmt, 2, position++);
                sqlite3_bind_text(stmt, 3, d.ip.c_str(), -1, SQLITE_TRANSIENT);
                BindOptional(stmt, 4, d.hostname);
                BindOptional(stmt, 5, d.mac);
                BindOptional(stmt, 6, d.vendor);
                sqlite3_bind_text(stmt, 7, common::ToString(d.status), -1, SQLITE_STATIC);
                sqlite3_bind_int(stmt, 8, d.pingable ? 1 : 0);
                sqlite3_bind_double(stmt, 9, d.last_seen);
                sqlite3_bind_text(stmt, 10, common::ToString(d.network_context), -1, SQLITE_STATIC);

                if (sqlite3_step(stmt) != SQLITE_DONE)
                {
                    std::cerr << "[Storage] Insert of " << d.ip << " failed: " << sqlite3_errmsg(db_) << std::endl;
                    ok = false;
                }
                sqlite3_reset(stmt);
                sqlite3_clear_bindings(stmt);
                if (!ok)
                    break;
            }
            if (!ok)
                break;
        }
        sqlite3_finalize(stmt);

        if (ok)
        {
            if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK)
            {
                std::cerr << "[Storage] Revision update failed: " << sqlite3_errmsg(db_) << std::endl;
                ok = false;
            }
            else
            {
                sqlite3_bind_text(stmt, 1, kRevisionKey, -1, SQLITE_STATIC);
                sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(*current + 1));
                ok = sqlite3_step(stmt) == SQLITE_DONE;
                if (!ok)
                    std::cerr << "[Storage] Revision update failed: " << sqlite3_errmsg(db_) << std::endl;
                sqlite3_finalize(stmt);
            }
        }

        if (!ok)
        {
            Exec(db_, "ROLLBACK;");
            return SaveResult::Failed;
        }

        // A failed COMMIT can leave the transaction open; later BEGINs would fail.
        if (!Exec(db_, "COMMIT;"))
        {
            if (!sqlite3_get_autocommit(db_))
                Exec(db_, "ROLLBACK;");
            return SaveResult::Failed;
        }
        return SaveResult::Saved;
    }

    std::optional<std::string> SqliteDeviceStorage::LoadSetting(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!OpenLocked())
            return std::nullopt;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<std::string> result = std::nullopt;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = ColumnText(stmt, 0);
        sqlite3_finalize(stmt);
        return result;
    }

    bool SqliteDeviceStorage::SaveSetting(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (mode_ != AccessMode::ReadWrite || !OpenLocked())
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Storage] Setting " << key << " not saved: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }
}
