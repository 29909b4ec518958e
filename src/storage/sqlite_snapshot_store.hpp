// File: src/storage/sqlite_snapshot_store.hpp
#pragma once

#include "storage/snapshot_store.hpp"
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace engram {

/// Snapshot backend using SQLite
///
/// Each Sigel is one row of
///   sigels(name TEXT PRIMARY KEY, saved_at INTEGER, document TEXT)
/// holding the JSON document. Saving replaces the row in a single
/// statement, so a snapshot is either the old or the new document.
class SqliteSnapshotStore : public SnapshotStore {
public:
    /// Configuration for SqliteSnapshotStore
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private
        /// in-memory database)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws StorageError if the database cannot be opened or initialized
    explicit SqliteSnapshotStore(const Config& config,
                                 const SigelSerializer::Config& serializer_config = {});

    /// Closes the database connection
    ~SqliteSnapshotStore() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
    SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

    void Save(const Sigel& sigel) override;
    Sigel Load(const std::string& name) override;
    bool Exists(const std::string& name) const override;
    std::vector<std::string> List() const override;
    bool Remove(const std::string& name) override;

    /// Microseconds timestamp of the last save of name
    /// @throws StorageError if there is no such snapshot
    Timestamp SavedAt(const std::string& name) const;

private:
    Config config_;

    sqlite3* db_{nullptr};

    mutable std::mutex mutex_;

    void InitializeDatabase();

    /// Execute a statement without results
    /// @throws StorageError on failure
    void ExecuteSQL(const std::string& sql);

    /// Prepare a statement
    /// @throws StorageError on failure
    sqlite3_stmt* Prepare(const char* sql) const;

    [[noreturn]] void Fail(const std::string& what) const;
};

} // namespace engram
