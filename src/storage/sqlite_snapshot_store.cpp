// File: src/storage/sqlite_snapshot_store.cpp
#include "storage/sqlite_snapshot_store.hpp"
#include "storage/storage_error.hpp"
#include <spdlog/spdlog.h>

namespace engram {

namespace {

/// Finalizes a prepared statement on scope exit
class StatementGuard {
public:
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() { sqlite3_finalize(stmt_); }

    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_;
};

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteSnapshotStore::SqliteSnapshotStore(const Config& config,
                                         const SigelSerializer::Config& serializer_config)
    : SnapshotStore(serializer_config),
      config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database '" + config_.db_path + "': " + error);
    }

    try {
        InitializeDatabase();
    } catch (const StorageError&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteSnapshotStore::~SqliteSnapshotStore() {
    if (db_) {
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            spdlog::warn("Closing snapshot database '{}' failed", config_.db_path);
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteSnapshotStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Do not wait forever on a locked database
    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    if (config_.synchronous != "FULL" && config_.synchronous != "NORMAL" && config_.synchronous != "OFF") {
        throw StorageError("Invalid synchronous mode: " + config_.synchronous);
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS sigels (
            name TEXT PRIMARY KEY,
            saved_at INTEGER NOT NULL,
            document TEXT NOT NULL
        );
    )");
}

void SqliteSnapshotStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
        sqlite3_free(error_msg);
        throw StorageError("SQL failed: " + error);
    }
}

sqlite3_stmt* SqliteSnapshotStore::Prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Fail("prepare");
    }
    return stmt;
}

void SqliteSnapshotStore::Fail(const std::string& what) const {
    throw StorageError("Snapshot database " + what + " failed: " + sqlite3_errmsg(db_));
}

// ============================================================================
// SnapshotStore Interface Implementation
// ============================================================================

void SqliteSnapshotStore::Save(const Sigel& sigel) {
    const std::string document = serializer_.Serialize(sigel);

    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard stmt(Prepare(
        "INSERT OR REPLACE INTO sigels (name, saved_at, document) VALUES (?, ?, ?);"));
    BindText(stmt.get(), 1, sigel.GetName());
    sqlite3_bind_int64(stmt.get(), 2, Timestamp::Now().ToMicros());
    BindText(stmt.get(), 3, document);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        Fail("save of '" + sigel.GetName() + "'");
    }

    spdlog::info("Saved '{}' to {} ({} bytes)", sigel.GetName(), config_.db_path, document.size());
}

Sigel SqliteSnapshotStore::Load(const std::string& name) {
    std::string document;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        StatementGuard stmt(Prepare("SELECT document FROM sigels WHERE name = ?;"));
        BindText(stmt.get(), 1, name);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            throw StorageError("No snapshot named '" + name + "' in " + config_.db_path);
        }
        if (rc != SQLITE_ROW) {
            Fail("load of '" + name + "'");
        }

        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        int size = sqlite3_column_bytes(stmt.get(), 0);
        if (text) {
            document.assign(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
        }
    }

    Sigel sigel = serializer_.Deserialize(document);
    spdlog::info("Loaded '{}' from {}", name, config_.db_path);
    return sigel;
}

bool SqliteSnapshotStore::Exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard stmt(Prepare("SELECT 1 FROM sigels WHERE name = ? LIMIT 1;"));
    BindText(stmt.get(), 1, name);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        Fail("lookup");
    }
    return rc == SQLITE_ROW;
}

std::vector<std::string> SqliteSnapshotStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard stmt(Prepare("SELECT name FROM sigels ORDER BY name;"));

    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        names.emplace_back(text ? reinterpret_cast<const char*>(text) : "");
    }
    if (rc != SQLITE_DONE) {
        Fail("listing");
    }
    return names;
}

bool SqliteSnapshotStore::Remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard stmt(Prepare("DELETE FROM sigels WHERE name = ?;"));
    BindText(stmt.get(), 1, name);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        Fail("removal of '" + name + "'");
    }
    return sqlite3_changes(db_) > 0;
}

Timestamp SqliteSnapshotStore::SavedAt(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard stmt(Prepare("SELECT saved_at FROM sigels WHERE name = ?;"));
    BindText(stmt.get(), 1, name);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageError("No snapshot named '" + name + "'");
    }
    return Timestamp::FromMicros(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace engram
