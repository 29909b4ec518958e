// File: src/storage/snapshot_store.cpp
#include "storage/snapshot_store.hpp"
#include "storage/file_snapshot_store.hpp"
#include "storage/sqlite_snapshot_store.hpp"
#include <stdexcept>

namespace engram {

std::unique_ptr<SnapshotStore> CreateSnapshotStore(
    const std::string& type,
    const std::string& state_dir,
    const std::string& db_path,
    const SigelSerializer::Config& serializer_config) {

    if (type == "file") {
        return std::make_unique<FileSnapshotStore>(state_dir, serializer_config);
    }

    if (type == "sqlite") {
        SqliteSnapshotStore::Config config;
        config.db_path = db_path;
        return std::make_unique<SqliteSnapshotStore>(config, serializer_config);
    }

    throw std::invalid_argument("Unknown snapshot store type: " + type);
}

} // namespace engram
