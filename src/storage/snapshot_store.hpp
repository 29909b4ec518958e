// File: src/storage/snapshot_store.hpp
#pragma once

#include "core/sigel.hpp"
#include "storage/sigel_serializer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace engram {

/// Abstract interface for Sigel snapshot backends
///
/// A snapshot is the whole Sigel encoded by SigelSerializer, keyed by the
/// Sigel's name. Saving a name that already exists replaces it.
///
/// Failures to read or write throw StorageError; there is no retry.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /// Store sigel under its name, replacing any earlier snapshot
    virtual void Save(const Sigel& sigel) = 0;

    /// @throws StorageError if no snapshot with this name exists or it
    ///         cannot be decoded
    virtual Sigel Load(const std::string& name) = 0;

    virtual bool Exists(const std::string& name) const = 0;

    /// Names of all stored snapshots, sorted
    virtual std::vector<std::string> List() const = 0;

    /// @return true if a snapshot was removed
    virtual bool Remove(const std::string& name) = 0;

protected:
    explicit SnapshotStore(const SigelSerializer::Config& serializer_config)
        : serializer_(serializer_config) {}

    SigelSerializer serializer_;
};

/// Create a snapshot store by type name
/// @param type "file" (state_dir holds <name>.sig files) or "sqlite" (db_path)
/// @throws std::invalid_argument if type is unknown
/// @throws StorageError if the backend cannot be opened
std::unique_ptr<SnapshotStore> CreateSnapshotStore(
    const std::string& type,
    const std::string& state_dir,
    const std::string& db_path,
    const SigelSerializer::Config& serializer_config = {});

} // namespace engram
