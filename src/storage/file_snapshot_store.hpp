// File: src/storage/file_snapshot_store.hpp
#pragma once

#include "storage/snapshot_store.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace engram {

/// Directory of JSON snapshot files, one `<name>.sig` per Sigel
///
/// Writes go to a temporary file in the same directory that is then
/// renamed over the target, so a reader never sees a half-written file.
class FileSnapshotStore : public SnapshotStore {
public:
    static constexpr const char* kExtension = ".sig";

    /// Creates directory if needed
    /// @throws StorageError if the directory cannot be created
    explicit FileSnapshotStore(const std::string& directory,
                               const SigelSerializer::Config& serializer_config = {});

    void Save(const Sigel& sigel) override;
    Sigel Load(const std::string& name) override;
    bool Exists(const std::string& name) const override;
    std::vector<std::string> List() const override;
    bool Remove(const std::string& name) override;

    /// Path the snapshot of name lives at
    /// @throws StorageError if name is empty or contains a path separator
    std::filesystem::path PathFor(const std::string& name) const;

    const std::filesystem::path& GetDirectory() const { return directory_; }

private:
    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace engram
