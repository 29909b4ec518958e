// File: src/storage/file_snapshot_store.cpp
#include "storage/file_snapshot_store.hpp"
#include "storage/storage_error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace engram {

namespace fs = std::filesystem;

FileSnapshotStore::FileSnapshotStore(const std::string& directory,
                                     const SigelSerializer::Config& serializer_config)
    : SnapshotStore(serializer_config),
      directory_(directory) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StorageError("Failed to create snapshot directory '" + directory + "': " + ec.message());
    }
}

fs::path FileSnapshotStore::PathFor(const std::string& name) const {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        throw StorageError("Invalid snapshot name: '" + name + "'");
    }
    return directory_ / (name + kExtension);
}

void FileSnapshotStore::Save(const Sigel& sigel) {
    const fs::path target = PathFor(sigel.GetName());
    const std::string document = serializer_.Serialize(sigel);

    std::lock_guard<std::mutex> lock(mutex_);

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("Failed to open " + temp.string() + " for writing");
        }
        out << document;
        out.flush();
        if (!out) {
            throw StorageError("Failed to write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw StorageError("Failed to move snapshot into place at " + target.string());
    }

    spdlog::info("Saved '{}' to {} ({} bytes)", sigel.GetName(), target.string(), document.size());
}

Sigel FileSnapshotStore::Load(const std::string& name) {
    const fs::path path = PathFor(name);

    std::string document;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw StorageError("No snapshot named '" + name + "' in " + directory_.string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        document = buffer.str();
    }

    Sigel sigel = serializer_.Deserialize(document);
    spdlog::info("Loaded '{}' from {}", name, path.string());
    return sigel;
}

bool FileSnapshotStore::Exists(const std::string& name) const {
    std::error_code ec;
    return fs::is_regular_file(PathFor(name), ec);
}

std::vector<std::string> FileSnapshotStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        if (it->is_regular_file() && path.extension() == kExtension) {
            names.push_back(path.stem().string());
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + directory_.string() + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

bool FileSnapshotStore::Remove(const std::string& name) {
    const fs::path path = PathFor(name);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw StorageError("Failed to remove " + path.string() + ": " + ec.message());
    }
    return removed;
}

} // namespace engram
