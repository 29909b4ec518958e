// File: tests/storage/sqlite_snapshot_store_test.cpp
#include "storage/sqlite_snapshot_store.hpp"
#include "storage/storage_error.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>

namespace engram {
namespace {

namespace fs = std::filesystem;

Sigel MakeSigel(const std::string& name) {
    Sigel sigel(name);
    sigel.AddMemory("the cat sat on the mat", "story", 0.4);
    sigel.Vocabulary().Learn("cat", "the sat");
    sigel.Patterns().Reinforce("cat sat", 0.75);
    return sigel;
}

SqliteSnapshotStore::Config InMemory() {
    SqliteSnapshotStore::Config config;
    config.db_path = ":memory:";
    return config;
}

TEST(SqliteSnapshotStoreTest, SaveAndLoad) {
    SqliteSnapshotStore store(InMemory());
    Sigel original = MakeSigel("alpha");

    store.Save(original);

    ASSERT_TRUE(store.Exists("alpha"));
    Sigel loaded = store.Load("alpha");
    EXPECT_EQ(original.GetId(), loaded.GetId());
    EXPECT_EQ(1u, loaded.Episodes().Size());
    EXPECT_DOUBLE_EQ(0.75, loaded.Patterns().GetStrength("cat sat"));
    EXPECT_TRUE(loaded.Vocabulary().Contains("cat"));
}

TEST(SqliteSnapshotStoreTest, SaveReplacesRow) {
    SqliteSnapshotStore store(InMemory());
    Sigel sigel = MakeSigel("alpha");
    store.Save(sigel);

    sigel.Patterns().Reinforce("cat sat", 0.25);
    store.Save(sigel);

    EXPECT_EQ(1u, store.List().size());
    EXPECT_DOUBLE_EQ(1.0, store.Load("alpha").Patterns().GetStrength("cat sat"));
}

TEST(SqliteSnapshotStoreTest, ListAndRemove) {
    SqliteSnapshotStore store(InMemory());
    store.Save(MakeSigel("beta"));
    store.Save(MakeSigel("alpha"));

    std::vector<std::string> expected = {"alpha", "beta"};
    EXPECT_EQ(expected, store.List());

    EXPECT_TRUE(store.Remove("beta"));
    EXPECT_FALSE(store.Remove("beta"));
    EXPECT_FALSE(store.Exists("beta"));
    EXPECT_EQ(1u, store.List().size());
}

TEST(SqliteSnapshotStoreTest, LoadMissingThrows) {
    SqliteSnapshotStore store(InMemory());
    EXPECT_THROW(store.Load("missing"), StorageError);
}

TEST(SqliteSnapshotStoreTest, SavedAtTracksLastSave) {
    SqliteSnapshotStore store(InMemory());
    Timestamp before = Timestamp::Now();

    store.Save(MakeSigel("alpha"));

    Timestamp saved = store.SavedAt("alpha");
    EXPECT_GE(saved.ToMicros(), before.ToMicros());
    EXPECT_LE(saved.ToMicros(), Timestamp::Now().ToMicros());
    EXPECT_THROW(store.SavedAt("missing"), StorageError);
}

TEST(SqliteSnapshotStoreTest, InvalidSynchronousModeThrows) {
    SqliteSnapshotStore::Config config = InMemory();
    config.synchronous = "SOMETIMES";
    EXPECT_THROW(SqliteSnapshotStore store(config), StorageError);
}

TEST(SqliteSnapshotStoreTest, PersistsAcrossConnections) {
    fs::path db = fs::temp_directory_path() / ("engram_sqlite_" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");
    SqliteSnapshotStore::Config config;
    config.db_path = db.string();

    MemoryID id;
    {
        SqliteSnapshotStore store(config);
        Sigel sigel = MakeSigel("alpha");
        id = sigel.Episodes().All().front().id;
        store.Save(sigel);
    }
    {
        auto store = CreateSnapshotStore("sqlite", "", db.string());
        Sigel loaded = store->Load("alpha");
        ASSERT_EQ(1u, loaded.Episodes().Size());
        EXPECT_EQ(id, loaded.Episodes().All().front().id);
    }

    std::error_code ec;
    fs::remove(db, ec);
    fs::remove(db.string() + "-wal", ec);
    fs::remove(db.string() + "-shm", ec);
}

} // namespace
} // namespace engram
