// File: tests/integration/integration_test.cpp
//
// Integration tests for Engram.
// Tests end-to-end workflows and component interactions.

#include "core/memory_engine.hpp"
#include "storage/file_snapshot_store.hpp"
#include "storage/sqlite_snapshot_store.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>

namespace engram {
namespace {

namespace fs = std::filesystem;

const char* kCorpus =
    "the river runs past the old mill every morning. "
    "the old mill stands beside the river near the village. "
    "children play near the village square after school ends. "
    "the village square holds a market every single week. "
    "farmers bring fresh vegetables to the weekly market stalls. "
    "the morning market opens before most people wake up.";

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.name = "integration";
        config_.learning.min_sample_size = 20;
        config_.learning.max_sample_size = 50;
        now_ = Timestamp::FromMicros(1700000000000000);

        directory_ = fs::temp_directory_path() / ("engram_integration_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(directory_, ec);
    }

    MemoryEngine::Config config_;
    Timestamp now_;
    fs::path directory_;
};

// ============================================================================
// Consolidation Scenario
// ============================================================================

TEST_F(IntegrationTest, SimilarSentencesClusterTogether) {
    Sigel sigel("integration");
    sigel.AddMemory("the cat sat on the mat", "story", 0.0, now_);
    sigel.AddMemory("the cat sat on the rug", "story", 0.0, now_);
    sigel.AddMemory("quantum fields are interesting", "story", 0.0, now_);

    MemoryEngine engine(config_, std::move(sigel), now_);
    auto report = engine.Consolidate(now_);

    EXPECT_EQ(3u, report.memories_analyzed);
    EXPECT_EQ(2u, report.clusters_formed);
    EXPECT_EQ(0u, report.memories_retained);

    Sigel after = engine.Snapshot();
    ASSERT_EQ(2u, after.Episodes().Size());

    std::vector<std::string> contents;
    for (const auto& memory : after.Episodes()) {
        contents.push_back(memory.content);
    }
    std::sort(contents.begin(), contents.end());
    EXPECT_EQ("Consolidated memory cluster about general with 2 related memories", contents[0]);
    EXPECT_EQ("Consolidated memory cluster about quantum_fields_interesting with 1 related memories",
              contents[1]);

    // Summary words join the semantic network
    const auto& neighbors = after.Patterns().Neighbors("consolidated");
    EXPECT_NE(neighbors.end(), std::find(neighbors.begin(), neighbors.end(), "cluster"));
}

TEST_F(IntegrationTest, RepeatedConsolidationConverges) {
    MemoryEngine engine(config_, now_);
    engine.Ingest(kCorpus, "village");

    auto first = engine.Consolidate(now_);
    auto second = engine.Consolidate(now_ + std::chrono::hours(1));
    auto third = engine.Consolidate(now_ + std::chrono::hours(2));

    EXPECT_GT(first.memories_analyzed, 0u);
    EXPECT_LE(second.clusters_formed, first.clusters_formed);
    EXPECT_LE(third.clusters_formed, second.clusters_formed);
    EXPECT_EQ(3u, engine.GetStatistics().consolidation_passes);

    Sigel sigel = engine.Snapshot();
    sigel.Patterns().ForEachPattern([this](const std::string& pattern, double strength) {
        EXPECT_GT(strength, config_.consolidation.prune_threshold) << pattern;
    });
}

// ============================================================================
// Learning and Persistence
// ============================================================================

TEST_F(IntegrationTest, PredictionSurvivesFileSnapshot) {
    MemoryEngine engine(config_, now_);
    engine.Ingest("red green blue yellow", "colors");
    engine.Ingest(kCorpus, "village");
    engine.Consolidate(now_);

    FileSnapshotStore store(directory_.string());
    store.Save(engine.Snapshot());

    MemoryEngine restored(config_, store.Load("integration"), now_);
    auto before = engine.GetStatistics();
    auto after = restored.GetStatistics();

    EXPECT_EQ(before.vocabulary_size, after.vocabulary_size);
    EXPECT_EQ(before.pattern_count, after.pattern_count);
    EXPECT_EQ(before.temporal_patterns, after.temporal_patterns);
    EXPECT_EQ(before.episodic_memories, after.episodic_memories);
    EXPECT_EQ(before.training_iterations, after.training_iterations);

    EXPECT_EQ("yellow", restored.PredictNext({"red", "green", "blue"}));
}

TEST_F(IntegrationTest, SqliteSnapshotMatchesFileSnapshot) {
    MemoryEngine engine(config_, now_);
    engine.Ingest(kCorpus, "village");

    FileSnapshotStore files(directory_.string());
    SqliteSnapshotStore::Config db_config;
    db_config.db_path = ":memory:";
    SqliteSnapshotStore database(db_config);

    Sigel snapshot = engine.Snapshot();
    files.Save(snapshot);
    database.Save(snapshot);

    Sigel from_file = files.Load("integration");
    Sigel from_db = database.Load("integration");

    EXPECT_EQ(from_file.GetId(), from_db.GetId());
    EXPECT_EQ(from_file.Episodes().Size(), from_db.Episodes().Size());
    EXPECT_EQ(from_file.Vocabulary().Size(), from_db.Vocabulary().Size());
    EXPECT_EQ(from_file.Patterns().PatternCount(), from_db.Patterns().PatternCount());
}

TEST_F(IntegrationTest, LearningContinuesAfterRestore) {
    MemoryEngine engine(config_, now_);
    engine.Ingest(kCorpus, "village");

    FileSnapshotStore store(directory_.string());
    store.Save(engine.Snapshot());

    MemoryEngine restored(config_, store.Load("integration"), now_);
    size_t memories = restored.GetStatistics().episodic_memories;

    restored.Ingest("the new bridge crosses the river near the mill.", "village");

    EXPECT_EQ(memories + 1, restored.GetStatistics().episodic_memories);

    // Fresh IDs never collide with loaded ones
    Sigel sigel = restored.Snapshot();
    std::vector<MemoryID> ids;
    for (const auto& memory : sigel.Episodes()) {
        ids.push_back(memory.id);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids.end(), std::adjacent_find(ids.begin(), ids.end()));
}

} // namespace
} // namespace engram
