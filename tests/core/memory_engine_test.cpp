// File: tests/core/memory_engine_test.cpp
#include "core/memory_engine.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace engram {
namespace {

class MemoryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.name = "test_engine";
        config_.learning.min_sample_size = 20;
        config_.learning.max_sample_size = 50;
        start_ = Timestamp::Now();
    }

    MemoryEngine::Config config_;
    Timestamp start_;
};

TEST_F(MemoryEngineTest, StartsEmpty) {
    MemoryEngine engine(config_, start_);
    auto stats = engine.GetStatistics();

    EXPECT_EQ("test_engine", engine.GetName());
    EXPECT_EQ(0u, stats.vocabulary_size);
    EXPECT_EQ(0u, stats.episodic_memories);
    EXPECT_EQ(0u, stats.consolidation_passes);
    EXPECT_DOUBLE_EQ(0.01, engine.Snapshot().Learning().learning_rate);
}

TEST_F(MemoryEngineTest, RejectsNonPositiveLearningRate) {
    config_.learning_rate = 0.0;
    EXPECT_THROW(MemoryEngine engine(config_, start_), std::invalid_argument);
}

TEST_F(MemoryEngineTest, RejectsInvalidScoringWeights) {
    config_.consolidation.scoring.emotional_weight = 0.9;
    EXPECT_THROW(MemoryEngine engine(config_, start_), std::invalid_argument);
}

TEST_F(MemoryEngineTest, IngestLearnsVocabularyAndMemories) {
    MemoryEngine engine(config_, start_);

    auto report = engine.Ingest("the quick brown fox jumps over the lazy dog.", "story");
    auto stats = engine.GetStatistics();

    EXPECT_EQ(1u, report.memories_created);
    EXPECT_EQ(1u, stats.episodic_memories);
    EXPECT_GT(stats.vocabulary_size, 0u);
    EXPECT_GT(stats.temporal_patterns, 0u);
    EXPECT_GT(stats.text_corpus_size, 0u);
    EXPECT_EQ("story", engine.Snapshot().Episodes().At(0).context);
}

TEST_F(MemoryEngineTest, PredictNextOnEmptyEngineIsUnknown) {
    MemoryEngine engine(config_, start_);
    EXPECT_EQ(PatternLearner::kUnknownToken, engine.PredictNext({"a", "b", "c"}));
}

TEST_F(MemoryEngineTest, PredictNextUsesLearnedContinuation) {
    MemoryEngine engine(config_, start_);
    engine.Ingest("red green blue yellow", "colors");

    // Only one 3-token context exists, so every sample stored the same continuation
    EXPECT_EQ("yellow", engine.PredictNext({"red", "green", "blue"}));
}

TEST_F(MemoryEngineTest, PredictNextDoesNotMutate) {
    MemoryEngine engine(config_, start_);
    engine.Ingest("one two three four five six seven", "numbers");
    auto before = engine.GetStatistics();

    engine.PredictNext({"two", "three", "four"});
    engine.PredictNext({"x", "y", "z"});
    auto after = engine.GetStatistics();

    EXPECT_EQ(before.temporal_patterns, after.temporal_patterns);
    EXPECT_EQ(before.training_iterations, after.training_iterations);
    EXPECT_EQ(before.pattern_count, after.pattern_count);
}

TEST_F(MemoryEngineTest, LearnFromInteractionStoresRecord) {
    MemoryEngine engine(config_, start_);
    engine.LearnFromInteraction("hello", "hi there");

    Sigel snapshot = engine.Snapshot();
    ASSERT_EQ(1u, snapshot.Episodes().Size());
    EXPECT_EQ("Interaction: hello | Response: hi there", snapshot.Episodes().At(0).content);
    EXPECT_EQ(PatternLearner::kInteractionContext, snapshot.Episodes().At(0).context);
}

TEST_F(MemoryEngineTest, ConsolidateCountsPasses) {
    MemoryEngine engine(config_, start_);
    engine.Ingest("the cat sat quietly on the warm mat today.", "story");

    auto report = engine.Consolidate(Timestamp::Now());

    EXPECT_EQ(1u, report.memories_analyzed);
    EXPECT_EQ(1u, engine.GetStatistics().consolidation_passes);
    EXPECT_EQ(1u, engine.GetStatistics().consolidated_memories);
}

TEST_F(MemoryEngineTest, ConsolidateIfDueFollowsSchedule) {
    MemoryEngine engine(config_, start_);
    engine.Ingest("the cat sat quietly on the warm mat today.", "story");

    EXPECT_FALSE(engine.ConsolidateIfDue(start_).has_value());

    Timestamp due = start_ + std::chrono::hours(1);
    auto report = engine.ConsolidateIfDue(due);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(1u, report->memories_analyzed);

    EXPECT_EQ(due + std::chrono::hours(6), engine.GetSchedule().NextConsolidation());
    EXPECT_FALSE(engine.ConsolidateIfDue(due + std::chrono::hours(5)).has_value());
}

TEST_F(MemoryEngineTest, MaintenanceModeBlocksTimedPasses) {
    MemoryEngine engine(config_, start_);
    engine.SetMaintenanceMode(true);

    EXPECT_FALSE(engine.ConsolidateIfDue(start_ + std::chrono::hours(48)).has_value());

    engine.SetMaintenanceMode(false);
    EXPECT_TRUE(engine.ConsolidateIfDue(start_ + std::chrono::hours(48)).has_value());
}

TEST_F(MemoryEngineTest, RestoreReplacesState) {
    MemoryEngine engine(config_, start_);
    engine.Ingest("the quick brown fox jumps over the lazy dog.", "story");
    Sigel saved = engine.Snapshot();

    engine.Ingest("a completely different sentence about something else entirely.", "other");
    EXPECT_EQ(2u, engine.GetStatistics().episodic_memories);

    engine.Restore(saved);
    EXPECT_EQ(1u, engine.GetStatistics().episodic_memories);
}

TEST_F(MemoryEngineTest, AdoptsExistingSigel) {
    Sigel sigel("adopted");
    sigel.AddMemory("an existing record with enough words", "import", 0.0);

    MemoryEngine engine(config_, sigel, start_);

    EXPECT_EQ(1u, engine.GetStatistics().episodic_memories);
    EXPECT_EQ("adopted", engine.Snapshot().GetName());
}

TEST_F(MemoryEngineTest, ConcurrentCallsAreSerialized) {
    MemoryEngine engine(config_, start_);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 5;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&engine, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                engine.Ingest("thread " + std::to_string(t) + " wrote sentence number " +
                              std::to_string(i) + " today.", "thread");
                engine.PredictNext({"thread", "wrote", "sentence"});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<size_t>(kThreads * kPerThread), engine.GetStatistics().episodic_memories);
}

} // namespace
} // namespace engram
