// File: tests/knowledge/vocabulary_store_test.cpp
#include "knowledge/vocabulary_store.hpp"
#include "core/numeric_safety.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace engram {
namespace {

TEST(VocabularyStoreTest, FirstOccurrenceSeedsFrequency) {
    VocabularyStore store;
    store.Learn("cat", "the sat");

    ASSERT_TRUE(store.Contains("cat"));
    EXPECT_DOUBLE_EQ(1.0, store.GetFrequency("cat"));
    EXPECT_EQ(1u, store.Find("cat")->contexts.size());
}

TEST(VocabularyStoreTest, RepeatedOccurrencesIncrementFrequency) {
    VocabularyStore store;
    store.Learn("cat", "the sat");
    store.Learn("cat", "the sat");
    store.Learn("cat", "a ran");

    EXPECT_DOUBLE_EQ(3.0, store.GetFrequency("cat"));
    // Duplicate contexts are stored once
    EXPECT_EQ(2u, store.Find("cat")->contexts.size());
}

TEST(VocabularyStoreTest, UnknownWord) {
    VocabularyStore store;
    EXPECT_EQ(nullptr, store.Find("missing"));
    EXPECT_DOUBLE_EQ(0.0, store.GetFrequency("missing"));
}

TEST(VocabularyStoreTest, ContextListIsBounded) {
    VocabularyStore::Config config;
    config.max_contexts_per_word = 2;
    VocabularyStore store(config);

    store.Learn("word", "a b");
    store.Learn("word", "c d");
    store.Learn("word", "e f");

    EXPECT_EQ(2u, store.Find("word")->contexts.size());
    EXPECT_DOUBLE_EQ(3.0, store.GetFrequency("word"));
}

TEST(VocabularyStoreTest, RejectsZeroContextLimit) {
    VocabularyStore::Config config;
    config.max_contexts_per_word = 0;
    EXPECT_THROW(VocabularyStore store(config), std::invalid_argument);
}

TEST(VocabularyStoreTest, PutReplacesEntry) {
    VocabularyStore store;
    store.Learn("cat", "the sat");

    WordKnowledge knowledge;
    knowledge.frequency = 7.0;
    knowledge.emotional_valence = 0.5;
    store.Put("cat", knowledge);

    EXPECT_DOUBLE_EQ(7.0, store.GetFrequency("cat"));
    EXPECT_TRUE(store.Find("cat")->contexts.empty());
}

TEST(VocabularyStoreTest, SanitizeReplacesNonFinite) {
    VocabularyStore store;
    WordKnowledge knowledge;
    knowledge.frequency = std::numeric_limits<double>::quiet_NaN();
    knowledge.emotional_valence = 4.0;
    knowledge.semantic_weight = -std::numeric_limits<double>::infinity();
    store.Put("bad", knowledge);

    EXPECT_EQ(3u, store.Sanitize());

    const WordKnowledge* fixed = store.Find("bad");
    EXPECT_DOUBLE_EQ(defaults::kWordFrequency, fixed->frequency);
    EXPECT_DOUBLE_EQ(1.0, fixed->emotional_valence);
    EXPECT_DOUBLE_EQ(defaults::kSemanticWeight, fixed->semantic_weight);
    EXPECT_EQ(0u, store.Sanitize());
}

} // namespace
} // namespace engram
