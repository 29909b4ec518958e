// File: tests/learning/pattern_learner_test.cpp
#include "learning/pattern_learner.hpp"
#include "learning/text_processing.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace engram {
namespace {

class PatternLearnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.min_sample_size = 20;
        config_.max_sample_size = 200;
        learner_ = PatternLearner(config_);
    }

    PatternLearner::Config config_;
    PatternLearner learner_;
    Sigel sigel_{"learner_test"};
    RandomSource rng_{1234};
};

// ============================================================================
// Accuracy
// ============================================================================

TEST(PredictionAccuracyTest, ExactMatch) {
    EXPECT_DOUBLE_EQ(1.0, PatternLearner::PredictionAccuracy("hello", "hello"));
    EXPECT_DOUBLE_EQ(1.0, PatternLearner::PredictionAccuracy("HELLO", "hello"));
}

TEST(PredictionAccuracyTest, PredictedInsideActual) {
    EXPECT_DOUBLE_EQ(0.7, PatternLearner::PredictionAccuracy("hel", "hello"));
}

TEST(PredictionAccuracyTest, ActualInsidePredicted) {
    EXPECT_DOUBLE_EQ(0.6, PatternLearner::PredictionAccuracy("hello", "hel"));
}

TEST(PredictionAccuracyTest, UnrelatedWordsStayLow) {
    double accuracy = PatternLearner::PredictionAccuracy("xyz", "qrs");
    EXPECT_GE(accuracy, 0.0);
    EXPECT_LE(accuracy, 0.4);
}

TEST(PredictionAccuracyTest, SharedCharactersAreNotPositional) {
    // Only 'c' of "abc" occurs in "cxy"
    EXPECT_DOUBLE_EQ(0.4 / 3.0, PatternLearner::PredictionAccuracy("abc", "cxy"));
    // Every character of "ab" occurs in "bxa"
    EXPECT_DOUBLE_EQ(0.4 * 2.0 / 3.0, PatternLearner::PredictionAccuracy("ab", "bxa"));
}

// ============================================================================
// Configuration
// ============================================================================

TEST(PatternLearnerConfigTest, RejectsInvalidRanges) {
    PatternLearner::Config config;
    config.max_memory_tokens = 2;
    EXPECT_THROW(PatternLearner learner(config), std::invalid_argument);

    config = {};
    config.max_sample_size = 10;
    EXPECT_THROW(PatternLearner learner(config), std::invalid_argument);

    config = {};
    config.min_ngram = 0;
    EXPECT_THROW(PatternLearner learner(config), std::invalid_argument);

    config = {};
    config.sample_divisor = 0;
    EXPECT_THROW(PatternLearner learner(config), std::invalid_argument);
}

TEST(PatternLearnerConfigTest, SampleSizeIsClamped) {
    PatternLearner learner;
    EXPECT_EQ(1000u, learner.SampleSize(10));
    EXPECT_EQ(5000u, learner.SampleSize(500000));
    EXPECT_EQ(10000u, learner.SampleSize(5000000));
}

// ============================================================================
// Sentence pass
// ============================================================================

TEST_F(PatternLearnerTest, SentencePassLearnsContexts) {
    PatternLearner::LearningReport report;
    learner_.ProcessSentences(sigel_, "The cat sat", "test", report);

    const WordKnowledge* cat = sigel_.Vocabulary().Find("cat");
    ASSERT_NE(nullptr, cat);
    ASSERT_EQ(1u, cat->contexts.size());
    EXPECT_EQ("The sat", cat->contexts[0]);
    EXPECT_EQ(1u, report.words_learned);
}

TEST_F(PatternLearnerTest, SentencePassLinksNormalizedWords) {
    PatternLearner::LearningReport report;
    learner_.ProcessSentences(sigel_, "The Cat, sat", "test", report);

    const auto& neighbors = sigel_.Patterns().Neighbors("cat");
    EXPECT_NE(neighbors.end(), std::find(neighbors.begin(), neighbors.end(), "the"));
    EXPECT_NE(neighbors.end(), std::find(neighbors.begin(), neighbors.end(), "sat"));
    EXPECT_EQ(2u, report.semantic_edges_added);
}

TEST_F(PatternLearnerTest, PunctuationOnlyTokensAddNoEdges) {
    PatternLearner::LearningReport report;
    learner_.ProcessSentences(sigel_, "alpha -- beta", "test", report);

    EXPECT_EQ(0u, report.semantic_edges_added);
    EXPECT_EQ(0u, sigel_.Patterns().SemanticWordCount());
}

TEST_F(PatternLearnerTest, MemoryTokenBounds) {
    PatternLearner::LearningReport report;

    learner_.ProcessSentences(sigel_, "one two three four five", "test", report);
    EXPECT_EQ(0u, sigel_.Episodes().Size());

    learner_.ProcessSentences(sigel_, "one two three four five six", "test", report);
    EXPECT_EQ(1u, sigel_.Episodes().Size());

    std::string long_sentence;
    for (int i = 0; i < 50; ++i) long_sentence += "word ";
    learner_.ProcessSentences(sigel_, long_sentence, "test", report);
    EXPECT_EQ(1u, sigel_.Episodes().Size());

    EXPECT_EQ(1u, report.memories_created);
}

TEST_F(PatternLearnerTest, MemoriesCarryTagAndEmotion) {
    PatternLearner::LearningReport report;
    learner_.ProcessSentences(sigel_, "  I love the way the sun rises.  ", "diary", report);

    ASSERT_EQ(1u, sigel_.Episodes().Size());
    const EpisodicMemory& memory = sigel_.Episodes().At(0);
    EXPECT_EQ("I love the way the sun rises", memory.content);
    EXPECT_EQ("diary", memory.context);
    EXPECT_DOUBLE_EQ(0.5, memory.emotional_weight);
}

// ============================================================================
// Self-evaluation and extraction
// ============================================================================

TEST_F(PatternLearnerTest, ShortTextSkipsSelfEvaluation) {
    auto report = learner_.Ingest(sigel_, "too short", "test", rng_);

    EXPECT_EQ(0u, report.predictions_evaluated);
    EXPECT_EQ(0u, sigel_.Patterns().TemporalCount());
}

TEST_F(PatternLearnerTest, SelfEvaluationStoresOneSequencePerDraw) {
    auto report = learner_.Ingest(sigel_, "red green blue yellow purple", "test", rng_);

    EXPECT_EQ(learner_.SampleSize(5), report.predictions_evaluated);
    EXPECT_EQ(report.predictions_evaluated, sigel_.Patterns().TemporalCount());
    EXPECT_GE(report.mean_accuracy, 0.0);
    EXPECT_LE(report.mean_accuracy, 1.0);

    for (const auto& pattern : sigel_.Patterns().TemporalPatterns()) {
        ASSERT_EQ(4u, pattern.sequence.size());
        EXPECT_GT(pattern.frequency, 0.0);
    }
}

TEST_F(PatternLearnerTest, SelfEvaluationReinforcesContextPattern) {
    learner_.Ingest(sigel_, "red green blue yellow", "test", rng_);

    // 1/3 from extraction plus the self-evaluation reinforcement
    EXPECT_GT(sigel_.Patterns().GetStrength("red green blue"), 1.0 / 3.0);
}

TEST_F(PatternLearnerTest, IngestUpdatesLearningState) {
    const std::string content = "red green blue yellow purple";
    auto report = learner_.Ingest(sigel_, content, "test", rng_);

    EXPECT_EQ(content.size(), sigel_.Learning().text_corpus_size);
    EXPECT_EQ(report.predictions_evaluated + 1, sigel_.Learning().training_iterations);
}

TEST_F(PatternLearnerTest, ExtractionWeightsShorterWindowsHigher) {
    PatternLearner::LearningReport report;
    learner_.ExtractPatterns(sigel_, "alpha beta gamma delta epsilon", report);

    const PatternIndex& index = sigel_.Patterns();
    EXPECT_DOUBLE_EQ(0.5, index.GetStrength("alpha beta"));
    EXPECT_DOUBLE_EQ(1.0 / 3.0, index.GetStrength("alpha beta gamma"));
    EXPECT_DOUBLE_EQ(0.25, index.GetStrength("alpha beta gamma delta"));
    EXPECT_FALSE(index.HasPattern("alpha beta gamma delta epsilon"));
    EXPECT_EQ(9u, index.PatternCount());
    EXPECT_EQ(9u, report.ngrams_extracted);
}

TEST_F(PatternLearnerTest, ExtractionAccumulatesAcrossSentences) {
    PatternLearner::LearningReport report;
    learner_.ExtractPatterns(sigel_, "alpha beta gamma. alpha beta gamma.", report);

    EXPECT_DOUBLE_EQ(1.0, sigel_.Patterns().GetStrength("alpha beta"));
}

TEST_F(PatternLearnerTest, ExtractionSkipsShortSentences) {
    PatternLearner::LearningReport report;
    learner_.ExtractPatterns(sigel_, "a b c. d e", report);

    EXPECT_EQ(0u, sigel_.Patterns().PatternCount());
}

TEST_F(PatternLearnerTest, ExtractionPrunesWeakPatterns) {
    config_.min_pattern_strength = 0.3;
    learner_.SetConfig(config_);

    PatternLearner::LearningReport report;
    learner_.ExtractPatterns(sigel_, "alpha beta gamma delta epsilon", report);

    EXPECT_EQ(2u, report.patterns_pruned);
    EXPECT_FALSE(sigel_.Patterns().HasPattern("alpha beta gamma delta"));
    EXPECT_TRUE(sigel_.Patterns().HasPattern("alpha beta gamma"));
}

// ============================================================================
// Prediction
// ============================================================================

TEST_F(PatternLearnerTest, PredictFallsBackToNeighbor) {
    sigel_.Patterns().AddAssociation("mat", "rug");

    EXPECT_EQ("rug", learner_.PredictNextToken(sigel_, {"on", "the", "Mat!"}, rng_));
}

TEST_F(PatternLearnerTest, PredictTotalMissIsUnknown) {
    EXPECT_EQ(PatternLearner::kUnknownToken,
              learner_.PredictNextToken(sigel_, {"never", "seen", "before"}, rng_));
}

TEST_F(PatternLearnerTest, PredictReturnsKnownWordOrUnknown) {
    const std::string corpus =
        "the cat sat on the mat. the dog sat on the rug. a bird flew over the house.";
    learner_.Ingest(sigel_, corpus, "test", rng_);

    std::vector<std::string> tokens = text::SplitWhitespace(corpus);
    for (size_t i = 0; i + 3 <= tokens.size(); ++i) {
        std::string predicted = learner_.PredictNextToken(
            sigel_, {tokens[i], tokens[i + 1], tokens[i + 2]}, rng_);

        bool from_corpus = std::find(tokens.begin(), tokens.end(), predicted) != tokens.end();
        bool from_network = sigel_.Patterns().SemanticWordCount() > 0 &&
                            !sigel_.Patterns().Neighbors(predicted).empty();
        EXPECT_TRUE(from_corpus || from_network || predicted == PatternLearner::kUnknownToken)
            << predicted;
    }
}

TEST_F(PatternLearnerTest, LearnFromInteraction) {
    learner_.LearnFromInteraction(sigel_, "I love music", "me too");

    ASSERT_EQ(1u, sigel_.Episodes().Size());
    EXPECT_EQ("Interaction: I love music | Response: me too", sigel_.Episodes().At(0).content);
    EXPECT_DOUBLE_EQ(0.5, sigel_.Episodes().At(0).emotional_weight);
}

} // namespace
} // namespace engram
