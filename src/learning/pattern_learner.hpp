// File: src/learning/pattern_learner.hpp
//
// Pattern learner: turns raw text into vocabulary, semantic associations,
// episodic records and n-gram strengths, then tests itself on the text with
// a naive next-token predictor and reinforces what it got wrong.

#pragma once

#include "core/sigel.hpp"
#include "core/random_source.hpp"
#include <array>
#include <string>
#include <vector>

namespace engram {

/// PatternLearner: ingestion and self-evaluation
///
/// Ingest() runs four phases over one piece of text:
/// 1. Sentence pass: vocabulary contexts, semantic edges, episodic records
/// 2. Self-evaluation: sampled 3-token contexts are predicted and the
///    observed continuation is stored as a temporal pattern
/// 3. N-gram extraction: 2..4-gram strengths of 1/n per occurrence
/// 4. Pruning of weak linguistic patterns
///
/// The learner holds configuration only; all state lives in the Sigel.
class PatternLearner {
public:
    struct Config {
        // Episodic records: sentences with token count in [min, max]
        size_t min_memory_tokens{6};
        size_t max_memory_tokens{49};

        // Self-evaluation sample size: clamp(tokens / divisor, min, max)
        size_t sample_divisor{100};
        size_t min_sample_size{1000};
        size_t max_sample_size{10000};

        // Reinforcement multiplier applied when accuracy < poor_accuracy_threshold
        double poor_accuracy_threshold{0.5};
        double poor_accuracy_boost{2.0};

        // N-gram extraction
        size_t min_ngram{2};
        size_t max_ngram{4};
        size_t min_sentence_chars{10};       ///< Trimmed sentences this short are skipped
        double min_pattern_strength{0.1};    ///< Patterns <= this are pruned after a pass
    };

    /// Summary of one Ingest() call
    struct LearningReport {
        size_t sentences_processed{0};
        size_t words_learned{0};
        size_t semantic_edges_added{0};
        size_t memories_created{0};
        size_t predictions_evaluated{0};
        double mean_accuracy{0.0};
        size_t ngrams_extracted{0};
        size_t patterns_pruned{0};
    };

    /// Construct with default configuration
    PatternLearner() = default;

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit PatternLearner(const Config& config);

    // ========================================================================
    // Main Operations
    // ========================================================================

    /// Learn from one piece of text
    /// @param sigel Entity to update
    /// @param content Free text
    /// @param source_tag Context tag of the episodic records created
    /// @param rng Random source for sampling
    LearningReport Ingest(Sigel& sigel, const std::string& content,
                          const std::string& source_tag, RandomSource& rng) const;

    /// Record a conversational exchange as an episodic memory
    void LearnFromInteraction(Sigel& sigel, const std::string& interaction,
                              const std::string& response) const;

    /// Predict the token following context. Never mutates the Sigel.
    /// @return A stored continuation, a semantic neighbor of the last
    ///         context token, or "unknown"
    std::string PredictNextToken(const Sigel& sigel,
                                 const std::array<std::string, 3>& context,
                                 RandomSource& rng) const;

    /// Case-insensitive similarity of a prediction to the real token:
    ///   1.0 equal, 0.7 predicted is a substring of actual, 0.6 actual is a
    ///   substring of predicted, otherwise 0.4 * shared / max(len) where
    ///   shared counts characters of predicted found anywhere in actual
    static double PredictionAccuracy(const std::string& predicted, const std::string& actual);

    // ========================================================================
    // Phases (exposed for testing)
    // ========================================================================

    /// Phase 1 over every sentence of content
    void ProcessSentences(Sigel& sigel, const std::string& content,
                          const std::string& source_tag, LearningReport& report) const;

    /// Phase 2 over the whitespace tokens of content
    void SelfEvaluate(Sigel& sigel, const std::vector<std::string>& tokens,
                      RandomSource& rng, LearningReport& report) const;

    /// Phases 3 and 4
    void ExtractPatterns(Sigel& sigel, const std::string& content, LearningReport& report) const;

    /// Number of self-evaluation draws for a corpus of token_count tokens
    size_t SampleSize(size_t token_count) const;

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Set configuration (validates before applying)
    /// @throws std::invalid_argument if config is invalid
    void SetConfig(const Config& config);

    const Config& GetConfig() const { return config_; }

    static constexpr const char* kUnknownToken = "unknown";
    static constexpr const char* kInteractionContext = "user_interaction";

private:
    Config config_;

    void ValidateConfig() const;

    /// Store context -> target as a temporal pattern and reinforce the
    /// context's linguistic pattern
    void StrengthenPattern(Sigel& sigel, const std::vector<std::string>& context,
                           const std::string& target, double strength) const;

    /// All n-grams of one sentence with their 1/n contribution
    std::vector<std::pair<std::string, double>> AnalyzeSentence(const std::string& sentence) const;
};

} // namespace engram
