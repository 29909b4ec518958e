// File: src/memory/importance_scorer.hpp
//
// Importance Scorer for Episodic Records
//
// Scores each record by how much it is worth keeping verbatim. The score
// combines five factors:
//
//   I(m) = w_e × E(m) + w_r × R(m) + w_u × U(m) + w_p × P(m) + w_c × C
//
// Where:
//   E(m) = |emotional_weight|                                      ∈ [0,1]
//   R(m) = max(1 / (1 + age_hours × λ_r), floor)                   ∈ [floor,1]
//   U(m) = Σ_tokens 1/(freq+1) (1 for unknown words) / max(1, len)  ∈ [0,1]
//   P(m) = Σ strengths of patterns contained in m / max(1, count)  ∈ [0,1]
//   C    = externally supplied contextual alignment
//   w_e, w_r, w_u, w_p, w_c = weights (sum to 1.0)

#pragma once

#include "core/types.hpp"
#include "knowledge/pattern_index.hpp"
#include "knowledge/vocabulary_store.hpp"
#include "memory/episodic_store.hpp"
#include <string>
#include <utility>
#include <vector>

namespace engram {

/// Score of one record with its per-factor breakdown
struct MemoryScore {
    double total_importance{0.0};
    std::vector<std::pair<std::string, double>> factors;  ///< Unweighted factor values
    PriorityTier priority{PriorityTier::LOW};

    /// Value of the named factor, 0.0 if absent
    double Factor(const std::string& name) const;
};

/// Multi-factor importance scoring
///
/// Pure function of its inputs. Time enters only through the injected
/// `now`, so tests can pin it.
class ImportanceScorer {
public:
    struct Config {
        // Weight parameters (must sum to 1.0)
        double emotional_weight{0.3};
        double recency_weight{0.2};
        double uniqueness_weight{0.25};
        double pattern_weight{0.15};
        double resonance_weight{0.1};

        double recency_decay{0.01};    ///< λ_r per hour
        double recency_floor{0.1};

        // Priority tiers
        double high_threshold{0.7};
        double medium_threshold{0.4};

        bool IsValid() const;
    };

    static constexpr const char* kEmotionalFactor = "emotional_intensity";
    static constexpr const char* kRecencyFactor = "temporal_recency";
    static constexpr const char* kUniquenessFactor = "information_uniqueness";
    static constexpr const char* kPatternFactor = "pattern_relevance";
    static constexpr const char* kResonanceFactor = "contextual_resonance";

    ImportanceScorer();

    /// @throws std::invalid_argument if config is invalid
    explicit ImportanceScorer(const Config& config);

    /// Score a single record
    MemoryScore Score(const EpisodicMemory& memory,
                      const VocabularyStore& vocabulary,
                      const PatternIndex& patterns,
                      double contextual_alignment,
                      Timestamp now) const;

    /// Score every record of store, in store order. Records are scored in
    /// parallel; the inputs are only read.
    std::vector<MemoryScore> ScoreAll(const EpisodicStore& store,
                                      const VocabularyStore& vocabulary,
                                      const PatternIndex& patterns,
                                      double contextual_alignment,
                                      Timestamp now) const;

    PriorityTier ClassifyPriority(double total_importance) const;

    // Individual factors
    double EmotionalIntensity(const EpisodicMemory& memory) const;
    double TemporalRecency(const EpisodicMemory& memory, Timestamp now) const;
    double InformationUniqueness(const EpisodicMemory& memory, const VocabularyStore& vocabulary) const;
    double PatternRelevance(const EpisodicMemory& memory, const PatternIndex& patterns) const;

    /// @throws std::invalid_argument if config is invalid
    void SetConfig(const Config& config);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void ValidateWeights() const;
};

} // namespace engram
