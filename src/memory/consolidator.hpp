// File: src/memory/consolidator.hpp
#pragma once

#include "core/types.hpp"
#include "core/sigel.hpp"
#include "memory/importance_scorer.hpp"
#include "memory/similarity_clusterer.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace engram {

/// Compressed stand-in for a cluster of episodic records
struct ConsolidatedMemory {
    MemoryID id;
    std::string summary;
    std::vector<std::string> key_patterns;
    std::map<std::string, double> essential_concepts;   ///< concept -> weight
    double aggregated_importance{0.0};
    EmotionalProfile emotional_profile{EmotionalProfile::NEUTRAL};
    size_t original_member_count{0};
    Timestamp created_at;
    uint64_t access_frequency{0};
};

/// MemoryConsolidator: compact the episodic log and retune the pattern index
///
/// One pass over a Sigel runs eight steps:
/// 1. Score every record (parallel, read-only)
/// 2. Cluster similar records
/// 3. Build one ConsolidatedMemory per cluster that has a member at or
///    below the retention threshold (parallel)
/// 4. Overwrite each record's relevance with its importance, keep the
///    records above the retention threshold and append the summaries
/// 5. Reinforce 2-grams and 3-grams of the scored records by importance
/// 6. Decay every pattern strength
/// 7. Prune weak patterns
/// 8. Link the words of retained and consolidated records in the semantic
///    network, then sort, deduplicate and truncate every adjacency list
///
/// Reinforcement runs before decay, so freshly reinforced patterns are
/// decayed in the same pass.
class MemoryConsolidator {
public:
    /// Configuration for consolidation behavior
    struct Config {
        ImportanceScorer::Config scoring;
        SimilarityClusterer::Config clustering;

        // Compaction
        double retention_threshold{0.8};          // Keep originals with relevance > this
        double consolidated_emotional_weight{0.7};
        double high_significance_threshold{1.0};  // Aggregate importance for "high_significance"

        // Pattern reinforcement
        double bigram_reinforcement{0.1};         // × importance per 2-gram window
        double trigram_reinforcement{0.05};       // × importance per 3-gram window
        double strength_ceiling{2.0};             // Cap for existing patterns
        double min_new_pattern_strength{0.1};     // New patterns need more than this

        // Decay and pruning
        double decay_rate{0.01};
        double prune_threshold{0.01};
    };

    /// Summary of one consolidation pass
    struct ConsolidationReport {
        size_t memories_analyzed{0};
        size_t clusters_formed{0};
        size_t memories_consolidated{0};
        size_t memories_retained{0};
        size_t patterns_reinforced{0};
        size_t patterns_pruned{0};
        size_t semantic_edges_added{0};
        std::chrono::microseconds processing_time{0};
        double memory_reduction_ratio{0.0};
        Timestamp timestamp;
    };

    static constexpr const char* kConsolidatedContext = "consolidated_memory";

    // ========================================================================
    // Construction
    // ========================================================================

    /// Construct with default configuration
    MemoryConsolidator() = default;

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit MemoryConsolidator(const Config& config);

    // ========================================================================
    // Main Consolidation Operations
    // ========================================================================

    /// Run a full pass over sigel. An empty episodic store yields an
    /// all-zero report and leaves the Sigel untouched.
    /// @param now Reference time for recency scoring
    ConsolidationReport Consolidate(Sigel& sigel, Timestamp now = Timestamp::Now());

    /// Build the compressed form of every cluster (parallel)
    std::vector<ConsolidatedMemory> ConsolidateClusters(const std::vector<MemoryCluster>& clusters,
                                                        Timestamp now) const;

    /// Build the compressed form of one cluster
    ConsolidatedMemory ConsolidateCluster(const MemoryCluster& cluster, Timestamp now) const;

    /// Reinforce the n-grams of memories in proportion to their scores
    /// @return Number of patterns created or strengthened
    size_t ReinforcePatterns(PatternIndex& patterns,
                             const std::vector<EpisodicMemory>& memories,
                             const std::vector<MemoryScore>& scores) const;

    /// Link co-occurring words of important records, then normalize every
    /// adjacency list
    /// @return Number of word pairs newly linked
    size_t EnhanceSemanticNetwork(Sigel& sigel) const;

    /// Concept name for an emotional profile ("positive_experience", ...)
    static const char* ProfileConcept(EmotionalProfile profile);

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Set configuration (validates before applying)
    /// @throws std::invalid_argument if config is invalid
    void SetConfig(const Config& config);

    /// Get current configuration
    const Config& GetConfig() const { return config_; }

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Statistics {
        size_t total_consolidation_operations{0};
        size_t total_memories_analyzed{0};
        size_t total_clusters_formed{0};
        size_t total_patterns_pruned{0};
        Timestamp last_consolidation;
    };

    const Statistics& GetStatistics() const { return stats_; }

    void ResetStatistics();

private:
    Config config_;
    Statistics stats_;

    /// @throws std::invalid_argument if invalid
    void ValidateConfig() const;

    double ProfileWeight(EmotionalProfile profile) const;
};

} // namespace engram
