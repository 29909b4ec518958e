// File: src/memory/similarity_clusterer.hpp
#pragma once

#include "core/types.hpp"
#include "memory/episodic_store.hpp"
#include "memory/importance_scorer.hpp"
#include <string>
#include <vector>

namespace engram {

/// A group of similar records found by one clustering pass.
/// Indices refer to the store the pass ran over.
struct MemoryCluster {
    size_t core_index{0};                ///< Seed record
    std::vector<size_t> member_indices;  ///< Seed first, then absorbed records in store order
    std::string topic;
    double aggregated_importance{0.0};   ///< Sum of member importance
    EmotionalProfile emotional_profile{EmotionalProfile::NEUTRAL};

    size_t Size() const { return member_indices.size(); }
};

/// SimilarityClusterer: greedy single-link grouping of episodic records
///
/// similarity(a, b) = w_w × Jaccard(words) + w_c × [context equal]
///                  + w_e × (1 - min(|Δweight| / 2, 1))
///                  + w_t × 1 / (1 + |Δhours| × λ_t)
///
/// Records are visited in store order. Each record not yet absorbed seeds a
/// new cluster and absorbs every later unabsorbed record whose similarity to
/// the seed exceeds the threshold. The first-seen record is therefore always
/// the seed. The pass is O(n²) in the record count.
class SimilarityClusterer {
public:
    struct Config {
        double similarity_threshold{0.7};   ///< Absorb when similarity > this

        // Term weights
        double word_weight{0.4};
        double context_weight{0.2};
        double emotion_weight{0.2};
        double time_weight{0.2};

        double time_decay{0.1};             ///< λ_t per hour
    };

    static constexpr const char* kGeneralTopic = "general";

    SimilarityClusterer() = default;

    /// @throws std::invalid_argument if config is invalid
    explicit SimilarityClusterer(const Config& config);

    /// Similarity of two records in [0, 1] (for default weights)
    double Similarity(const EpisodicMemory& a, const EpisodicMemory& b) const;

    /// Group records. Clusters are returned stably sorted by aggregated
    /// importance, descending.
    /// @throws std::invalid_argument if scores.size() != memories.size()
    std::vector<MemoryCluster> Cluster(const std::vector<EpisodicMemory>& memories,
                                       const std::vector<MemoryScore>& scores) const;

    /// Jaccard index of the whitespace-token sets of two strings; 0 when
    /// both are empty
    static double Jaccard(const std::string& a, const std::string& b);

    /// First three words longer than three characters that are not
    /// common words, joined by '_', or "general"
    static std::string ExtractTopic(const std::string& content);

    /// Case-insensitive stoplist check
    static bool IsCommonWord(const std::string& word);

    /// @throws std::invalid_argument if config is invalid
    void SetConfig(const Config& config);

    /// @throws std::invalid_argument if a weight or time_decay is negative
    ///         or similarity_threshold is outside [0, 1]
    static void ValidateConfig(const Config& config);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace engram
