// File: src/memory/consolidator.cpp
#include "memory/consolidator.hpp"
#include "learning/text_processing.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace engram {

// ============================================================================
// Construction
// ============================================================================

MemoryConsolidator::MemoryConsolidator(const Config& config)
    : config_(config)
{
    ValidateConfig();
}

void MemoryConsolidator::ValidateConfig() const {
    if (!config_.scoring.IsValid()) {
        throw std::invalid_argument("Invalid scoring configuration");
    }

    SimilarityClusterer::ValidateConfig(config_.clustering);

    if (config_.decay_rate < 0.0 || config_.decay_rate > 1.0) {
        throw std::invalid_argument("decay_rate must be in [0,1]");
    }

    if (config_.prune_threshold < 0.0) {
        throw std::invalid_argument("prune_threshold must be >= 0");
    }

    if (config_.retention_threshold < 0.0) {
        throw std::invalid_argument("retention_threshold must be >= 0");
    }

    if (config_.bigram_reinforcement < 0.0 || config_.trigram_reinforcement < 0.0) {
        throw std::invalid_argument("reinforcement factors must be >= 0");
    }

    if (config_.strength_ceiling <= 0.0) {
        throw std::invalid_argument("strength_ceiling must be > 0");
    }

    if (config_.consolidated_emotional_weight < 0.0 || config_.consolidated_emotional_weight > 1.0) {
        throw std::invalid_argument("consolidated_emotional_weight must be in [0,1]");
    }
}

void MemoryConsolidator::SetConfig(const Config& config) {
    Config previous = config_;
    config_ = config;
    try {
        ValidateConfig();
    } catch (const std::invalid_argument&) {
        config_ = previous;
        throw;
    }
}

// ============================================================================
// Main Consolidation Operations
// ============================================================================

MemoryConsolidator::ConsolidationReport MemoryConsolidator::Consolidate(Sigel& sigel, Timestamp now) {
    ConsolidationReport report;
    report.timestamp = now;

    if (sigel.Episodes().Empty()) {
        spdlog::debug("Consolidation skipped: no episodic memories");
        return report;
    }

    auto start_time = std::chrono::steady_clock::now();
    const size_t before = sigel.Episodes().Size();

    // Step 1: Score
    ImportanceScorer scorer(config_.scoring);
    std::vector<MemoryScore> scores = scorer.ScoreAll(
        sigel.Episodes(), sigel.Vocabulary(), sigel.Patterns(),
        sigel.GetContextualAlignment(), now);
    report.memories_analyzed = scores.size();

    // Step 2: Cluster
    SimilarityClusterer clusterer(config_.clustering);
    std::vector<MemoryCluster> clusters = clusterer.Cluster(sigel.Episodes().All(), scores);
    report.clusters_formed = clusters.size();

    // Step 3: Compress the clusters that lose at least one record below;
    // a cluster kept whole needs no summary
    const double retention = config_.retention_threshold;
    std::vector<MemoryCluster> replaced;
    for (const auto& cluster : clusters) {
        bool loses_member = std::any_of(cluster.member_indices.begin(), cluster.member_indices.end(),
            [&scores, retention](size_t index) { return scores[index].total_importance <= retention; });
        if (loses_member) {
            replaced.push_back(cluster);
        }
    }
    std::vector<ConsolidatedMemory> consolidated = ConsolidateClusters(replaced, now);
    report.memories_consolidated = consolidated.size();

    // Reinforcement below reads the records as they were scored
    const std::vector<EpisodicMemory> scored_memories = sigel.Episodes().All();

    // Step 4: Compact the episodic log
    EpisodicStore& episodes = sigel.Episodes();
    for (size_t i = 0; i < scores.size(); ++i) {
        episodes.SetRelevance(i, scores[i].total_importance);
    }
    episodes.RetainIf([retention](const EpisodicMemory& memory) {
        return memory.relevance_score > retention;
    });
    report.memories_retained = episodes.Size();

    for (const auto& summary : consolidated) {
        EpisodicMemory record;
        record.id = summary.id;
        record.timestamp = summary.created_at;
        record.content = summary.summary;
        record.context = kConsolidatedContext;
        record.emotional_weight = ProfileWeight(summary.emotional_profile);
        record.relevance_score = summary.aggregated_importance;
        episodes.Append(std::move(record));
    }

    // Steps 5-7: Retune the pattern index
    PatternIndex& patterns = sigel.Patterns();
    report.patterns_reinforced = ReinforcePatterns(patterns, scored_memories, scores);
    patterns.Decay(config_.decay_rate);
    report.patterns_pruned = patterns.Prune(config_.prune_threshold);

    // Step 8: Semantic network
    report.semantic_edges_added = EnhanceSemanticNetwork(sigel);

    const size_t after = episodes.Size();
    report.memory_reduction_ratio =
        1.0 - static_cast<double>(after) / static_cast<double>(std::max<size_t>(before, 1));
    report.processing_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);

    stats_.total_consolidation_operations++;
    stats_.total_memories_analyzed += report.memories_analyzed;
    stats_.total_clusters_formed += report.clusters_formed;
    stats_.total_patterns_pruned += report.patterns_pruned;
    stats_.last_consolidation = now;

    spdlog::info("Memory consolidation completed: {} memories analyzed, {} clusters, {} retained, "
                 "reduction {:.2f}",
                 report.memories_analyzed, report.clusters_formed, report.memories_retained,
                 report.memory_reduction_ratio);

    return report;
}

std::vector<ConsolidatedMemory> MemoryConsolidator::ConsolidateClusters(
    const std::vector<MemoryCluster>& clusters,
    Timestamp now) const {

    std::vector<ConsolidatedMemory> result(clusters.size());
    const int64_t count = static_cast<int64_t>(clusters.size());

    #pragma omp parallel for schedule(static)
    for (int64_t i = 0; i < count; ++i) {
        result[i] = ConsolidateCluster(clusters[i], now);
    }

    return result;
}

ConsolidatedMemory MemoryConsolidator::ConsolidateCluster(const MemoryCluster& cluster, Timestamp now) const {
    ConsolidatedMemory memory;
    memory.id = MemoryID::Generate();
    memory.summary = "Consolidated memory cluster about " + cluster.topic + " with " +
                     std::to_string(cluster.Size()) + " related memories";

    memory.key_patterns = {
        "topic:" + cluster.topic,
        std::string("emotional_pattern:") + ToString(cluster.emotional_profile),
        "cluster_pattern",
    };

    memory.essential_concepts[cluster.topic] = 1.0;
    memory.essential_concepts[ProfileConcept(cluster.emotional_profile)] = 0.8;
    if (cluster.aggregated_importance > config_.high_significance_threshold) {
        memory.essential_concepts["high_significance"] = 0.9;
    }

    memory.aggregated_importance = cluster.aggregated_importance;
    memory.emotional_profile = cluster.emotional_profile;
    memory.original_member_count = cluster.Size();
    memory.created_at = now;
    return memory;
}

size_t MemoryConsolidator::ReinforcePatterns(
    PatternIndex& patterns,
    const std::vector<EpisodicMemory>& memories,
    const std::vector<MemoryScore>& scores) const {

    if (scores.size() != memories.size()) {
        throw std::invalid_argument("ReinforcePatterns: score count does not match record count");
    }

    // Accumulate first so a pattern seen in many records is judged on its total
    std::unordered_map<std::string, double> reinforcement;
    for (size_t i = 0; i < memories.size(); ++i) {
        const double importance = scores[i].total_importance;
        std::vector<std::string> words = text::SplitWhitespace(memories[i].content);

        for (size_t j = 0; j + 2 <= words.size(); ++j) {
            reinforcement[text::Join(words, j, j + 2)] += importance * config_.bigram_reinforcement;
        }
        for (size_t j = 0; j + 3 <= words.size(); ++j) {
            reinforcement[text::Join(words, j, j + 3)] += importance * config_.trigram_reinforcement;
        }
    }

    size_t touched = 0;
    for (const auto& [pattern, amount] : reinforcement) {
        if (patterns.HasPattern(pattern)) {
            patterns.Reinforce(pattern, amount, config_.strength_ceiling);
            ++touched;
        } else if (amount > config_.min_new_pattern_strength) {
            patterns.Reinforce(pattern, amount);
            ++touched;
        }
    }

    spdlog::debug("Reinforced {} of {} candidate patterns", touched, reinforcement.size());
    return touched;
}

size_t MemoryConsolidator::EnhanceSemanticNetwork(Sigel& sigel) const {
    PatternIndex& patterns = sigel.Patterns();
    size_t added = 0;

    for (const auto& memory : sigel.Episodes()) {
        if (!(memory.relevance_score > config_.retention_threshold) &&
            memory.context != kConsolidatedContext) {
            continue;
        }

        std::vector<std::string> words = text::SplitWhitespace(memory.content);
        for (auto& word : words) {
            word = text::NormalizeWord(word);
        }

        for (size_t i = 0; i < words.size(); ++i) {
            for (size_t j = i + 1; j < words.size(); ++j) {
                if (patterns.AddAssociation(words[i], words[j])) {
                    ++added;
                }
            }
        }
    }

    patterns.NormalizeNeighbors();
    return added;
}

// ============================================================================
// Helpers
// ============================================================================

const char* MemoryConsolidator::ProfileConcept(EmotionalProfile profile) {
    switch (profile) {
        case EmotionalProfile::POSITIVE: return "positive_experience";
        case EmotionalProfile::NEGATIVE: return "challenging_experience";
        case EmotionalProfile::NEUTRAL:  return "neutral_experience";
        case EmotionalProfile::MIXED:    return "complex_experience";
    }
    return "neutral_experience";
}

double MemoryConsolidator::ProfileWeight(EmotionalProfile profile) const {
    switch (profile) {
        case EmotionalProfile::POSITIVE: return config_.consolidated_emotional_weight;
        case EmotionalProfile::NEGATIVE: return -config_.consolidated_emotional_weight;
        default: return 0.0;
    }
}

void MemoryConsolidator::ResetStatistics() {
    stats_ = Statistics{};
}

} // namespace engram
