// File: src/core/memory_engine.hpp
#pragma once

#include "core/random_source.hpp"
#include "core/sigel.hpp"
#include "learning/pattern_learner.hpp"
#include "memory/consolidation_schedule.hpp"
#include "memory/consolidator.hpp"
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace engram {

/// MemoryEngine - Unified interface for one memory entity
///
/// Owns a Sigel together with the learner, the consolidator, the
/// consolidation schedule and a seeded random source. Every public call
/// takes the engine mutex, so an ingest, a prediction and a consolidation
/// pass never overlap on the same entity. Different engines are
/// independent.
class MemoryEngine {
public:
    /// Configuration for the engine
    struct Config {
        std::string name{"engram"};
        uint64_t seed{RandomSource::kDefaultSeed};
        double learning_rate{0.01};
        double contextual_alignment{1.0};

        // Component configurations
        VocabularyStore::Config vocabulary;
        PatternIndex::Config patterns;
        PatternLearner::Config learning;
        MemoryConsolidator::Config consolidation;
        ConsolidationSchedule::Config schedule;
    };

    /// Engine statistics
    struct Statistics {
        size_t vocabulary_size{0};
        size_t pattern_count{0};
        size_t semantic_words{0};
        size_t semantic_edges{0};
        size_t temporal_patterns{0};
        size_t episodic_memories{0};
        size_t consolidated_memories{0};
        uint64_t training_iterations{0};
        uint64_t text_corpus_size{0};
        size_t consolidation_passes{0};
    };

    /// Start with an empty Sigel named config.name
    /// @throws std::invalid_argument if a component config is invalid
    explicit MemoryEngine(const Config& config, Timestamp now = Timestamp::Now());

    /// Adopt an existing Sigel (e.g. loaded from a snapshot)
    MemoryEngine(const Config& config, Sigel sigel, Timestamp now = Timestamp::Now());

    // Disable copy and move
    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;
    MemoryEngine(MemoryEngine&&) = delete;
    MemoryEngine& operator=(MemoryEngine&&) = delete;

    // ========================================================================
    // High-Level API
    // ========================================================================

    /// Learn from a piece of text
    PatternLearner::LearningReport Ingest(const std::string& text, const std::string& source_tag);

    /// Predict the token following context; "unknown" on a total miss
    std::string PredictNext(const std::array<std::string, 3>& context);

    /// Record a conversational exchange
    void LearnFromInteraction(const std::string& interaction, const std::string& response);

    /// Run a consolidation pass now
    MemoryConsolidator::ConsolidationReport Consolidate(Timestamp now = Timestamp::Now());

    /// Run a pass only if the schedule says one is due
    std::optional<MemoryConsolidator::ConsolidationReport> ConsolidateIfDue(Timestamp now = Timestamp::Now());

    // ========================================================================
    // State
    // ========================================================================

    /// Copy of the Sigel taken under the lock
    Sigel Snapshot() const;

    /// Replace the Sigel (e.g. after loading a snapshot)
    void Restore(Sigel sigel);

    Statistics GetStatistics() const;

    ConsolidationSchedule GetSchedule() const;

    /// Enter or leave maintenance mode (no timed passes while set)
    void SetMaintenanceMode(bool enabled);

    const std::string& GetName() const { return config_.name; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    PatternLearner learner_;
    MemoryConsolidator consolidator_;

    mutable std::mutex mutex_;
    Sigel sigel_;
    RandomSource rng_;
    ConsolidationSchedule schedule_;

    MemoryConsolidator::ConsolidationReport ConsolidateLocked(Timestamp now, bool deep);
};

} // namespace engram
