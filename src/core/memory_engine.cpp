// File: src/core/memory_engine.cpp
#include "core/memory_engine.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace engram {

// ============================================================================
// Construction
// ============================================================================

MemoryEngine::MemoryEngine(const Config& config, Timestamp now)
    : MemoryEngine(config, Sigel(config.name, config.vocabulary, config.patterns), now) {
    sigel_.Learning().learning_rate = config_.learning_rate;
    sigel_.SetContextualAlignment(config_.contextual_alignment);
}

MemoryEngine::MemoryEngine(const Config& config, Sigel sigel, Timestamp now)
    : config_(config),
      learner_(config.learning),
      consolidator_(config.consolidation),
      sigel_(std::move(sigel)),
      rng_(config.seed),
      schedule_(config.schedule, now) {
    if (!(config_.learning_rate > 0.0)) {
        throw std::invalid_argument("learning_rate must be > 0");
    }
    spdlog::debug("MemoryEngine '{}' ready: {} words, {} memories",
                  sigel_.GetName(), sigel_.Vocabulary().Size(), sigel_.Episodes().Size());
}

// ============================================================================
// High-Level API
// ============================================================================

PatternLearner::LearningReport MemoryEngine::Ingest(const std::string& text, const std::string& source_tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    return learner_.Ingest(sigel_, text, source_tag, rng_);
}

std::string MemoryEngine::PredictNext(const std::array<std::string, 3>& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    return learner_.PredictNextToken(sigel_, context, rng_);
}

void MemoryEngine::LearnFromInteraction(const std::string& interaction, const std::string& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    learner_.LearnFromInteraction(sigel_, interaction, response);
}

MemoryConsolidator::ConsolidationReport MemoryEngine::Consolidate(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ConsolidateLocked(now, schedule_.IsDeepDue(now));
}

std::optional<MemoryConsolidator::ConsolidationReport> MemoryEngine::ConsolidateIfDue(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!schedule_.IsDue(now)) {
        return std::nullopt;
    }
    return ConsolidateLocked(now, schedule_.IsDeepDue(now));
}

MemoryConsolidator::ConsolidationReport MemoryEngine::ConsolidateLocked(Timestamp now, bool deep) {
    auto report = consolidator_.Consolidate(sigel_, now);
    schedule_.MarkCompleted(now, deep);
    if (deep) {
        spdlog::info("Deep consolidation of '{}' completed", sigel_.GetName());
    }
    return report;
}

// ============================================================================
// State
// ============================================================================

Sigel MemoryEngine::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sigel_;
}

void MemoryEngine::Restore(Sigel sigel) {
    std::lock_guard<std::mutex> lock(mutex_);
    sigel_ = std::move(sigel);
    spdlog::info("Restored '{}': {} words, {} memories",
                 sigel_.GetName(), sigel_.Vocabulary().Size(), sigel_.Episodes().Size());
}

MemoryEngine::Statistics MemoryEngine::GetStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statistics stats;
    stats.vocabulary_size = sigel_.Vocabulary().Size();
    stats.pattern_count = sigel_.Patterns().PatternCount();
    stats.semantic_words = sigel_.Patterns().SemanticWordCount();
    stats.semantic_edges = sigel_.Patterns().SemanticEdgeCount();
    stats.temporal_patterns = sigel_.Patterns().TemporalCount();
    stats.episodic_memories = sigel_.Episodes().Size();
    stats.consolidated_memories = sigel_.Episodes().CountByContext(MemoryConsolidator::kConsolidatedContext);
    stats.training_iterations = sigel_.Learning().training_iterations;
    stats.text_corpus_size = sigel_.Learning().text_corpus_size;
    stats.consolidation_passes = consolidator_.GetStatistics().total_consolidation_operations;
    return stats;
}

ConsolidationSchedule MemoryEngine::GetSchedule() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schedule_;
}

void MemoryEngine::SetMaintenanceMode(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    schedule_.SetMaintenanceMode(enabled);
}

} // namespace engram
