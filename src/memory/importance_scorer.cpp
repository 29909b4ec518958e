// File: src/memory/importance_scorer.cpp
#include "memory/importance_scorer.hpp"
#include "core/numeric_safety.hpp"
#include "learning/text_processing.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace engram {

double MemoryScore::Factor(const std::string& name) const {
    for (const auto& [factor, value] : factors) {
        if (factor == name) {
            return value;
        }
    }
    return 0.0;
}

// ============================================================================
// ImportanceScorer::Config
// ============================================================================

bool ImportanceScorer::Config::IsValid() const {
    // All weights must be non-negative
    if (emotional_weight < 0.0 || recency_weight < 0.0 || uniqueness_weight < 0.0 ||
        pattern_weight < 0.0 || resonance_weight < 0.0) {
        return false;
    }

    // Weights must sum to approximately 1.0
    double sum = emotional_weight + recency_weight + uniqueness_weight +
                 pattern_weight + resonance_weight;
    if (std::abs(sum - 1.0) > 0.01) {
        return false;
    }

    if (recency_decay < 0.0 || recency_floor < 0.0 || recency_floor > 1.0) {
        return false;
    }

    if (medium_threshold > high_threshold) {
        return false;
    }

    return true;
}

// ============================================================================
// ImportanceScorer
// ============================================================================

ImportanceScorer::ImportanceScorer()
    : config_(Config{}) {
    ValidateWeights();
}

ImportanceScorer::ImportanceScorer(const Config& config)
    : config_(config) {
    ValidateWeights();
}

void ImportanceScorer::ValidateWeights() const {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid ImportanceScorer configuration");
    }
}

void ImportanceScorer::SetConfig(const Config& config) {
    if (!config.IsValid()) {
        throw std::invalid_argument("Invalid ImportanceScorer configuration");
    }
    config_ = config;
}

MemoryScore ImportanceScorer::Score(
    const EpisodicMemory& memory,
    const VocabularyStore& vocabulary,
    const PatternIndex& patterns,
    double contextual_alignment,
    Timestamp now) const {

    const double emotional = EmotionalIntensity(memory);
    const double recency = TemporalRecency(memory, now);
    const double uniqueness = InformationUniqueness(memory, vocabulary);
    const double relevance = PatternRelevance(memory, patterns);
    const double resonance = SafeValue(contextual_alignment, defaults::kContextualAlignment,
                                       "contextual_alignment");

    MemoryScore score;
    score.factors = {
        {kEmotionalFactor, emotional},
        {kRecencyFactor, recency},
        {kUniquenessFactor, uniqueness},
        {kPatternFactor, relevance},
        {kResonanceFactor, resonance},
    };

    score.total_importance = config_.emotional_weight * emotional +
                             config_.recency_weight * recency +
                             config_.uniqueness_weight * uniqueness +
                             config_.pattern_weight * relevance +
                             config_.resonance_weight * resonance;
    score.priority = ClassifyPriority(score.total_importance);

    return score;
}

std::vector<MemoryScore> ImportanceScorer::ScoreAll(
    const EpisodicStore& store,
    const VocabularyStore& vocabulary,
    const PatternIndex& patterns,
    double contextual_alignment,
    Timestamp now) const {

    const auto& memories = store.All();
    std::vector<MemoryScore> scores(memories.size());
    const int64_t count = static_cast<int64_t>(memories.size());

    #pragma omp parallel for schedule(dynamic, 32)
    for (int64_t i = 0; i < count; ++i) {
        scores[i] = Score(memories[i], vocabulary, patterns, contextual_alignment, now);
    }

    return scores;
}

PriorityTier ImportanceScorer::ClassifyPriority(double total_importance) const {
    if (total_importance > config_.high_threshold) {
        return PriorityTier::HIGH;
    }
    if (total_importance > config_.medium_threshold) {
        return PriorityTier::MEDIUM;
    }
    return PriorityTier::LOW;
}

// ============================================================================
// Factors
// ============================================================================

double ImportanceScorer::EmotionalIntensity(const EpisodicMemory& memory) const {
    return std::min(std::abs(SafeValue(memory.emotional_weight, defaults::kEmotionalWeight,
                                       "emotional_weight")), 1.0);
}

double ImportanceScorer::TemporalRecency(const EpisodicMemory& memory, Timestamp now) const {
    // Records stamped after now count as brand new
    double age_hours = now > memory.timestamp ? now.HoursFrom(memory.timestamp) : 0.0;
    double recency = 1.0 / (1.0 + age_hours * config_.recency_decay);
    return std::max(recency, config_.recency_floor);
}

double ImportanceScorer::InformationUniqueness(
    const EpisodicMemory& memory,
    const VocabularyStore& vocabulary) const {

    double rarity = 0.0;
    for (const auto& token : text::SplitWhitespace(memory.content)) {
        const WordKnowledge* known = vocabulary.Find(text::ToLower(token));
        rarity += known ? 1.0 / (known->frequency + 1.0) : 1.0;
    }

    double length = static_cast<double>(std::max<size_t>(memory.content.size(), 1));
    return std::min(SafeDivide(rarity, length, 0.0), 1.0);
}

double ImportanceScorer::PatternRelevance(
    const EpisodicMemory& memory,
    const PatternIndex& patterns) const {

    double contained = patterns.ContainedStrength(memory.content);
    double count = static_cast<double>(std::max<size_t>(patterns.PatternCount(), 1));
    return std::min(SafeDivide(contained, count, 0.0), 1.0);
}

} // namespace engram
