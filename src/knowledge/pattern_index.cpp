// File: src/knowledge/pattern_index.cpp
#include "knowledge/pattern_index.hpp"
#include "core/numeric_safety.hpp"
#include "learning/text_processing.hpp"
#include <algorithm>
#include <stdexcept>

namespace engram {

PatternIndex::PatternIndex(const Config& config)
    : config_(config) {
    if (config_.max_semantic_neighbors == 0) {
        throw std::invalid_argument("max_semantic_neighbors must be > 0");
    }
}

// ============================================================================
// Linguistic patterns
// ============================================================================

void PatternIndex::Reinforce(const std::string& pattern, double delta, double ceiling) {
    double& strength = patterns_[pattern];
    strength = std::max(0.0, strength + delta);
    strength = std::min(strength, ceiling);
}

double PatternIndex::GetStrength(const std::string& pattern) const {
    auto it = patterns_.find(pattern);
    return it == patterns_.end() ? 0.0 : it->second;
}

void PatternIndex::Decay(double rate) {
    if (rate < 0.0 || rate > 1.0) {
        throw std::invalid_argument("decay rate must be in [0,1]");
    }

    const double factor = 1.0 - rate;
    for (auto& [pattern, strength] : patterns_) {
        strength = std::max(0.0, strength * factor);
    }
}

size_t PatternIndex::Prune(double threshold) {
    size_t removed = 0;
    for (auto it = patterns_.begin(); it != patterns_.end();) {
        if (it->second <= threshold) {
            it = patterns_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

double PatternIndex::ContainedStrength(const std::string& text) const {
    double total = 0.0;
    for (const auto& [pattern, strength] : patterns_) {
        if (text::Contains(text, pattern)) {
            total += strength;
        }
    }
    return total;
}

// ============================================================================
// Semantic network
// ============================================================================

bool PatternIndex::AddAssociation(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty() || a == b) {
        return false;
    }

    bool forward = AddNeighbor(a, b);
    bool backward = AddNeighbor(b, a);
    return forward || backward;
}

bool PatternIndex::AddNeighbor(const std::string& from, const std::string& to) {
    auto& neighbors = semantic_[from];
    if (neighbors.size() >= config_.max_semantic_neighbors) {
        return false;
    }
    if (std::find(neighbors.begin(), neighbors.end(), to) != neighbors.end()) {
        return false;
    }
    neighbors.push_back(to);
    return true;
}

const std::vector<std::string>& PatternIndex::Neighbors(const std::string& word) const {
    static const std::vector<std::string> kEmpty;
    auto it = semantic_.find(word);
    return it == semantic_.end() ? kEmpty : it->second;
}

size_t PatternIndex::NormalizeNeighbors() {
    size_t removed = 0;

    for (auto& [word, neighbors] : semantic_) {
        size_t before = neighbors.size();

        std::sort(neighbors.begin(), neighbors.end());
        neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
        neighbors.erase(std::remove(neighbors.begin(), neighbors.end(), word), neighbors.end());
        if (neighbors.size() > config_.max_semantic_neighbors) {
            neighbors.resize(config_.max_semantic_neighbors);
        }

        removed += before - neighbors.size();
    }

    return removed;
}

void PatternIndex::SetNeighbors(const std::string& word, std::vector<std::string> neighbors) {
    std::sort(neighbors.begin(), neighbors.end());
    neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
    neighbors.erase(std::remove(neighbors.begin(), neighbors.end(), word), neighbors.end());
    if (neighbors.size() > config_.max_semantic_neighbors) {
        neighbors.resize(config_.max_semantic_neighbors);
    }
    semantic_[word] = std::move(neighbors);
}

size_t PatternIndex::SemanticEdgeCount() const {
    size_t total = 0;
    for (const auto& [word, neighbors] : semantic_) {
        total += neighbors.size();
    }
    return total;
}

// ============================================================================
// Temporal patterns
// ============================================================================

std::string PatternIndex::TemporalKey(const TemporalPattern& pattern) {
    if (pattern.sequence.size() < 4) {
        return {};
    }
    return text::ToLower(text::Join(pattern.sequence, 0, 3));
}

void PatternIndex::AppendTemporal(TemporalPattern pattern) {
    temporal_keys_.push_back(TemporalKey(pattern));
    temporal_.push_back(std::move(pattern));
}

std::optional<std::string> PatternIndex::MatchTemporal(const std::string& context_key) const {
    const std::string needle = text::ToLower(context_key);

    for (size_t i = 0; i < temporal_.size(); ++i) {
        if (temporal_[i].sequence.size() < 4) {
            continue;
        }
        if (text::Contains(temporal_keys_[i], needle)) {
            return temporal_[i].sequence[3];
        }
    }

    return std::nullopt;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t PatternIndex::Sanitize() {
    size_t changed = 0;

    for (auto& [pattern, strength] : patterns_) {
        double safe = std::max(0.0, SafeValue(strength, defaults::kPatternStrength, "pattern.strength"));
        if (!(safe == strength)) ++changed;
        strength = safe;
    }

    for (auto& pattern : temporal_) {
        double frequency = std::max(0.0, SafeValue(pattern.frequency, defaults::kTemporalFrequency,
                                                   "temporal.frequency"));
        double relevance = std::max(0.0, SafeValue(pattern.context_relevance, defaults::kContextRelevance,
                                                   "temporal.context_relevance"));
        if (!(frequency == pattern.frequency)) ++changed;
        if (!(relevance == pattern.context_relevance)) ++changed;
        pattern.frequency = frequency;
        pattern.context_relevance = relevance;
    }

    return changed;
}

void PatternIndex::Clear() {
    patterns_.clear();
    semantic_.clear();
    temporal_.clear();
    temporal_keys_.clear();
}

} // namespace engram
