// File: src/knowledge/pattern_index.hpp
#pragma once

#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

/// A stored 4-token sequence: three context tokens followed by the token
/// that came next. Used as a naive next-token predictor.
struct TemporalPattern {
    std::vector<std::string> sequence;
    double frequency{0.0};          ///< Reinforcement strength
    double context_relevance{1.0};
};

/// PatternIndex: linguistic n-gram strengths, semantic adjacency and
/// temporal sequences.
///
/// The underlying maps are never handed out mutably. Callers go through
/// Reinforce/Decay/Prune for strengths, AddAssociation/NormalizeNeighbors
/// for adjacency and AppendTemporal for sequences.
///
/// Invariants:
/// - every strength is finite and >= 0
/// - every adjacency list holds at most max_semantic_neighbors distinct
///   words and never the word itself
class PatternIndex {
public:
    struct Config {
        size_t max_semantic_neighbors{20};
    };

    static constexpr double kNoCeiling = std::numeric_limits<double>::infinity();

    PatternIndex() = default;

    /// @throws std::invalid_argument if max_semantic_neighbors == 0
    explicit PatternIndex(const Config& config);

    // ========================================================================
    // Linguistic patterns
    // ========================================================================

    /// strength(pattern) = min(max(strength + delta, 0), ceiling).
    /// Creates the pattern at 0 first if it does not exist.
    void Reinforce(const std::string& pattern, double delta, double ceiling = kNoCeiling);

    /// Current strength, 0.0 if absent
    double GetStrength(const std::string& pattern) const;

    bool HasPattern(const std::string& pattern) const { return patterns_.count(pattern) > 0; }
    size_t PatternCount() const { return patterns_.size(); }

    /// Multiply every strength by (1 - rate)
    /// @throws std::invalid_argument if rate is outside [0, 1]
    void Decay(double rate);

    /// Remove every pattern whose strength is <= threshold
    /// @return Number of patterns removed
    size_t Prune(double threshold);

    /// Sum of the strengths of all patterns that occur as substrings of text
    double ContainedStrength(const std::string& text) const;

    /// Visit (pattern, strength) pairs
    template <typename Fn>
    void ForEachPattern(Fn&& fn) const {
        for (const auto& [pattern, strength] : patterns_) {
            fn(pattern, strength);
        }
    }

    // ========================================================================
    // Semantic network
    // ========================================================================

    /// Add a <-> b. Each direction is added only if the word is not already
    /// listed and the list has spare capacity. Empty words and self-edges
    /// are ignored.
    /// @return true if at least one direction was added
    bool AddAssociation(const std::string& a, const std::string& b);

    /// Neighbors of word (empty if unknown)
    const std::vector<std::string>& Neighbors(const std::string& word) const;

    /// Sort, deduplicate and truncate every adjacency list
    /// @return Number of entries removed
    size_t NormalizeNeighbors();

    /// Replace the adjacency list of word (used when restoring a snapshot);
    /// the list is normalized on insertion
    void SetNeighbors(const std::string& word, std::vector<std::string> neighbors);

    size_t SemanticWordCount() const { return semantic_.size(); }

    /// Total number of directed edges
    size_t SemanticEdgeCount() const;

    /// Visit (word, neighbors) pairs
    template <typename Fn>
    void ForEachNeighborList(Fn&& fn) const {
        for (const auto& [word, neighbors] : semantic_) {
            fn(word, neighbors);
        }
    }

    // ========================================================================
    // Temporal patterns
    // ========================================================================

    /// Append a sequence; duplicates are kept on purpose
    void AppendTemporal(TemporalPattern pattern);

    const std::vector<TemporalPattern>& TemporalPatterns() const { return temporal_; }
    size_t TemporalCount() const { return temporal_.size(); }

    /// Fourth token of the first stored sequence (insertion order) whose
    /// first three tokens, joined and lower-cased, contain context_key
    /// lower-cased
    std::optional<std::string> MatchTemporal(const std::string& context_key) const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Replace non-finite values with defaults and clamp negatives to 0
    /// @return Number of values changed
    size_t Sanitize();

    void Clear();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::unordered_map<std::string, double> patterns_;
    std::unordered_map<std::string, std::vector<std::string>> semantic_;
    std::vector<TemporalPattern> temporal_;

    // Lower-cased "w1 w2 w3" of temporal_[i], empty for short sequences
    std::vector<std::string> temporal_keys_;

    bool AddNeighbor(const std::string& from, const std::string& to);

    static std::string TemporalKey(const TemporalPattern& pattern);
};

} // namespace engram
