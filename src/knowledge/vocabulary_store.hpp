// File: src/knowledge/vocabulary_store.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

/// What the engine knows about a single word
struct WordKnowledge {
    double frequency{1.0};              ///< Occurrence count, seeded to 1.0
    std::vector<std::string> contexts;  ///< Distinct "left right" neighbor pairs
    double emotional_valence{0.0};      ///< In [-1, 1]
    double semantic_weight{1.0};        ///< Non-negative
};

/// VocabularyStore: word -> WordKnowledge
///
/// Frequencies only ever grow through Learn(). The context list of a word
/// is bounded; once full, further contexts are ignored.
class VocabularyStore {
public:
    struct Config {
        size_t max_contexts_per_word{32};
    };

    using Map = std::unordered_map<std::string, WordKnowledge>;
    using const_iterator = Map::const_iterator;

    VocabularyStore() = default;

    /// @throws std::invalid_argument if max_contexts_per_word == 0
    explicit VocabularyStore(const Config& config);

    /// Record one occurrence of word seen between the words in context.
    /// The first occurrence creates the entry with frequency 1.0; later
    /// occurrences add 1.0.
    void Learn(const std::string& word, const std::string& context);

    /// Lookup, nullptr if unknown
    const WordKnowledge* Find(const std::string& word) const;

    /// Frequency of word, 0.0 if unknown
    double GetFrequency(const std::string& word) const;

    bool Contains(const std::string& word) const { return words_.count(word) > 0; }
    size_t Size() const { return words_.size(); }
    bool Empty() const { return words_.empty(); }

    /// Insert or replace an entry verbatim (used when restoring a snapshot)
    void Put(const std::string& word, WordKnowledge knowledge);

    /// Replace non-finite fields with defaults, clamp valence to [-1,1] and
    /// negative frequency/weight to 0
    /// @return Number of fields changed
    size_t Sanitize();

    void Clear() { words_.clear(); }

    const Config& GetConfig() const { return config_; }

    const_iterator begin() const { return words_.begin(); }
    const_iterator end() const { return words_.end(); }

private:
    Config config_;
    Map words_;
};

} // namespace engram
