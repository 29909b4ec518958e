// File: src/core/sigel.hpp
#pragma once

#include "core/types.hpp"
#include "knowledge/vocabulary_store.hpp"
#include "knowledge/pattern_index.hpp"
#include "memory/episodic_store.hpp"
#include <cstdint>
#include <string>

namespace engram {

/// Counters and rates of the learning loop
struct LearningState {
    uint64_t training_iterations{0};
    uint64_t text_corpus_size{0};   ///< Characters ingested so far
    double learning_rate{0.01};
};

/// Sigel: the owning entity of one associative memory
///
/// Aggregates the vocabulary, the pattern index and the episodic log plus
/// the small amount of derived state the learner and consolidator need.
/// A Sigel is plain data: it does no locking of its own. MemoryEngine
/// serializes access to it.
class Sigel {
public:
    static constexpr const char* kVersion = "0.1.0";

    /// Create an empty entity with a fresh id
    explicit Sigel(std::string name,
                   const VocabularyStore::Config& vocabulary_config = {},
                   const PatternIndex::Config& pattern_config = {});

    const std::string& GetId() const { return id_; }
    void SetId(std::string id) { id_ = std::move(id); }

    const std::string& GetName() const { return name_; }

    const std::string& GetVersion() const { return version_; }
    void SetVersion(std::string version) { version_ = std::move(version); }

    Timestamp GetCreatedAt() const { return created_at_; }
    void SetCreatedAt(Timestamp ts) { created_at_ = ts; }

    Timestamp GetLastEvolved() const { return last_evolved_; }
    void SetLastEvolved(Timestamp ts) { last_evolved_ = ts; }

    /// Record that a learning pass finished at now
    void MarkEvolved(Timestamp now = Timestamp::Now());

    /// Opaque external scalar used by the contextual-resonance scoring factor
    double GetContextualAlignment() const { return contextual_alignment_; }
    void SetContextualAlignment(double value) { contextual_alignment_ = value; }

    VocabularyStore& Vocabulary() { return vocabulary_; }
    const VocabularyStore& Vocabulary() const { return vocabulary_; }

    PatternIndex& Patterns() { return patterns_; }
    const PatternIndex& Patterns() const { return patterns_; }

    EpisodicStore& Episodes() { return episodes_; }
    const EpisodicStore& Episodes() const { return episodes_; }

    LearningState& Learning() { return learning_; }
    const LearningState& Learning() const { return learning_; }

    /// Convenience: append an episodic record
    const EpisodicMemory& AddMemory(const std::string& content,
                                    const std::string& context,
                                    double emotional_weight,
                                    Timestamp timestamp = Timestamp::Now());

    /// Run every store's sanitation pass and fix the scalar fields
    /// @return Number of values replaced or clamped
    size_t Sanitize();

private:
    std::string id_;
    std::string name_;
    std::string version_{kVersion};
    Timestamp created_at_;
    Timestamp last_evolved_;
    double contextual_alignment_{1.0};

    VocabularyStore vocabulary_;
    PatternIndex patterns_;
    EpisodicStore episodes_;
    LearningState learning_;

    static std::string GenerateId();
};

} // namespace engram
