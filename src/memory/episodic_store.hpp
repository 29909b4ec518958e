// File: src/memory/episodic_store.hpp
#pragma once

#include "core/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace engram {

/// A single timestamped experience
struct EpisodicMemory {
    MemoryID id;
    Timestamp timestamp;
    std::string content;
    std::string context;            ///< Source tag ("consolidated_memory" for summaries)
    double emotional_weight{0.0};   ///< In [-1, 1]
    double relevance_score{1.0};    ///< Written only by consolidation
};

/// EpisodicStore: insertion-ordered record log
///
/// Records are only appended during learning. Consolidation is the only
/// caller that removes records (RetainIf) or rewrites relevance.
class EpisodicStore {
public:
    using const_iterator = std::vector<EpisodicMemory>::const_iterator;

    EpisodicStore() = default;

    /// Append a new record with a fresh ID and relevance 1.0.
    /// emotional_weight is clamped to [-1, 1].
    /// @return Reference to the stored record (valid until the next mutation)
    const EpisodicMemory& Append(const std::string& content,
                                 const std::string& context,
                                 double emotional_weight,
                                 Timestamp timestamp = Timestamp::Now());

    /// Append a record verbatim (consolidated summaries, snapshot restore)
    void Append(EpisodicMemory memory);

    const EpisodicMemory& At(size_t index) const { return memories_.at(index); }
    const std::vector<EpisodicMemory>& All() const { return memories_; }

    size_t Size() const { return memories_.size(); }
    bool Empty() const { return memories_.empty(); }

    /// Overwrite the relevance score of the record at index
    /// @throws std::out_of_range if index is invalid
    void SetRelevance(size_t index, double relevance);

    /// Keep only records for which keep() returns true, preserving order
    /// @return Number of records removed
    size_t RetainIf(const std::function<bool(const EpisodicMemory&)>& keep);

    /// Number of records with the given context tag
    size_t CountByContext(const std::string& context) const;

    /// Replace non-finite weights/relevance with defaults, clamp weights
    /// @return Number of fields changed
    size_t Sanitize();

    void Clear() { memories_.clear(); }

    const_iterator begin() const { return memories_.begin(); }
    const_iterator end() const { return memories_.end(); }

private:
    std::vector<EpisodicMemory> memories_;
};

} // namespace engram
