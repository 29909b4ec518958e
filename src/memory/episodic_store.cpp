// File: src/memory/episodic_store.cpp
#include "memory/episodic_store.hpp"
#include "core/numeric_safety.hpp"
#include <algorithm>

namespace engram {

const EpisodicMemory& EpisodicStore::Append(const std::string& content,
                                            const std::string& context,
                                            double emotional_weight,
                                            Timestamp timestamp) {
    EpisodicMemory memory;
    memory.id = MemoryID::Generate();
    memory.timestamp = timestamp;
    memory.content = content;
    memory.context = context;
    memory.emotional_weight = ClampSafe(emotional_weight, -1.0, 1.0);
    memory.relevance_score = 1.0;

    memories_.push_back(std::move(memory));
    return memories_.back();
}

void EpisodicStore::Append(EpisodicMemory memory) {
    if (!memory.id.IsValid()) {
        memory.id = MemoryID::Generate();
    }
    memories_.push_back(std::move(memory));
}

void EpisodicStore::SetRelevance(size_t index, double relevance) {
    memories_.at(index).relevance_score = relevance;
}

size_t EpisodicStore::RetainIf(const std::function<bool(const EpisodicMemory&)>& keep) {
    size_t before = memories_.size();
    memories_.erase(
        std::remove_if(memories_.begin(), memories_.end(),
            [&keep](const EpisodicMemory& m) { return !keep(m); }),
        memories_.end());
    return before - memories_.size();
}

size_t EpisodicStore::CountByContext(const std::string& context) const {
    return static_cast<size_t>(std::count_if(memories_.begin(), memories_.end(),
        [&context](const EpisodicMemory& m) { return m.context == context; }));
}

size_t EpisodicStore::Sanitize() {
    size_t changed = 0;

    for (auto& memory : memories_) {
        double weight = SafeValue(memory.emotional_weight, defaults::kEmotionalWeight,
                                  "episodic.emotional_weight");
        weight = std::clamp(weight, -1.0, 1.0);
        double relevance = SafeValue(memory.relevance_score, defaults::kRelevanceScore,
                                     "episodic.relevance_score");
        relevance = std::max(0.0, relevance);

        if (!(weight == memory.emotional_weight)) ++changed;
        if (!(relevance == memory.relevance_score)) ++changed;

        memory.emotional_weight = weight;
        memory.relevance_score = relevance;
    }

    return changed;
}

} // namespace engram
