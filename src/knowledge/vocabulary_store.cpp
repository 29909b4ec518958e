// File: src/knowledge/vocabulary_store.cpp
#include "knowledge/vocabulary_store.hpp"
#include "core/numeric_safety.hpp"
#include <algorithm>
#include <stdexcept>

namespace engram {

VocabularyStore::VocabularyStore(const Config& config)
    : config_(config) {
    if (config_.max_contexts_per_word == 0) {
        throw std::invalid_argument("max_contexts_per_word must be > 0");
    }
}

void VocabularyStore::Learn(const std::string& word, const std::string& context) {
    auto [it, inserted] = words_.try_emplace(word);
    WordKnowledge& knowledge = it->second;

    if (!inserted) {
        knowledge.frequency += 1.0;
    }

    auto& contexts = knowledge.contexts;
    if (contexts.size() < config_.max_contexts_per_word &&
        std::find(contexts.begin(), contexts.end(), context) == contexts.end()) {
        contexts.push_back(context);
    }
}

const WordKnowledge* VocabularyStore::Find(const std::string& word) const {
    auto it = words_.find(word);
    return it == words_.end() ? nullptr : &it->second;
}

double VocabularyStore::GetFrequency(const std::string& word) const {
    const WordKnowledge* knowledge = Find(word);
    return knowledge ? knowledge->frequency : 0.0;
}

void VocabularyStore::Put(const std::string& word, WordKnowledge knowledge) {
    words_[word] = std::move(knowledge);
}

size_t VocabularyStore::Sanitize() {
    size_t changed = 0;

    for (auto& [word, knowledge] : words_) {
        double frequency = SafeValue(knowledge.frequency, defaults::kWordFrequency, "word.frequency");
        frequency = std::max(0.0, frequency);
        double valence = SafeValue(knowledge.emotional_valence, defaults::kEmotionalValence,
                                   "word.emotional_valence");
        valence = std::clamp(valence, -1.0, 1.0);
        double weight = SafeValue(knowledge.semantic_weight, defaults::kSemanticWeight,
                                  "word.semantic_weight");
        weight = std::max(0.0, weight);

        // NaN never compares equal, so a replaced NaN always counts
        if (!(frequency == knowledge.frequency)) ++changed;
        if (!(valence == knowledge.emotional_valence)) ++changed;
        if (!(weight == knowledge.semantic_weight)) ++changed;

        knowledge.frequency = frequency;
        knowledge.emotional_valence = valence;
        knowledge.semantic_weight = weight;
    }

    return changed;
}

} // namespace engram
