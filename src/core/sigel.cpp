// File: src/core/sigel.cpp
#include "core/sigel.hpp"
#include "core/numeric_safety.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace engram {

Sigel::Sigel(std::string name,
             const VocabularyStore::Config& vocabulary_config,
             const PatternIndex::Config& pattern_config)
    : id_(GenerateId()),
      name_(std::move(name)),
      created_at_(Timestamp::Now()),
      last_evolved_(created_at_),
      vocabulary_(vocabulary_config),
      patterns_(pattern_config) {
}

std::string Sigel::GenerateId() {
    // 128 random bits rendered as a version-4 UUID
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) | rd());
    uint64_t hi = gen();
    uint64_t lo = gen();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

void Sigel::MarkEvolved(Timestamp now) {
    last_evolved_ = now;
    learning_.training_iterations += 1;
}

const EpisodicMemory& Sigel::AddMemory(const std::string& content,
                                       const std::string& context,
                                       double emotional_weight,
                                       Timestamp timestamp) {
    return episodes_.Append(content, context, emotional_weight, timestamp);
}

size_t Sigel::Sanitize() {
    size_t changed = vocabulary_.Sanitize() + patterns_.Sanitize() + episodes_.Sanitize();

    double alignment = SafeValue(contextual_alignment_, defaults::kContextualAlignment,
                                 "contextual_alignment");
    if (!(alignment == contextual_alignment_)) ++changed;
    contextual_alignment_ = alignment;

    double rate = SafeValue(learning_.learning_rate, defaults::kLearningRate, "learning_rate");
    if (!(rate == learning_.learning_rate)) ++changed;
    learning_.learning_rate = rate;

    return changed;
}

} // namespace engram
