// File: src/storage/sigel_serializer.hpp
//
// JSON encoding of a whole Sigel.
//
// Layout (format_version 1):
//   { "format_version", "id", "name", "version", "created_at", "last_evolved",
//     "contextual_alignment", "learning_state": {...},
//     "vocabulary": { word: {frequency, contexts, emotional_valence, semantic_weight} },
//     "patterns": { "linguistic": {ngram: strength},
//                   "semantic": {word: [neighbors]},
//                   "temporal": [{sequence, frequency, context_relevance}] },
//     "episodic": [{id, timestamp, content, context, emotional_weight, relevance_score}] }
//
// Timestamps are integer microseconds since the Unix epoch. Every floating
// field goes through SafeValue() on the way out and on the way back in, so
// NaN and infinity never reach the document and a null or missing number
// reads back as its documented default.

#pragma once

#include "core/sigel.hpp"
#include <json/json.h>
#include <string>

namespace engram {

class SigelSerializer {
public:
    struct Config {
        VocabularyStore::Config vocabulary;   ///< Applied to decoded Sigels
        PatternIndex::Config patterns;        ///< Applied to decoded Sigels
        bool pretty{true};                    ///< Indented output
    };

    static constexpr int kFormatVersion = 1;

    SigelSerializer() = default;
    explicit SigelSerializer(const Config& config) : config_(config) {}

    Json::Value ToJson(const Sigel& sigel) const;

    /// @throws StorageError if the document is not a version-1 Sigel
    Sigel FromJson(const Json::Value& root) const;

    std::string Serialize(const Sigel& sigel) const;

    /// @throws StorageError if document is not valid JSON or not a Sigel
    Sigel Deserialize(const std::string& document) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace engram
