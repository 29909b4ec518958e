// File: src/storage/sigel_serializer.cpp
#include "storage/sigel_serializer.hpp"
#include "core/numeric_safety.hpp"
#include "storage/storage_error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <sstream>

namespace engram {

namespace {

Json::Value SafeNumber(double value, double fallback, const char* field) {
    return Json::Value(SafeValue(value, fallback, field));
}

/// Numeric member of object, fallback when missing, null or non-finite
double ReadDouble(const Json::Value& object, const char* key, double fallback) {
    const Json::Value& value = object[key];
    if (!value.isNumeric()) {
        if (!value.isNull() || object.isMember(key)) {
            spdlog::warn("Non-numeric '{}' replaced with {}", key, fallback);
        }
        return fallback;
    }
    return SafeValue(value.asDouble(), fallback, key);
}

int64_t ReadInt64(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isInt64()) {
        throw StorageError(std::string("Missing or invalid integer field '") + key + "'");
    }
    return value.asInt64();
}

std::string ReadString(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isString()) {
        throw StorageError(std::string("Missing or invalid string field '") + key + "'");
    }
    return value.asString();
}

std::vector<std::string> ReadStringArray(const Json::Value& array, const char* field) {
    if (!array.isArray()) {
        throw StorageError(std::string("Field '") + field + "' must be an array");
    }
    std::vector<std::string> result;
    result.reserve(array.size());
    for (const auto& item : array) {
        if (!item.isString()) {
            throw StorageError(std::string("Field '") + field + "' must hold strings");
        }
        result.push_back(item.asString());
    }
    return result;
}

const Json::Value& RequireObject(const Json::Value& parent, const char* key) {
    const Json::Value& value = parent[key];
    if (!value.isObject()) {
        throw StorageError(std::string("Missing object '") + key + "'");
    }
    return value;
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

Json::Value SigelSerializer::ToJson(const Sigel& sigel) const {
    Json::Value root(Json::objectValue);
    root["format_version"] = kFormatVersion;
    root["id"] = sigel.GetId();
    root["name"] = sigel.GetName();
    root["version"] = sigel.GetVersion();
    root["created_at"] = Json::Int64(sigel.GetCreatedAt().ToMicros());
    root["last_evolved"] = Json::Int64(sigel.GetLastEvolved().ToMicros());
    root["contextual_alignment"] = SafeNumber(sigel.GetContextualAlignment(),
                                              defaults::kContextualAlignment, "contextual_alignment");

    const LearningState& learning = sigel.Learning();
    Json::Value& state = root["learning_state"];
    state["training_iterations"] = Json::UInt64(learning.training_iterations);
    state["text_corpus_size"] = Json::UInt64(learning.text_corpus_size);
    state["learning_rate"] = SafeNumber(learning.learning_rate, defaults::kLearningRate, "learning_rate");

    Json::Value& vocabulary = root["vocabulary"];
    vocabulary = Json::Value(Json::objectValue);
    for (const auto& [word, knowledge] : sigel.Vocabulary()) {
        Json::Value entry(Json::objectValue);
        entry["frequency"] = SafeNumber(knowledge.frequency, defaults::kWordFrequency, "frequency");
        Json::Value contexts(Json::arrayValue);
        for (const auto& context : knowledge.contexts) {
            contexts.append(context);
        }
        entry["contexts"] = contexts;
        entry["emotional_valence"] = SafeNumber(knowledge.emotional_valence,
                                                defaults::kEmotionalValence, "emotional_valence");
        entry["semantic_weight"] = SafeNumber(knowledge.semantic_weight,
                                              defaults::kSemanticWeight, "semantic_weight");
        vocabulary[word] = entry;
    }

    const PatternIndex& index = sigel.Patterns();
    Json::Value& patterns = root["patterns"];
    Json::Value linguistic(Json::objectValue);
    index.ForEachPattern([&linguistic](const std::string& pattern, double strength) {
        linguistic[pattern] = SafeNumber(strength, defaults::kPatternStrength, "pattern.strength");
    });
    patterns["linguistic"] = linguistic;

    Json::Value semantic(Json::objectValue);
    index.ForEachNeighborList([&semantic](const std::string& word, const std::vector<std::string>& neighbors) {
        Json::Value list(Json::arrayValue);
        for (const auto& neighbor : neighbors) {
            list.append(neighbor);
        }
        semantic[word] = list;
    });
    patterns["semantic"] = semantic;

    Json::Value temporal(Json::arrayValue);
    for (const auto& pattern : index.TemporalPatterns()) {
        Json::Value entry(Json::objectValue);
        Json::Value sequence(Json::arrayValue);
        for (const auto& token : pattern.sequence) {
            sequence.append(token);
        }
        entry["sequence"] = sequence;
        entry["frequency"] = SafeNumber(pattern.frequency, defaults::kTemporalFrequency,
                                        "temporal.frequency");
        entry["context_relevance"] = SafeNumber(pattern.context_relevance, defaults::kContextRelevance,
                                                "temporal.context_relevance");
        temporal.append(entry);
    }
    patterns["temporal"] = temporal;

    Json::Value episodic(Json::arrayValue);
    for (const auto& memory : sigel.Episodes()) {
        Json::Value entry(Json::objectValue);
        entry["id"] = Json::UInt64(memory.id.value());
        entry["timestamp"] = Json::Int64(memory.timestamp.ToMicros());
        entry["content"] = memory.content;
        entry["context"] = memory.context;
        entry["emotional_weight"] = SafeNumber(memory.emotional_weight, defaults::kEmotionalWeight,
                                               "emotional_weight");
        entry["relevance_score"] = SafeNumber(memory.relevance_score, defaults::kRelevanceScore,
                                              "relevance_score");
        episodic.append(entry);
    }
    root["episodic"] = episodic;

    return root;
}

std::string SigelSerializer::Serialize(const Sigel& sigel) const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = config_.pretty ? "  " : "";
    builder["precision"] = 17;
    return Json::writeString(builder, ToJson(sigel));
}

// ============================================================================
// Decoding
// ============================================================================

Sigel SigelSerializer::FromJson(const Json::Value& root) const {
    if (!root.isObject()) {
        throw StorageError("Sigel document must be a JSON object");
    }

    const Json::Value& version = root["format_version"];
    if (!version.isInt() || version.asInt() != kFormatVersion) {
        throw StorageError("Unsupported sigel format version");
    }

    Sigel sigel(ReadString(root, "name"), config_.vocabulary, config_.patterns);
    sigel.SetId(ReadString(root, "id"));
    if (root["version"].isString()) {
        sigel.SetVersion(root["version"].asString());
    }
    sigel.SetCreatedAt(Timestamp::FromMicros(ReadInt64(root, "created_at")));
    sigel.SetLastEvolved(Timestamp::FromMicros(ReadInt64(root, "last_evolved")));
    sigel.SetContextualAlignment(ReadDouble(root, "contextual_alignment", defaults::kContextualAlignment));

    const Json::Value& state = RequireObject(root, "learning_state");
    LearningState& learning = sigel.Learning();
    learning.training_iterations = state["training_iterations"].isUInt64()
        ? state["training_iterations"].asUInt64() : 0;
    learning.text_corpus_size = state["text_corpus_size"].isUInt64()
        ? state["text_corpus_size"].asUInt64() : 0;
    learning.learning_rate = ReadDouble(state, "learning_rate", defaults::kLearningRate);

    const Json::Value& vocabulary = RequireObject(root, "vocabulary");
    for (const auto& word : vocabulary.getMemberNames()) {
        const Json::Value& entry = vocabulary[word];
        if (!entry.isObject()) {
            throw StorageError("Vocabulary entry '" + word + "' must be an object");
        }
        WordKnowledge knowledge;
        knowledge.frequency = ReadDouble(entry, "frequency", defaults::kWordFrequency);
        knowledge.contexts = ReadStringArray(entry["contexts"], "contexts");
        knowledge.emotional_valence = ReadDouble(entry, "emotional_valence", defaults::kEmotionalValence);
        knowledge.semantic_weight = ReadDouble(entry, "semantic_weight", defaults::kSemanticWeight);
        sigel.Vocabulary().Put(word, std::move(knowledge));
    }

    const Json::Value& patterns = RequireObject(root, "patterns");
    PatternIndex& index = sigel.Patterns();

    const Json::Value& linguistic = RequireObject(patterns, "linguistic");
    for (const auto& pattern : linguistic.getMemberNames()) {
        index.Reinforce(pattern, ReadDouble(linguistic, pattern.c_str(), defaults::kPatternStrength));
    }

    const Json::Value& semantic = RequireObject(patterns, "semantic");
    for (const auto& word : semantic.getMemberNames()) {
        index.SetNeighbors(word, ReadStringArray(semantic[word], "semantic"));
    }

    const Json::Value& temporal = patterns["temporal"];
    if (!temporal.isArray()) {
        throw StorageError("Field 'temporal' must be an array");
    }
    for (const auto& entry : temporal) {
        TemporalPattern pattern;
        pattern.sequence = ReadStringArray(entry["sequence"], "sequence");
        pattern.frequency = ReadDouble(entry, "frequency", defaults::kTemporalFrequency);
        pattern.context_relevance = ReadDouble(entry, "context_relevance", defaults::kContextRelevance);
        index.AppendTemporal(std::move(pattern));
    }

    const Json::Value& episodic = root["episodic"];
    if (!episodic.isArray()) {
        throw StorageError("Field 'episodic' must be an array");
    }
    MemoryID::ValueType highest_id = 0;
    for (const auto& entry : episodic) {
        EpisodicMemory memory;
        const Json::Value& id = entry["id"];
        if (!id.isUInt64()) {
            throw StorageError("Episodic record without a valid id");
        }
        memory.id = MemoryID(id.asUInt64());
        memory.timestamp = Timestamp::FromMicros(ReadInt64(entry, "timestamp"));
        memory.content = ReadString(entry, "content");
        memory.context = ReadString(entry, "context");
        memory.emotional_weight = ReadDouble(entry, "emotional_weight", defaults::kEmotionalWeight);
        memory.relevance_score = ReadDouble(entry, "relevance_score", defaults::kRelevanceScore);
        highest_id = std::max(highest_id, memory.id.value());
        sigel.Episodes().Append(std::move(memory));
    }
    MemoryID::ReserveThrough(highest_id);

    size_t fixed = sigel.Sanitize();
    if (fixed > 0) {
        spdlog::warn("Sanitized {} values while loading '{}'", fixed, sigel.GetName());
    }

    return sigel;
}

Sigel SigelSerializer::Deserialize(const std::string& document) const {
    Json::CharReaderBuilder builder;
    builder["allowSpecialFloats"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(document.data(), document.data() + document.size(), &root, &errors)) {
        throw StorageError("Invalid sigel document: " + errors);
    }

    return FromJson(root);
}

} // namespace engram
