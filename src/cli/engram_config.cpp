// File: src/cli/engram_config.cpp
//
// YAML Configuration Implementation for Engram

#include "cli/engram_config.hpp"
#include "core/logging.hpp"
#include <spdlog/spdlog.h>
#include <yaml.h>
#include <cctype>
#include <cmath>
#include <limits>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace engram {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Whole-string numeric parsing; a sign on an unsigned key or trailing
// characters are rejected with std::invalid_argument.
static double ParseDouble(const std::string& value) {
    size_t pos = 0;
    double result = std::stod(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters in '" + value + "'");
    }
    return result;
}

static uint64_t ParseUnsigned(const std::string& value) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw std::invalid_argument("not an unsigned integer: '" + value + "'");
    }
    size_t pos = 0;
    unsigned long long result = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters in '" + value + "'");
    }
    return static_cast<uint64_t>(result);
}

static size_t ParseSize(const std::string& value) {
    uint64_t result = ParseUnsigned(value);
    if (result > std::numeric_limits<size_t>::max()) {
        throw std::out_of_range("value too large: '" + value + "'");
    }
    return static_cast<size_t>(result);
}

// Apply one "section.key: value" pair. Unknown keys are ignored.
// Throws std::invalid_argument / std::out_of_range on malformed numbers.
static void ApplyValue(EngramConfig& config, const std::string& section,
                       const std::string& key, const std::string& value) {
    if (section == "engine") {
        if (key == "name") config.engine.name = value;
        else if (key == "seed") config.engine.seed = ParseUnsigned(value);
        else if (key == "state_dir") config.engine.state_dir = value;
        else if (key == "store") config.engine.store = value;
        else if (key == "db_path") config.engine.db_path = value;
    }
    else if (section == "learning") {
        if (key == "learning_rate") config.learning.learning_rate = ParseDouble(value);
        else if (key == "min_sample_size") config.learning.min_sample_size = ParseSize(value);
        else if (key == "max_sample_size") config.learning.max_sample_size = ParseSize(value);
        else if (key == "min_pattern_strength") config.learning.min_pattern_strength = ParseDouble(value);
        else if (key == "max_contexts_per_word") config.learning.max_contexts_per_word = ParseSize(value);
    }
    else if (section == "scoring") {
        if (key == "emotional_weight") config.scoring.emotional_weight = ParseDouble(value);
        else if (key == "recency_weight") config.scoring.recency_weight = ParseDouble(value);
        else if (key == "uniqueness_weight") config.scoring.uniqueness_weight = ParseDouble(value);
        else if (key == "pattern_weight") config.scoring.pattern_weight = ParseDouble(value);
        else if (key == "resonance_weight") config.scoring.resonance_weight = ParseDouble(value);
        else if (key == "contextual_alignment") config.scoring.contextual_alignment = ParseDouble(value);
    }
    else if (section == "clustering") {
        if (key == "similarity_threshold") config.clustering.similarity_threshold = ParseDouble(value);
    }
    else if (section == "consolidation") {
        if (key == "decay_rate") config.consolidation.decay_rate = ParseDouble(value);
        else if (key == "prune_threshold") config.consolidation.prune_threshold = ParseDouble(value);
        else if (key == "retention_threshold") config.consolidation.retention_threshold = ParseDouble(value);
        else if (key == "interval_hours") config.consolidation.interval_hours = ParseSize(value);
        else if (key == "deep_interval_hours") config.consolidation.deep_interval_hours = ParseSize(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
    }
}

std::optional<EngramConfig> EngramConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file: {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngramConfig> EngramConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        spdlog::error("Failed to initialize YAML parser");
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngramConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            spdlog::error("YAML parse error at line {}: {}",
                          parser.problem_mark.line + 1,
                          parser.problem ? parser.problem : "unknown");
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::invalid_argument&) {
                            spdlog::error("Invalid value for {}.{}: '{}'", current_section, current_key, value);
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        } catch (const std::out_of_range&) {
                            spdlog::error("Value out of range for {}.{}: '{}'", current_section, current_key, value);
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    std::vector<std::string> errors = config.GetValidationErrors();
    if (!errors.empty()) {
        spdlog::error("Configuration validation failed:");
        for (const auto& error : errors) {
            spdlog::error("  - {}", error);
        }
        return std::nullopt;
    }

    return config;
}

bool EngramConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open file for writing: {}", filepath);
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngramConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# Engram Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "engine:\n";
    ss << "  name: \"" << engine.name << "\"\n";
    ss << "  seed: " << engine.seed << "\n";
    ss << "  state_dir: \"" << engine.state_dir << "\"\n";
    ss << "  store: \"" << engine.store << "\"\n";
    ss << "  db_path: \"" << engine.db_path << "\"\n\n";

    ss << "learning:\n";
    ss << "  learning_rate: " << learning.learning_rate << "\n";
    ss << "  min_sample_size: " << learning.min_sample_size << "\n";
    ss << "  max_sample_size: " << learning.max_sample_size << "\n";
    ss << "  min_pattern_strength: " << learning.min_pattern_strength << "\n";
    ss << "  max_contexts_per_word: " << learning.max_contexts_per_word << "\n\n";

    ss << "scoring:\n";
    ss << "  emotional_weight: " << scoring.emotional_weight << "\n";
    ss << "  recency_weight: " << scoring.recency_weight << "\n";
    ss << "  uniqueness_weight: " << scoring.uniqueness_weight << "\n";
    ss << "  pattern_weight: " << scoring.pattern_weight << "\n";
    ss << "  resonance_weight: " << scoring.resonance_weight << "\n";
    ss << "  contextual_alignment: " << scoring.contextual_alignment << "\n\n";

    ss << "clustering:\n";
    ss << "  similarity_threshold: " << clustering.similarity_threshold << "\n\n";

    ss << "consolidation:\n";
    ss << "  decay_rate: " << consolidation.decay_rate << "\n";
    ss << "  prune_threshold: " << consolidation.prune_threshold << "\n";
    ss << "  retention_threshold: " << consolidation.retention_threshold << "\n";
    ss << "  interval_hours: " << consolidation.interval_hours << "\n";
    ss << "  deep_interval_hours: " << consolidation.deep_interval_hours << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";

    return ss.str();
}

bool EngramConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngramConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Engine
    if (engine.name.empty()) {
        errors.push_back("engine name must not be empty");
    }
    if (engine.name.find('/') != std::string::npos) {
        errors.push_back("engine name must not contain '/'");
    }
    if (engine.store != "file" && engine.store != "sqlite") {
        errors.push_back("store must be one of: file, sqlite");
    }
    if (engine.store == "file" && engine.state_dir.empty()) {
        errors.push_back("state_dir must not be empty for the file store");
    }
    if (engine.store == "sqlite" && engine.db_path.empty()) {
        errors.push_back("db_path must not be empty for the sqlite store");
    }

    // Learning
    if (!(learning.learning_rate > 0.0)) {
        errors.push_back("learning_rate must be greater than 0");
    }
    if (learning.max_sample_size < learning.min_sample_size) {
        errors.push_back("max_sample_size must be >= min_sample_size");
    }
    if (learning.min_pattern_strength < 0.0) {
        errors.push_back("min_pattern_strength must be non-negative");
    }
    if (learning.max_contexts_per_word == 0) {
        errors.push_back("max_contexts_per_word must be greater than 0");
    }

    // Scoring
    if (scoring.emotional_weight < 0.0 || scoring.recency_weight < 0.0 ||
        scoring.uniqueness_weight < 0.0 || scoring.pattern_weight < 0.0 ||
        scoring.resonance_weight < 0.0) {
        errors.push_back("scoring weights must be non-negative");
    }
    double sum = scoring.emotional_weight + scoring.recency_weight + scoring.uniqueness_weight +
                 scoring.pattern_weight + scoring.resonance_weight;
    if (std::abs(sum - 1.0) > 0.01) {
        errors.push_back("scoring weights must sum to 1.0");
    }
    if (!std::isfinite(scoring.contextual_alignment)) {
        errors.push_back("contextual_alignment must be finite");
    }

    // Clustering
    if (clustering.similarity_threshold < 0.0 || clustering.similarity_threshold > 1.0) {
        errors.push_back("similarity_threshold must be between 0.0 and 1.0");
    }

    // Consolidation
    if (consolidation.decay_rate < 0.0 || consolidation.decay_rate > 1.0) {
        errors.push_back("decay_rate must be between 0.0 and 1.0");
    }
    if (consolidation.prune_threshold < 0.0) {
        errors.push_back("prune_threshold must be non-negative");
    }
    if (consolidation.retention_threshold < 0.0) {
        errors.push_back("retention_threshold must be non-negative");
    }
    if (consolidation.interval_hours == 0 || consolidation.deep_interval_hours == 0) {
        errors.push_back("consolidation intervals must be greater than 0");
    }

    // Logging
    if (!IsValidLogLevel(logging.level)) {
        errors.push_back("logging level must be one of: trace, debug, info, warn, error, critical, off");
    }

    return errors;
}

MemoryEngine::Config EngramConfig::ToEngineConfig() const {
    MemoryEngine::Config config;
    config.name = engine.name;
    config.seed = engine.seed;
    config.learning_rate = learning.learning_rate;
    config.contextual_alignment = scoring.contextual_alignment;

    config.vocabulary.max_contexts_per_word = learning.max_contexts_per_word;

    config.learning.min_sample_size = learning.min_sample_size;
    config.learning.max_sample_size = learning.max_sample_size;
    config.learning.min_pattern_strength = learning.min_pattern_strength;

    ImportanceScorer::Config& weights = config.consolidation.scoring;
    weights.emotional_weight = scoring.emotional_weight;
    weights.recency_weight = scoring.recency_weight;
    weights.uniqueness_weight = scoring.uniqueness_weight;
    weights.pattern_weight = scoring.pattern_weight;
    weights.resonance_weight = scoring.resonance_weight;

    config.consolidation.clustering.similarity_threshold = clustering.similarity_threshold;
    config.consolidation.decay_rate = consolidation.decay_rate;
    config.consolidation.prune_threshold = consolidation.prune_threshold;
    config.consolidation.retention_threshold = consolidation.retention_threshold;

    config.schedule.consolidation_interval = std::chrono::hours(consolidation.interval_hours);
    config.schedule.deep_consolidation_interval = std::chrono::hours(consolidation.deep_interval_hours);

    return config;
}

SigelSerializer::Config EngramConfig::ToSerializerConfig() const {
    SigelSerializer::Config config;
    config.vocabulary.max_contexts_per_word = learning.max_contexts_per_word;
    return config;
}

EngramConfig EngramConfig::Default() {
    return EngramConfig{};  // Uses default member initializers
}

} // namespace engram
