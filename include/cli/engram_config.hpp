// File: include/cli/engram_config.hpp
//
// YAML Configuration Support for Engram
// Loads every tunable constant of the engine from a YAML file

#ifndef ENGRAM_CLI_CONFIG_HPP
#define ENGRAM_CLI_CONFIG_HPP

#include "core/memory_engine.hpp"
#include "storage/sigel_serializer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Configuration structure for the engram driver
struct EngramConfig {
    // === Engine Settings ===
    struct Engine {
        std::string name = "engram";
        uint64_t seed = 42;
        std::string state_dir = "sigels";
        std::string store = "file";          // "file" or "sqlite"
        std::string db_path = "engram.db";
    } engine;

    // === Learning Settings ===
    struct Learning {
        double learning_rate = 0.01;
        size_t min_sample_size = 1000;
        size_t max_sample_size = 10000;
        double min_pattern_strength = 0.1;
        size_t max_contexts_per_word = 32;
    } learning;

    // === Importance Scoring Settings ===
    struct Scoring {
        double emotional_weight = 0.3;
        double recency_weight = 0.2;
        double uniqueness_weight = 0.25;
        double pattern_weight = 0.15;
        double resonance_weight = 0.1;
        double contextual_alignment = 1.0;
    } scoring;

    // === Clustering Settings ===
    struct Clustering {
        double similarity_threshold = 0.7;
    } clustering;

    // === Consolidation Settings ===
    struct Consolidation {
        double decay_rate = 0.01;
        double prune_threshold = 0.01;
        double retention_threshold = 0.8;
        size_t interval_hours = 6;
        size_t deep_interval_hours = 24;
    } consolidation;

    // === Logging Settings ===
    struct Logging {
        std::string level = "info";
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngramConfig if successful, std::nullopt on error
    static std::optional<EngramConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngramConfig if successful, std::nullopt on error
    static std::optional<EngramConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Engine configuration with these settings applied
    MemoryEngine::Config ToEngineConfig() const;

    /// Serializer configuration matching the engine's store limits
    SigelSerializer::Config ToSerializerConfig() const;

    /// Create default configuration
    static EngramConfig Default();
};

} // namespace engram

#endif // ENGRAM_CLI_CONFIG_HPP
