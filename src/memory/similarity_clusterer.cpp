// File: src/memory/similarity_clusterer.cpp
#include "memory/similarity_clusterer.hpp"
#include "learning/text_processing.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace engram {

namespace {

constexpr size_t kTopicWords = 3;
constexpr size_t kMinTopicWordLength = 4;

} // namespace

SimilarityClusterer::SimilarityClusterer(const Config& config)
    : config_(config) {
    ValidateConfig(config_);
}

void SimilarityClusterer::ValidateConfig(const Config& config) {
    if (config.similarity_threshold < 0.0 || config.similarity_threshold > 1.0) {
        throw std::invalid_argument("similarity_threshold must be in [0,1]");
    }

    if (config.word_weight < 0.0 || config.context_weight < 0.0 ||
        config.emotion_weight < 0.0 || config.time_weight < 0.0) {
        throw std::invalid_argument("Similarity term weights must be non-negative");
    }

    if (config.time_decay < 0.0) {
        throw std::invalid_argument("time_decay must be non-negative");
    }
}

void SimilarityClusterer::SetConfig(const Config& config) {
    ValidateConfig(config);
    config_ = config;
}

double SimilarityClusterer::Similarity(const EpisodicMemory& a, const EpisodicMemory& b) const {
    double words = Jaccard(a.content, b.content);
    double context = a.context == b.context ? 1.0 : 0.0;
    double emotion = 1.0 - std::min(std::abs(a.emotional_weight - b.emotional_weight) / 2.0, 1.0);
    double hours = a.timestamp.HoursFrom(b.timestamp);
    double time = 1.0 / (1.0 + hours * config_.time_decay);

    return config_.word_weight * words +
           config_.context_weight * context +
           config_.emotion_weight * emotion +
           config_.time_weight * time;
}

std::vector<MemoryCluster> SimilarityClusterer::Cluster(
    const std::vector<EpisodicMemory>& memories,
    const std::vector<MemoryScore>& scores) const {

    if (scores.size() != memories.size()) {
        throw std::invalid_argument("Cluster: score count does not match record count");
    }

    std::vector<MemoryCluster> clusters;
    std::vector<bool> processed(memories.size(), false);

    for (size_t i = 0; i < memories.size(); ++i) {
        if (processed[i]) {
            continue;
        }
        processed[i] = true;

        const EpisodicMemory& seed = memories[i];
        MemoryCluster cluster;
        cluster.core_index = i;
        cluster.member_indices.push_back(i);
        cluster.topic = ExtractTopic(seed.content);
        cluster.aggregated_importance = scores[i].total_importance;
        cluster.emotional_profile = ProfileFromWeight(seed.emotional_weight);

        for (size_t j = i + 1; j < memories.size(); ++j) {
            if (processed[j]) {
                continue;
            }
            if (Similarity(seed, memories[j]) > config_.similarity_threshold) {
                cluster.member_indices.push_back(j);
                cluster.aggregated_importance += scores[j].total_importance;
                processed[j] = true;
            }
        }

        clusters.push_back(std::move(cluster));
    }

    std::stable_sort(clusters.begin(), clusters.end(),
        [](const MemoryCluster& a, const MemoryCluster& b) {
            return a.aggregated_importance > b.aggregated_importance;
        });

    return clusters;
}

double SimilarityClusterer::Jaccard(const std::string& a, const std::string& b) {
    std::vector<std::string> tokens_a = text::SplitWhitespace(a);
    std::vector<std::string> tokens_b = text::SplitWhitespace(b);
    std::unordered_set<std::string> set_a(tokens_a.begin(), tokens_a.end());
    std::unordered_set<std::string> set_b(tokens_b.begin(), tokens_b.end());

    size_t intersection = 0;
    for (const auto& word : set_a) {
        if (set_b.count(word) > 0) {
            ++intersection;
        }
    }

    size_t union_size = set_a.size() + set_b.size() - intersection;
    if (union_size == 0) {
        return 0.0;
    }
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::string SimilarityClusterer::ExtractTopic(const std::string& content) {
    std::vector<std::string> meaningful;
    for (const auto& word : text::SplitWhitespace(content)) {
        if (word.size() >= kMinTopicWordLength && !IsCommonWord(word)) {
            meaningful.push_back(word);
            if (meaningful.size() == kTopicWords) {
                break;
            }
        }
    }

    if (meaningful.empty()) {
        return kGeneralTopic;
    }

    std::string topic = meaningful.front();
    for (size_t i = 1; i < meaningful.size(); ++i) {
        topic += '_';
        topic += meaningful[i];
    }
    return topic;
}

bool SimilarityClusterer::IsCommonWord(const std::string& word) {
    static const std::unordered_set<std::string> kCommonWords = {
        "the", "and", "that", "have", "for", "not", "with", "you", "this", "but",
        "his", "from", "they", "she", "her", "been", "than", "its", "who", "did"
    };
    return kCommonWords.count(text::ToLower(word)) > 0;
}

} // namespace engram
