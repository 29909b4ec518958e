// File: src/learning/pattern_learner.cpp
#include "learning/pattern_learner.hpp"
#include "learning/emotion_lexicon.hpp"
#include "learning/text_processing.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace engram {

// ============================================================================
// Construction
// ============================================================================

PatternLearner::PatternLearner(const Config& config)
    : config_(config) {
    ValidateConfig();
}

void PatternLearner::ValidateConfig() const {
    if (config_.max_memory_tokens < config_.min_memory_tokens) {
        throw std::invalid_argument("max_memory_tokens must be >= min_memory_tokens");
    }

    if (config_.sample_divisor == 0) {
        throw std::invalid_argument("sample_divisor must be > 0");
    }

    if (config_.max_sample_size < config_.min_sample_size) {
        throw std::invalid_argument("max_sample_size must be >= min_sample_size");
    }

    if (config_.poor_accuracy_threshold < 0.0 || config_.poor_accuracy_threshold > 1.0) {
        throw std::invalid_argument("poor_accuracy_threshold must be in [0,1]");
    }

    if (config_.poor_accuracy_boost < 0.0) {
        throw std::invalid_argument("poor_accuracy_boost must be >= 0");
    }

    if (config_.min_ngram == 0 || config_.max_ngram < config_.min_ngram) {
        throw std::invalid_argument("n-gram range must satisfy 0 < min_ngram <= max_ngram");
    }

    if (config_.min_pattern_strength < 0.0) {
        throw std::invalid_argument("min_pattern_strength must be >= 0");
    }
}

void PatternLearner::SetConfig(const Config& config) {
    config_ = config;
    ValidateConfig();
}

// ============================================================================
// Main Operations
// ============================================================================

PatternLearner::LearningReport PatternLearner::Ingest(
    Sigel& sigel,
    const std::string& content,
    const std::string& source_tag,
    RandomSource& rng
) const {
    LearningReport report;

    ProcessSentences(sigel, content, source_tag, report);

    std::vector<std::string> tokens = text::SplitWhitespace(content);
    if (tokens.size() >= 4) {
        SelfEvaluate(sigel, tokens, rng, report);
    }

    ExtractPatterns(sigel, content, report);

    sigel.Learning().text_corpus_size += content.size();
    sigel.MarkEvolved();

    spdlog::debug("Ingested '{}': {} sentences, {} memories, {} predictions (mean accuracy {:.3f}), "
                  "{} patterns pruned",
                  source_tag, report.sentences_processed, report.memories_created,
                  report.predictions_evaluated, report.mean_accuracy, report.patterns_pruned);

    return report;
}

void PatternLearner::LearnFromInteraction(
    Sigel& sigel,
    const std::string& interaction,
    const std::string& response
) const {
    double weight = EmotionLexicon::Weight(interaction);
    sigel.AddMemory("Interaction: " + interaction + " | Response: " + response,
                    kInteractionContext, weight);
}

std::string PatternLearner::PredictNextToken(
    const Sigel& sigel,
    const std::array<std::string, 3>& context,
    RandomSource& rng
) const {
    const PatternIndex& index = sigel.Patterns();
    const std::string context_key = context[0] + " " + context[1] + " " + context[2];

    // Stored continuations first; the earliest match wins
    if (auto continuation = index.MatchTemporal(context_key)) {
        return *continuation;
    }

    // Fall back to a neighbor of the last token
    const auto& neighbors = index.Neighbors(text::NormalizeWord(context[2]));
    if (!neighbors.empty()) {
        return neighbors[rng.UniformIndex(neighbors.size())];
    }

    return kUnknownToken;
}

double PatternLearner::PredictionAccuracy(const std::string& predicted, const std::string& actual) {
    const std::string p = text::ToLower(predicted);
    const std::string a = text::ToLower(actual);

    if (p == a) {
        return 1.0;
    }
    if (text::Contains(a, p)) {
        return 0.7;
    }
    if (text::Contains(p, a)) {
        return 0.6;
    }

    size_t shared = static_cast<size_t>(std::count_if(p.begin(), p.end(),
        [&a](char c) { return a.find(c) != std::string::npos; }));
    size_t longest = std::max<size_t>({p.size(), a.size(), 1});

    return 0.4 * static_cast<double>(shared) / static_cast<double>(longest);
}

// ============================================================================
// Phases
// ============================================================================

void PatternLearner::ProcessSentences(
    Sigel& sigel,
    const std::string& content,
    const std::string& source_tag,
    LearningReport& report
) const {
    for (const std::string& sentence : text::SplitSentences(content)) {
        std::vector<std::string> words = text::SplitWhitespace(sentence);
        if (words.empty()) {
            continue;
        }
        report.sentences_processed++;

        // Learn each word from its immediate neighbors
        for (size_t i = 0; i + 2 < words.size(); ++i) {
            const std::string& left = words[i];
            const std::string& middle = words[i + 1];
            const std::string& right = words[i + 2];

            sigel.Vocabulary().Learn(text::ToLower(middle), left + " " + right);
            report.words_learned++;

            const std::string l = text::NormalizeWord(left);
            const std::string m = text::NormalizeWord(middle);
            const std::string r = text::NormalizeWord(right);
            if (sigel.Patterns().AddAssociation(l, m)) report.semantic_edges_added++;
            if (sigel.Patterns().AddAssociation(m, r)) report.semantic_edges_added++;
        }

        if (words.size() >= config_.min_memory_tokens && words.size() <= config_.max_memory_tokens) {
            sigel.AddMemory(text::Trim(sentence), source_tag, EmotionLexicon::Weight(sentence));
            report.memories_created++;
        }
    }
}

size_t PatternLearner::SampleSize(size_t token_count) const {
    return std::clamp(token_count / config_.sample_divisor,
                      config_.min_sample_size, config_.max_sample_size);
}

void PatternLearner::SelfEvaluate(
    Sigel& sigel,
    const std::vector<std::string>& tokens,
    RandomSource& rng,
    LearningReport& report
) const {
    if (tokens.size() < 4) {
        return;
    }

    const double learning_rate = sigel.Learning().learning_rate;
    const size_t samples = SampleSize(tokens.size());
    double accuracy_sum = 0.0;

    for (size_t s = 0; s < samples; ++s) {
        // Start in [0, size - 4] so the target token always exists
        size_t start = rng.UniformIndex(tokens.size() - 3);
        std::vector<std::string> context(tokens.begin() + start, tokens.begin() + start + 3);
        const std::string& target = tokens[start + 3];

        std::string predicted = PredictNextToken(sigel, {context[0], context[1], context[2]}, rng);
        double accuracy = PredictionAccuracy(predicted, target);
        accuracy_sum += accuracy;

        double strength = accuracy < config_.poor_accuracy_threshold
            ? learning_rate * config_.poor_accuracy_boost
            : learning_rate;
        StrengthenPattern(sigel, context, target, strength);

        sigel.Learning().training_iterations++;
    }

    report.predictions_evaluated += samples;
    report.mean_accuracy = accuracy_sum / static_cast<double>(std::max<size_t>(samples, 1));
}

void PatternLearner::StrengthenPattern(
    Sigel& sigel,
    const std::vector<std::string>& context,
    const std::string& target,
    double strength
) const {
    TemporalPattern temporal;
    temporal.sequence = context;
    temporal.sequence.push_back(target);
    temporal.frequency = strength;
    temporal.context_relevance = 1.0;
    sigel.Patterns().AppendTemporal(std::move(temporal));

    sigel.Patterns().Reinforce(text::Join(context), strength);
}

std::vector<std::pair<std::string, double>> PatternLearner::AnalyzeSentence(
    const std::string& sentence
) const {
    std::vector<std::pair<std::string, double>> ngrams;
    std::vector<std::string> words = text::SplitWhitespace(sentence);

    for (size_t n = config_.min_ngram; n <= config_.max_ngram; ++n) {
        if (words.size() < n) {
            break;
        }
        // Shorter windows carry more weight
        const double strength = 1.0 / static_cast<double>(n);
        for (size_t i = 0; i + n <= words.size(); ++i) {
            ngrams.emplace_back(text::Join(words, i, i + n), strength);
        }
    }

    return ngrams;
}

void PatternLearner::ExtractPatterns(
    Sigel& sigel,
    const std::string& content,
    LearningReport& report
) const {
    std::vector<std::string> sentences;
    for (std::string& sentence : text::SplitSentences(content)) {
        if (text::Trim(sentence).size() > config_.min_sentence_chars) {
            sentences.push_back(std::move(sentence));
        }
    }

    // Analyze sentences in parallel, merge sequentially
    std::vector<std::vector<std::pair<std::string, double>>> per_sentence(sentences.size());
    const int64_t count = static_cast<int64_t>(sentences.size());

    #pragma omp parallel for schedule(dynamic, 16)
    for (int64_t i = 0; i < count; ++i) {
        per_sentence[i] = AnalyzeSentence(sentences[i]);
    }

    PatternIndex& index = sigel.Patterns();
    for (const auto& ngrams : per_sentence) {
        for (const auto& [pattern, strength] : ngrams) {
            index.Reinforce(pattern, strength);
        }
        report.ngrams_extracted += ngrams.size();
    }

    report.patterns_pruned += index.Prune(config_.min_pattern_strength);
}

} // namespace engram
