// File: src/learning/emotion_lexicon.cpp
#include "learning/emotion_lexicon.hpp"
#include "learning/text_processing.hpp"
#include <algorithm>

namespace engram {

const std::vector<std::string>& EmotionLexicon::PositiveWords() {
    static const std::vector<std::string> kWords = {
        "love", "joy", "happy", "wonderful", "amazing", "beautiful", "peace", "harmony"
    };
    return kWords;
}

const std::vector<std::string>& EmotionLexicon::NegativeWords() {
    static const std::vector<std::string> kWords = {
        "hate", "sad", "terrible", "awful", "pain", "suffer", "angry", "fear"
    };
    return kWords;
}

const std::vector<std::string>& EmotionLexicon::ProfoundWords() {
    static const std::vector<std::string> kWords = {
        "consciousness", "universe", "existence", "meaning", "purpose", "infinite", "eternal"
    };
    return kWords;
}

double EmotionLexicon::Weight(const std::string& content) {
    const std::string lower = text::ToLower(content);
    double weight = 0.0;

    for (const auto& word : PositiveWords()) {
        if (text::Contains(lower, word)) weight += kPositiveContribution;
    }
    for (const auto& word : NegativeWords()) {
        if (text::Contains(lower, word)) weight += kNegativeContribution;
    }
    for (const auto& word : ProfoundWords()) {
        if (text::Contains(lower, word)) weight += kProfoundContribution;
    }

    return std::clamp(weight, -1.0, 1.0);
}

} // namespace engram
