// File: src/learning/emotion_lexicon.hpp
#pragma once

#include <string>
#include <vector>

namespace engram {

/// Fixed word-list scorer for the emotional weight of a piece of text.
///
/// Each listed word that occurs anywhere in the lower-cased text (substring
/// match) contributes once:
///   positive +0.5, negative -0.3, profound +0.8
/// The sum is clamped to [-1, 1].
class EmotionLexicon {
public:
    static constexpr double kPositiveContribution = 0.5;
    static constexpr double kNegativeContribution = -0.3;
    static constexpr double kProfoundContribution = 0.8;

    /// Emotional weight of text in [-1, 1]
    static double Weight(const std::string& text);

    static const std::vector<std::string>& PositiveWords();
    static const std::vector<std::string>& NegativeWords();
    static const std::vector<std::string>& ProfoundWords();
};

} // namespace engram
