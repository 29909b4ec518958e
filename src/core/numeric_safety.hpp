// File: src/core/numeric_safety.hpp
//
// Guards for floating-point values that end up in persisted state.
//
// Derived formulas (division by counts, random sampling, repeated
// reinforcement) can produce NaN or infinity. Persisted state must always be
// a strict JSON document, so every floating field is passed through
// SafeValue() before it is written and after it is read back.

#pragma once

#include <string>

namespace engram {

/// Documented replacement values for non-finite fields
namespace defaults {
    constexpr double kPatternStrength = 0.5;
    constexpr double kWordFrequency = 1.0;
    constexpr double kEmotionalValence = 0.0;
    constexpr double kSemanticWeight = 1.0;
    constexpr double kEmotionalWeight = 0.0;
    constexpr double kRelevanceScore = 1.0;
    constexpr double kTemporalFrequency = 0.01;
    constexpr double kContextRelevance = 1.0;
    constexpr double kLearningRate = 0.01;
    constexpr double kContextualAlignment = 1.0;
} // namespace defaults

/// Return value if finite, otherwise fallback (logs a warning naming field)
double SafeValue(double value, double fallback, const char* field = "value");

/// numerator / denominator, or fallback when the denominator is zero or
/// non-finite or the quotient is not finite
double SafeDivide(double numerator, double denominator, double fallback);

/// Clamp to [min, max]; non-finite input maps to the midpoint
double ClampSafe(double value, double min, double max);

/// True if value is neither NaN nor infinite
bool IsFinite(double value);

} // namespace engram
