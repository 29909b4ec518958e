// File: src/core/numeric_safety.cpp
#include "core/numeric_safety.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace engram {

bool IsFinite(double value) {
    return std::isfinite(value);
}

double SafeValue(double value, double fallback, const char* field) {
    if (std::isfinite(value)) {
        return value;
    }
    spdlog::warn("Invalid value {} in '{}' replaced with {}", value, field, fallback);
    return fallback;
}

double SafeDivide(double numerator, double denominator, double fallback) {
    if (denominator == 0.0 || !std::isfinite(denominator)) {
        return fallback;
    }
    double result = numerator / denominator;
    return std::isfinite(result) ? result : fallback;
}

double ClampSafe(double value, double min, double max) {
    double safe = SafeValue(value, (min + max) / 2.0, "clamped value");
    return std::clamp(safe, min, max);
}

} // namespace engram
