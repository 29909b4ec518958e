// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cmath>
#include <cstdlib>

namespace engram {

// Static member initialization
std::atomic<MemoryID::ValueType> MemoryID::next_id_{1};

MemoryID MemoryID::Generate() {
    // Thread-safe atomic increment
    ValueType new_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    return MemoryID(new_id);
}

void MemoryID::ReserveThrough(ValueType value) {
    ValueType current = next_id_.load(std::memory_order_relaxed);
    while (current <= value &&
           !next_id_.compare_exchange_weak(current, value + 1, std::memory_order_relaxed)) {
    }
}

std::string MemoryID::ToString() const {
    if (!IsValid()) {
        return "MemoryID(INVALID)";
    }
    std::ostringstream oss;
    oss << "MemoryID(" << std::hex << std::setw(16) << std::setfill('0') << value_ << ")";
    return oss.str();
}

// Enum implementations

const char* ToString(EmotionalProfile profile) {
    switch (profile) {
        case EmotionalProfile::POSITIVE: return "Positive";
        case EmotionalProfile::NEGATIVE: return "Negative";
        case EmotionalProfile::NEUTRAL: return "Neutral";
        case EmotionalProfile::MIXED: return "Mixed";
        default: return "Unknown";
    }
}

EmotionalProfile ParseEmotionalProfile(const std::string& str) {
    if (str == "Positive") return EmotionalProfile::POSITIVE;
    if (str == "Negative") return EmotionalProfile::NEGATIVE;
    if (str == "Neutral") return EmotionalProfile::NEUTRAL;
    if (str == "Mixed") return EmotionalProfile::MIXED;
    throw std::invalid_argument("Unknown EmotionalProfile: " + str);
}

EmotionalProfile ProfileFromWeight(double weight) {
    if (weight > 0.3) return EmotionalProfile::POSITIVE;
    if (weight < -0.3) return EmotionalProfile::NEGATIVE;
    if (std::abs(weight) <= 0.1) return EmotionalProfile::NEUTRAL;
    return EmotionalProfile::MIXED;
}

const char* ToString(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::HIGH: return "High";
        case PriorityTier::MEDIUM: return "Medium";
        case PriorityTier::LOW: return "Low";
        default: return "Unknown";
    }
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    // Truncated to the stored resolution so Now() survives a save/load
    return Timestamp(std::chrono::time_point_cast<Duration>(ClockType::now()));
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

double Timestamp::HoursFrom(const Timestamp& other) const {
    auto micros = std::abs((*this - other).count());
    return static_cast<double>(micros) / 3.6e9;
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

} // namespace engram
