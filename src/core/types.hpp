// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <atomic>
#include <chrono>

namespace engram {

// MemoryID: Unique identifier for episodic records
// Uses 64-bit integer for efficiency and range
class MemoryID {
public:
    // Type alias for underlying storage
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    MemoryID() : value_(kInvalidID) {}

    // Explicit constructor from value
    explicit MemoryID(ValueType value) : value_(value) {}

    // Generate new unique ID (thread-safe)
    static MemoryID Generate();

    // Make sure future Generate() calls never return value or anything below it.
    // Called when records are loaded from a snapshot.
    static void ReserveThrough(ValueType value);

    // Check if ID is valid
    bool IsValid() const { return value_ != kInvalidID; }

    // Get underlying value
    ValueType value() const { return value_; }

    // Comparison operators
    bool operator==(const MemoryID& other) const { return value_ == other.value_; }
    bool operator!=(const MemoryID& other) const { return value_ != other.value_; }
    bool operator<(const MemoryID& other) const { return value_ < other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const MemoryID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;
    static std::atomic<ValueType> next_id_;

    ValueType value_;
};

// EmotionalProfile: Coarse bucket of an emotional weight
enum class EmotionalProfile : uint8_t {
    POSITIVE = 0,
    NEGATIVE = 1,
    NEUTRAL = 2,
    MIXED = 3,
};

// Convert EmotionalProfile to string ("Positive", "Negative", ...)
const char* ToString(EmotionalProfile profile);

// Parse EmotionalProfile from string
EmotionalProfile ParseEmotionalProfile(const std::string& str);

// Bucket a weight in [-1,1]:
//   > 0.3 Positive, < -0.3 Negative, |w| <= 0.1 Neutral, otherwise Mixed
EmotionalProfile ProfileFromWeight(double weight);

// PriorityTier: Consolidation priority of a scored record
enum class PriorityTier : uint8_t {
    HIGH = 0,
    MEDIUM = 1,
    LOW = 2,
};

// Convert PriorityTier to string
const char* ToString(PriorityTier tier);

// Timestamp: Microsecond-precision wall-clock time point
//
// Backed by the system clock so values survive a save/load cycle.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since the Unix epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since the Unix epoch
    int64_t ToMicros() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Shift by a duration
    Timestamp operator+(Duration delta) const { return Timestamp(time_point_ + delta); }

    // Absolute distance to another timestamp in hours
    double HoursFrom(const Timestamp& other) const;

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // String conversion
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

} // namespace engram

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<engram::MemoryID> {
        size_t operator()(const engram::MemoryID& id) const {
            return engram::MemoryID::Hash()(id);
        }
    };
}
