// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <unordered_set>
#include <thread>
#include <vector>

namespace engram {
namespace {

TEST(MemoryIDTest, DefaultConstructorCreatesInvalid) {
    MemoryID id;
    EXPECT_FALSE(id.IsValid());
    EXPECT_EQ(0u, id.value());
    EXPECT_EQ("MemoryID(INVALID)", id.ToString());
}

TEST(MemoryIDTest, GenerateCreatesUniqueIDs) {
    MemoryID id1 = MemoryID::Generate();
    MemoryID id2 = MemoryID::Generate();

    EXPECT_TRUE(id1.IsValid());
    EXPECT_TRUE(id2.IsValid());
    EXPECT_NE(id1, id2);
}

TEST(MemoryIDTest, GenerateIsThreadSafe) {
    constexpr int kNumThreads = 8;
    constexpr int kIDsPerThread = 1000;

    std::vector<std::thread> threads;
    std::vector<std::vector<MemoryID>> thread_ids(kNumThreads);

    for (int i = 0; i < kNumThreads; ++i) {
        threads.emplace_back([&thread_ids, i]() {
            for (int j = 0; j < kIDsPerThread; ++j) {
                thread_ids[i].push_back(MemoryID::Generate());
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    std::unordered_set<MemoryID> unique_ids;
    for (const auto& ids : thread_ids) {
        for (const auto& id : ids) {
            EXPECT_TRUE(unique_ids.insert(id).second) << "Duplicate ID: " << id.ToString();
        }
    }

    EXPECT_EQ(static_cast<size_t>(kNumThreads * kIDsPerThread), unique_ids.size());
}

TEST(MemoryIDTest, ReserveThroughSkipsLoadedIds) {
    MemoryID current = MemoryID::Generate();
    MemoryID::ValueType reserved = current.value() + 500;

    MemoryID::ReserveThrough(reserved);

    EXPECT_GT(MemoryID::Generate().value(), reserved);
}

TEST(MemoryIDTest, ReserveThroughNeverMovesBackwards) {
    MemoryID current = MemoryID::Generate();

    MemoryID::ReserveThrough(1);

    EXPECT_GT(MemoryID::Generate().value(), current.value());
}

TEST(MemoryIDTest, ToStringIsHex) {
    MemoryID id(255);
    EXPECT_EQ("MemoryID(00000000000000ff)", id.ToString());
}

TEST(MemoryIDTest, ComparisonOperators) {
    MemoryID id1(100);
    MemoryID id2(200);
    MemoryID id3(100);

    EXPECT_TRUE(id1 == id3);
    EXPECT_TRUE(id1 != id2);
    EXPECT_TRUE(id1 < id2);
    EXPECT_FALSE(id2 < id1);
}

TEST(EmotionalProfileTest, ProfileFromWeightBuckets) {
    EXPECT_EQ(EmotionalProfile::POSITIVE, ProfileFromWeight(0.5));
    EXPECT_EQ(EmotionalProfile::NEGATIVE, ProfileFromWeight(-0.5));
    EXPECT_EQ(EmotionalProfile::NEUTRAL, ProfileFromWeight(0.0));
    EXPECT_EQ(EmotionalProfile::NEUTRAL, ProfileFromWeight(0.1));
    EXPECT_EQ(EmotionalProfile::MIXED, ProfileFromWeight(0.2));
    EXPECT_EQ(EmotionalProfile::MIXED, ProfileFromWeight(-0.3));
}

TEST(EmotionalProfileTest, StringRoundTrip) {
    for (auto profile : {EmotionalProfile::POSITIVE, EmotionalProfile::NEGATIVE,
                         EmotionalProfile::NEUTRAL, EmotionalProfile::MIXED}) {
        EXPECT_EQ(profile, ParseEmotionalProfile(ToString(profile)));
    }
}

TEST(EmotionalProfileTest, ParseRejectsUnknown) {
    EXPECT_THROW(ParseEmotionalProfile("Ecstatic"), std::invalid_argument);
}

TEST(PriorityTierTest, ToStringNames) {
    EXPECT_STREQ("High", ToString(PriorityTier::HIGH));
    EXPECT_STREQ("Medium", ToString(PriorityTier::MEDIUM));
    EXPECT_STREQ("Low", ToString(PriorityTier::LOW));
}

TEST(TimestampTest, MicrosRoundTrip) {
    Timestamp ts = Timestamp::FromMicros(1700000000123456);
    EXPECT_EQ(1700000000123456, ts.ToMicros());
}

TEST(TimestampTest, NowHasMicrosecondResolution) {
    for (int i = 0; i < 100; ++i) {
        Timestamp now = Timestamp::Now();
        EXPECT_EQ(now, Timestamp::FromMicros(now.ToMicros()));
    }
}

TEST(TimestampTest, HoursFromIsAbsolute) {
    Timestamp a = Timestamp::FromMicros(0);
    Timestamp b = a + std::chrono::hours(3);

    EXPECT_DOUBLE_EQ(3.0, b.HoursFrom(a));
    EXPECT_DOUBLE_EQ(3.0, a.HoursFrom(b));
}

TEST(TimestampTest, Ordering) {
    Timestamp a = Timestamp::FromMicros(10);
    Timestamp b = Timestamp::FromMicros(20);

    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b > a);
    EXPECT_TRUE(a <= a);
    EXPECT_EQ(std::chrono::microseconds(10), b - a);
}

TEST(TimestampTest, ToStringFormat) {
    Timestamp ts = Timestamp::FromMicros(1500001);
    EXPECT_EQ("Timestamp(1.500001s)", ts.ToString());
}

} // namespace
} // namespace engram
