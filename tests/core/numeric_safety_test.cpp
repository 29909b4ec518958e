// File: tests/core/numeric_safety_test.cpp
#include "core/numeric_safety.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace engram {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

TEST(NumericSafetyTest, SafeValuePassesFiniteValues) {
    EXPECT_DOUBLE_EQ(0.25, SafeValue(0.25, 1.0));
    EXPECT_DOUBLE_EQ(-3.0, SafeValue(-3.0, 1.0));
}

TEST(NumericSafetyTest, SafeValueReplacesNonFinite) {
    EXPECT_DOUBLE_EQ(defaults::kPatternStrength, SafeValue(kNaN, defaults::kPatternStrength, "strength"));
    EXPECT_DOUBLE_EQ(defaults::kWordFrequency, SafeValue(kInf, defaults::kWordFrequency, "frequency"));
    EXPECT_DOUBLE_EQ(defaults::kEmotionalValence, SafeValue(-kInf, defaults::kEmotionalValence));
}

TEST(NumericSafetyTest, SafeDivideGuardsDenominator) {
    EXPECT_DOUBLE_EQ(2.0, SafeDivide(4.0, 2.0, -1.0));
    EXPECT_DOUBLE_EQ(-1.0, SafeDivide(4.0, 0.0, -1.0));
    EXPECT_DOUBLE_EQ(-1.0, SafeDivide(4.0, kNaN, -1.0));
    EXPECT_DOUBLE_EQ(-1.0, SafeDivide(kInf, 1.0, -1.0));
}

TEST(NumericSafetyTest, ClampSafe) {
    EXPECT_DOUBLE_EQ(1.0, ClampSafe(3.0, -1.0, 1.0));
    EXPECT_DOUBLE_EQ(-1.0, ClampSafe(-3.0, -1.0, 1.0));
    EXPECT_DOUBLE_EQ(0.5, ClampSafe(0.5, -1.0, 1.0));
    EXPECT_DOUBLE_EQ(0.0, ClampSafe(kNaN, -1.0, 1.0));
}

TEST(NumericSafetyTest, IsFinite) {
    EXPECT_TRUE(IsFinite(0.0));
    EXPECT_FALSE(IsFinite(kNaN));
    EXPECT_FALSE(IsFinite(kInf));
}

} // namespace
} // namespace engram
