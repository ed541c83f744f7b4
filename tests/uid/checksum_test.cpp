// =============================================================================
// swiss-uid - Check Digit Tests
// =============================================================================
// Unit tests for the weighted modulo-11 check digit, including the payloads
// for which no check digit exists.
// =============================================================================

#include "suid/uid/checksum.h"

#include <gtest/gtest.h>

#include <array>
#include <vector>

namespace suid {
namespace {

using Payload = std::array<Digit, kPayloadDigits>;

// =============================================================================
// Weighted Sum Tests
// =============================================================================

TEST(ChecksumTest, WeightedSumKnownValue) {
    constexpr Payload payload = {1, 0, 9, 3, 2, 2, 5, 5};
    static_assert(weightedSum(payload) == 109);
    EXPECT_EQ(weightedSum(payload), 109U);
}

TEST(ChecksumTest, WeightedSumUsesAllWeights) {
    // Each position alone picks its own weight
    for (std::size_t i = 0; i < kPayloadDigits; ++i) {
        Payload payload{};
        payload[i] = 1;
        EXPECT_EQ(weightedSum(payload), kCheckDigitWeights[i]) << "position " << i;
    }
}

// =============================================================================
// Check Digit Tests
// =============================================================================

TEST(ChecksumTest, KnownCheckDigits) {
    struct Case {
        Payload payload;
        Digit expected;
    };
    const std::vector<Case> cases = {
        {{1, 0, 9, 3, 2, 2, 5, 5}, 1},
        {{1, 0, 0, 0, 0, 2, 0, 0}, 5},
        {{1, 2, 3, 4, 5, 6, 7, 8}, 8},
        {{2, 0, 0, 0, 0, 0, 0, 0}, 1},
    };

    for (const auto& c : cases) {
        auto result = computeCheckDigit(c.payload);
        ASSERT_TRUE(result.has_value()) << result.error().message();
        EXPECT_EQ(*result, c.expected);
    }
}

TEST(ChecksumTest, RemainderZeroGivesZero) {
    // 1*5 + 7*4 = 33, a multiple of 11
    const Payload payload = {1, 0, 0, 0, 0, 0, 0, 7};
    auto result = computeCheckDigit(payload);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 0);
}

TEST(ChecksumTest, SentinelHasNoCheckDigit) {
    // 1*5 + 1*7 = 12, remainder 1
    const Payload payload = {1, 0, 0, 0, 1, 0, 0, 0};
    auto result = computeCheckDigit(payload);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNoValidCheckDigit);
    EXPECT_FALSE(hasCheckDigit(payload));
}

TEST(ChecksumTest, EveryRemainderButOneHasCheckDigit) {
    int sentinels = 0;
    Payload payload = {1, 0, 0, 0, 0, 0, 0, 0};
    for (Digit last = 0; last <= 9; ++last) {
        payload[kPayloadDigits - 1] = last;
        if (!hasCheckDigit(payload)) {
            ++sentinels;
            EXPECT_FALSE(computeCheckDigit(payload).has_value());
        } else {
            EXPECT_TRUE(computeCheckDigit(payload).has_value());
        }
    }
    // Weight 4 maps ten digits to ten distinct remainders
    EXPECT_LE(sentinels, 1);
}

// =============================================================================
// Malformed Input Tests
// =============================================================================

TEST(ChecksumTest, RejectsWrongLength) {
    const std::vector<Digit> shortPayload = {1, 0, 9, 3, 2, 2, 5};
    auto result = computeCheckDigit(shortPayload);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedDigits);
    EXPECT_FALSE(hasCheckDigit(shortPayload));

    const std::vector<Digit> longPayload = {1, 0, 9, 3, 2, 2, 5, 5, 1};
    EXPECT_EQ(computeCheckDigit(longPayload).error().code(), ErrorCode::kMalformedDigits);
    EXPECT_FALSE(hasCheckDigit(longPayload));
}

TEST(ChecksumTest, RejectsEmptyPayload) {
    auto result = computeCheckDigit(std::span<const Digit>{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedDigits);
}

TEST(ChecksumTest, RejectsDigitAboveNine) {
    const Payload payload = {1, 0, 9, 3, 2, 12, 5, 5};
    auto result = computeCheckDigit(payload);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedDigits);
    EXPECT_FALSE(hasCheckDigit(payload));
}

}  // namespace
}  // namespace suid
