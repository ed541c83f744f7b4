// =============================================================================
// swiss-uid - Nibble Packing Tests
// =============================================================================

#include "suid/uid/nibble.h"

#include <gtest/gtest.h>

#include <array>
#include <vector>

namespace suid {
namespace {

TEST(NibbleTest, PacksMostSignificantFirst) {
    constexpr std::array<Digit, 8> digits = {1, 0, 9, 3, 2, 2, 5, 5};
    static_assert(packNibbles(digits) == 0x10932255U);
    EXPECT_EQ(packNibbles(digits), 0x10932255U);
}

TEST(NibbleTest, PackShortSequence) {
    const std::vector<Digit> digits = {4, 2};
    EXPECT_EQ(packNibbles(digits), 0x42U);
    EXPECT_EQ(packNibbles(std::span<const Digit>{}), 0U);
}

TEST(NibbleTest, PackMasksHighBits) {
    const std::vector<Digit> digits = {0x1A, 0xF3};
    EXPECT_EQ(packNibbles(digits), 0xA3U);
}

TEST(NibbleTest, PackIgnoresDigitsPastCapacity) {
    const std::vector<Digit> digits = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    EXPECT_EQ(packNibbles(digits), 0x12345678U);
}

TEST(NibbleTest, UnpackRestoresDigits) {
    const auto digits = unpackNibbles<8>(0x10932255U);
    const std::array<Digit, 8> expected = {1, 0, 9, 3, 2, 2, 5, 5};
    EXPECT_EQ(digits, expected);
}

TEST(NibbleTest, UnpackLowNibblesOnly) {
    const auto digits = unpackNibbles<3>(0x12345678U);
    const std::array<Digit, 3> expected = {6, 7, 8};
    EXPECT_EQ(digits, expected);
}

TEST(NibbleTest, PackedOrderMatchesDigitOrder) {
    const std::array<Digit, 8> lower = {1, 0, 9, 3, 2, 2, 5, 5};
    const std::array<Digit, 8> higher = {1, 0, 9, 3, 2, 2, 6, 0};
    EXPECT_LT(packNibbles(lower), packNibbles(higher));
}

}  // namespace
}  // namespace suid
