// =============================================================================
// swiss-uid - Common Types Tests
// =============================================================================

#include "suid/common/types.h"

#include <gtest/gtest.h>

namespace suid {
namespace {

TEST(TypesTest, EqualsIgnoreCase) {
    EXPECT_TRUE(equalsIgnoreCase("mwst", "MWST"));
    EXPECT_TRUE(equalsIgnoreCase("Hr", "hR"));
    EXPECT_TRUE(equalsIgnoreCase("", ""));
    EXPECT_FALSE(equalsIgnoreCase("HR", "HRX"));
    EXPECT_FALSE(equalsIgnoreCase("CHE", "CH3"));
}

TEST(TypesTest, PrefixNames) {
    EXPECT_EQ(prefixToString(UidPrefix::kCHE), "CHE");
    EXPECT_EQ(prefixToString(UidPrefix::kADM), "ADM");
}

TEST(TypesTest, PrefixFromStringIgnoresCase) {
    EXPECT_EQ(prefixFromString("CHE"), UidPrefix::kCHE);
    EXPECT_EQ(prefixFromString("che"), UidPrefix::kCHE);
    EXPECT_EQ(prefixFromString("Adm"), UidPrefix::kADM);
    EXPECT_FALSE(prefixFromString("CH").has_value());
    EXPECT_FALSE(prefixFromString("CHEE").has_value());
    EXPECT_FALSE(prefixFromString("").has_value());
}

TEST(TypesTest, FormatNames) {
    for (auto format : {UidFormat::kPlain, UidFormat::kHr, UidFormat::kMwst, UidFormat::kDebug}) {
        EXPECT_EQ(formatFromString(formatToString(format)), format);
    }
    EXPECT_EQ(formatFromString("MWST"), UidFormat::kMwst);
    EXPECT_FALSE(formatFromString("vat").has_value());
}

TEST(TypesTest, LayoutConstants) {
    EXPECT_EQ(kPlainLength, kPrefixLength + 1 + kGroupedBodyLength);
    EXPECT_EQ(kTotalDigits, 9U);
    EXPECT_EQ(kCheckDigitWeights.size(), kPayloadDigits);
}

}  // namespace
}  // namespace suid
