#include "identity.hpp"
#include "gtest/gtest.h"

TEST(IdentityTest, TrimsAsciiWhitespace)
{
    EXPECT_EQ(trim_ascii("  42\t\n"), "42");
    EXPECT_EQ(trim_ascii("\r\f\v"), "");
    EXPECT_EQ(trim_ascii("a b"), "a b");
}

TEST(IdentityTest, StripsLeadingZeros)
{
    EXPECT_EQ(normalize_identity("0042"), "42");
    EXPECT_EQ(normalize_identity("  0042 "), "42");
    EXPECT_EQ(normalize_identity("000"), "0");
    EXPECT_EQ(normalize_identity("0"), "0");
    EXPECT_EQ(normalize_identity(""), "0");
    EXPECT_EQ(normalize_identity("100"), "100");
    EXPECT_EQ(normalize_identity("0A7"), "A7");
}

TEST(IdentityTest, NumericIdentity)
{
    EXPECT_EQ(extract_numeric_identity("T-456-X"), 456.0);
    EXPECT_EQ(extract_numeric_identity("0007"), 7.0);
    EXPECT_FALSE(extract_numeric_identity("abc").has_value());
    EXPECT_FALSE(extract_numeric_identity("").has_value());
}

TEST(IdentityTest, DefaultNormalizerMatchesFreeFunction)
{
    const IdentityNormalizer n = default_normalizer();
    EXPECT_EQ(n(" 0099"), normalize_identity(" 0099"));
    EXPECT_EQ(n("0099"), n("99"));
}
