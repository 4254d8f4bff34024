#include <gtest/gtest.h>

#include "base64.hpp"

using namespace SubKit;

TEST(Base64Test, EncodesStandardPadded) {
    EXPECT_EQ(Base64::encode("aes-256-gcm:pass", Base64::Alphabet::Standard, Base64::Padding::Padded),
              QStringLiteral("YWVzLTI1Ni1nY206cGFzcw=="));
}

TEST(Base64Test, EncodesUrlSafeUnpadded) {
    const QByteArray data("\xfb\xff\xfe", 3);
    EXPECT_EQ(Base64::encode(data, Base64::Alphabet::UrlSafe, Base64::Padding::Unpadded), QStringLiteral("-__-"));
    EXPECT_EQ(Base64::encode("ab", Base64::Alphabet::UrlSafe, Base64::Padding::Unpadded), QStringLiteral("YWI"));
}

TEST(Base64Test, DecodeAcceptsMissingPadding) {
    const auto decoded = Base64::decode(QStringLiteral("YWVzLTI1Ni1nY206cGFzcw"), Base64::Alphabet::Standard);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, QByteArray("aes-256-gcm:pass"));
}

TEST(Base64Test, DecodeIgnoresLineBreaks) {
    const auto decoded = Base64::decode(QStringLiteral("YWVzLTI1\r\nNi1nY206\ncGFzcw=="), Base64::Alphabet::Standard);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, QByteArray("aes-256-gcm:pass"));
}

TEST(Base64Test, DecodeRejectsForeignAlphabet) {
    EXPECT_FALSE(Base64::decode(QStringLiteral("-__-"), Base64::Alphabet::Standard).has_value());
    EXPECT_FALSE(Base64::decode(QStringLiteral("+//+"), Base64::Alphabet::UrlSafe).has_value());
}

TEST(Base64Test, DecodeRejectsGarbage) {
    EXPECT_FALSE(Base64::decode(QStringLiteral("not a url"), Base64::Alphabet::Standard).has_value());
    EXPECT_FALSE(Base64::decode(QStringLiteral("abcde"), Base64::Alphabet::Standard).has_value());
    EXPECT_FALSE(Base64::decode(QStringLiteral("vmess://abc"), Base64::Alphabet::UrlSafe).has_value());
}

TEST(Base64Test, FlexibleDecodeMixesAlphabets) {
    const auto urlSafe = Base64::decodeFlexible(QStringLiteral("-__-"));
    ASSERT_TRUE(urlSafe.has_value());
    EXPECT_EQ(*urlSafe, QByteArray("\xfb\xff\xfe", 3));

    const auto standard = Base64::decodeFlexible(QStringLiteral("  +//+  "));
    ASSERT_TRUE(standard.has_value());
    EXPECT_EQ(*standard, QByteArray("\xfb\xff\xfe", 3));
}
