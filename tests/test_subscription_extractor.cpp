#include <gtest/gtest.h>

#include "base64.hpp"
#include "subscriptionextractor.hpp"

using namespace SubKit;

namespace {
const QString kSsLink = QStringLiteral("ss://YWVzLTI1Ni1nY206cGFzcw@1.2.3.4:8388#first");
const QString kTrojanLink = QStringLiteral("trojan://pw@t.example.com:443?sni=t.example.com#third");
const QString kVlessLink = QStringLiteral(
    "vless://b831381d-6324-4d53-ad4f-8cda48b30811@v.example.com:443?type=ws&security=tls&path=%2Fws#second");

QString encodeBlock(const QStringList& lines, Base64::Alphabet alphabet = Base64::Alphabet::Standard)
{
    return Base64::encode(lines.join(QLatin1Char('\n')).toUtf8(), alphabet, Base64::Padding::Padded);
}
}

TEST(SubscriptionExtractorTest, CorruptedLineIsDropped) {
    const QString block = encodeBlock({kSsLink, QStringLiteral("vmess://!!!corrupted!!!"), kTrojanLink});

    CodecError error;
    const auto nodes = SubscriptionExtractor::extract(block, &error);
    ASSERT_TRUE(nodes.has_value()) << error.message.toStdString();
    ASSERT_EQ(nodes->size(), 2);
    EXPECT_EQ(nodes->at(0).name, QStringLiteral("first"));
    EXPECT_EQ(nodes->at(1).name, QStringLiteral("third"));
}

TEST(SubscriptionExtractorTest, PreservesOrderAndSkipsCommentsAndBlanks) {
    const QString block = encodeBlock({
        QStringLiteral("# generated"),
        kSsLink,
        QString(),
        QStringLiteral("   "),
        kVlessLink,
        kTrojanLink + QStringLiteral("\r")
    });

    const auto nodes = SubscriptionExtractor::extract(block);
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->size(), 3);
    EXPECT_EQ(nodes->at(0).type, QStringLiteral("ss"));
    EXPECT_EQ(nodes->at(1).type, QStringLiteral("vless"));
    EXPECT_EQ(nodes->at(2).type, QStringLiteral("trojan"));
}

TEST(SubscriptionExtractorTest, WrappedBase64Block) {
    QString block = encodeBlock({kSsLink, kTrojanLink});
    block.insert(20, QStringLiteral("\r\n"));
    block.insert(50, QStringLiteral("\n"));

    const auto nodes = SubscriptionExtractor::extract(QStringLiteral("\n  ") + block + QStringLiteral("  \n"));
    ASSERT_TRUE(nodes.has_value());
    EXPECT_EQ(nodes->size(), 2);
}

TEST(SubscriptionExtractorTest, UrlSafeBlock) {
    const QString block = Base64::encode(
        QStringList {kSsLink, kVlessLink, kTrojanLink}.join(QLatin1Char('\n')).toUtf8() + QByteArray("\n\xfb\xff"),
        Base64::Alphabet::UrlSafe, Base64::Padding::Unpadded);
    ASSERT_TRUE(block.contains(QLatin1Char('-')) || block.contains(QLatin1Char('_')));

    const auto nodes = SubscriptionExtractor::extract(block);
    ASSERT_TRUE(nodes.has_value());
    EXPECT_EQ(nodes->size(), 3);
}

TEST(SubscriptionExtractorTest, NotAUrlFails) {
    CodecError error;
    EXPECT_FALSE(SubscriptionExtractor::extract(QStringLiteral("not a url"), &error).has_value());
    EXPECT_EQ(error.kind, CodecErrorKind::NoProxiesFound);
}

TEST(SubscriptionExtractorTest, AllLinesBrokenFails) {
    CodecError error;
    const QString block = encodeBlock({QStringLiteral("vmess://!!!"), QStringLiteral("foo://bar")});
    EXPECT_FALSE(SubscriptionExtractor::extract(block, &error).has_value());
    EXPECT_EQ(error.kind, CodecErrorKind::NoProxiesFound);
}

TEST(SubscriptionExtractorTest, PlainLinkList) {
    const QString content = kSsLink + QStringLiteral("\r\n") + kTrojanLink + QStringLiteral("\nnot a link\n");

    const auto nodes = SubscriptionExtractor::extract(content);
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->size(), 2);
    EXPECT_EQ(nodes->at(0).type, QStringLiteral("ss"));
    EXPECT_EQ(nodes->at(1).type, QStringLiteral("trojan"));
}

TEST(SubscriptionExtractorTest, StructuredConfig) {
    const QString content = QStringLiteral(
        "port: 7890\n"
        "mode: rule\n"
        "proxies:\n"
        "  - name: \"HK\"\n"
        "    type: trojan\n"
        "    server: hk.example.com\n"
        "    port: 443\n"
        "    password: pw\n"
        "    sni: hk.example.com\n"
        "  - name: HTTP\n"
        "    type: http\n"
        "    server: proxy.example.com\n"
        "    port: 8080\n"
        "proxy-groups:\n"
        "  - name: Auto\n"
        "    type: url-test\n"
        "    proxies: [HK]\n");

    const auto nodes = SubscriptionExtractor::extract(content);
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->size(), 1);
    EXPECT_EQ(nodes->at(0).name, QStringLiteral("HK"));
    EXPECT_EQ(nodes->at(0).type, QStringLiteral("trojan"));
    EXPECT_EQ(nodes->at(0).port, 443);
}

TEST(SubscriptionExtractorTest, StructuredConfigWithoutProxiesFails) {
    CodecError error;
    const QString content = QStringLiteral("proxy-groups:\n  - name: Auto\n    type: select\n");
    EXPECT_FALSE(SubscriptionExtractor::extract(content, &error).has_value());
    EXPECT_EQ(error.kind, CodecErrorKind::NoProxiesFound);
}

TEST(SubscriptionExtractorTest, EmptyProxyListFails) {
    CodecError error;
    EXPECT_FALSE(SubscriptionExtractor::extract(QStringLiteral("proxies: []\n"), &error).has_value());
    EXPECT_EQ(error.kind, CodecErrorKind::NoProxiesFound);
}

TEST(SubscriptionExtractorTest, DetectsStructuredMarkers) {
    EXPECT_TRUE(SubscriptionExtractor::isStructuredConfig(QStringLiteral("  proxies:\n  - {}")));
    EXPECT_TRUE(SubscriptionExtractor::isStructuredConfig(QStringLiteral("mixed-port: 1\nproxy-groups: []")));
    EXPECT_FALSE(SubscriptionExtractor::isStructuredConfig(QStringLiteral("mixed-port: 1\n  proxies: []")));
    EXPECT_FALSE(SubscriptionExtractor::isStructuredConfig(kSsLink));
}

TEST(SubscriptionExtractorTest, ExtractFromUris) {
    const auto nodes = SubscriptionExtractor::extractFromUris({kVlessLink, QStringLiteral("bogus"), kSsLink});
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->size(), 2);
    EXPECT_EQ(nodes->at(0).type, QStringLiteral("vless"));
    EXPECT_EQ(nodes->at(1).type, QStringLiteral("ss"));

    CodecError error;
    EXPECT_FALSE(SubscriptionExtractor::extractFromUris({}, &error).has_value());
    EXPECT_EQ(error.kind, CodecErrorKind::NoProxiesFound);
}
