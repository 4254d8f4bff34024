#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>

#include "fieldreader.hpp"

using namespace SubKit;

namespace {
QJsonObject mixedPayload()
{
    return QJsonObject {
        {QStringLiteral("add"), QStringLiteral("vm.example.com")},
        {QStringLiteral("port"), QStringLiteral(" 443 ")},
        {QStringLiteral("aid"), 2.0},
        {QStringLiteral("float"), 64.9},
        {QStringLiteral("tls"), true},
        {QStringLiteral("list"), QJsonArray {1, 2}},
        {QStringLiteral("word"), QStringLiteral("auto")}
    };
}
}

TEST(FieldReaderTest, ReadsStringsAndRendersScalars) {
    const FieldReader reader(mixedPayload());
    EXPECT_EQ(reader.stringValue(QStringLiteral("add")), QStringLiteral("vm.example.com"));
    EXPECT_EQ(reader.stringValue(QStringLiteral("aid")), QStringLiteral("2"));
    EXPECT_EQ(reader.stringValue(QStringLiteral("float")), QStringLiteral("64.9"));
    EXPECT_EQ(reader.stringValue(QStringLiteral("tls")), QStringLiteral("true"));
}

TEST(FieldReaderTest, StringFallbackForMissingOrCompound) {
    const FieldReader reader(mixedPayload());
    EXPECT_EQ(reader.stringValue(QStringLiteral("missing"), QStringLiteral("none")), QStringLiteral("none"));
    EXPECT_EQ(reader.stringValue(QStringLiteral("list"), QStringLiteral("none")), QStringLiteral("none"));
}

TEST(FieldReaderTest, IntegersFromNumbersAndStrings) {
    const FieldReader reader(mixedPayload());
    EXPECT_EQ(reader.intValue(QStringLiteral("port")), 443);
    EXPECT_EQ(reader.intValue(QStringLiteral("aid")), 2);
    EXPECT_EQ(reader.intValue(QStringLiteral("float")), 64);
}

TEST(FieldReaderTest, IntegerFallbackForNonNumeric) {
    const FieldReader reader(mixedPayload());
    EXPECT_EQ(reader.intValue(QStringLiteral("word"), -1), -1);
    EXPECT_EQ(reader.intValue(QStringLiteral("tls"), 7), 7);
    EXPECT_EQ(reader.intValue(QStringLiteral("missing")), 0);
}
