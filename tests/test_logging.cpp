#include <gtest/gtest.h>

#include "logging.hpp"

using namespace SubKit;

TEST(LoggingTest, KnownLevels) {
    EXPECT_TRUE(Logging::isKnownLevel(QStringLiteral("debug")));
    EXPECT_TRUE(Logging::isKnownLevel(QStringLiteral(" Warning ")));
    EXPECT_FALSE(Logging::isKnownLevel(QStringLiteral("trace")));
}

TEST(LoggingTest, WarningRules) {
    EXPECT_EQ(Logging::filterRules(QStringLiteral("warning")),
              QStringLiteral("subkit.*.debug=false\n"
                             "subkit.*.info=false\n"
                             "subkit.*.warning=true\n"
                             "subkit.*.critical=true"));
}

TEST(LoggingTest, DebugEnablesEverything) {
    const QString rules = Logging::filterRules(QStringLiteral("debug"));
    EXPECT_FALSE(rules.contains(QStringLiteral("=false")));
}

TEST(LoggingTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(Logging::filterRules(QStringLiteral("trace")), Logging::filterRules(QStringLiteral("info")));
}

TEST(LoggingTest, ConfigureAppliesThreshold) {
    Logging::configure(QStringLiteral("critical"));
    EXPECT_FALSE(lcCodec().isWarningEnabled());
    EXPECT_TRUE(lcCodec().isCriticalEnabled());

    Logging::configure(QStringLiteral("debug"));
    EXPECT_TRUE(lcExtractor().isDebugEnabled());

    Logging::configure(QStringLiteral("warning"));
    EXPECT_FALSE(lcDocument().isInfoEnabled());
    EXPECT_TRUE(lcCli().isWarningEnabled());
}
