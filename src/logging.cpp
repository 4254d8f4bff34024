#include "logging.hpp"

#include <QStringList>

Q_LOGGING_CATEGORY(lcCodec, "subkit.codec")
Q_LOGGING_CATEGORY(lcExtractor, "subkit.extractor")
Q_LOGGING_CATEGORY(lcDocument, "subkit.document")
Q_LOGGING_CATEGORY(lcCli, "subkit.cli")

namespace SubKit {

namespace {
const QStringList& levelNames()
{
    static const QStringList names {
        QStringLiteral("debug"),
        QStringLiteral("info"),
        QStringLiteral("warning"),
        QStringLiteral("critical")
    };
    return names;
}
}

bool Logging::isKnownLevel(const QString& level)
{
    return levelNames().contains(level.trimmed().toLower());
}

QString Logging::filterRules(const QString& level)
{
    const QStringList& names = levelNames();
    qsizetype threshold = names.indexOf(level.trimmed().toLower());
    if (threshold < 0) {
        threshold = names.indexOf(QStringLiteral("info"));
    }

    QStringList rules;
    for (qsizetype i = 0; i < names.size(); ++i) {
        rules.append(QStringLiteral("subkit.*.%1=%2")
                         .arg(names.at(i), i >= threshold ? QStringLiteral("true") : QStringLiteral("false")));
    }
    return rules.join(QLatin1Char('\n'));
}

void Logging::configure(const QString& level)
{
    qSetMessagePattern(QStringLiteral("[%{time yyyy-MM-dd hh:mm:ss}] [%{type}] %{category}: %{message}"));
    QLoggingCategory::setFilterRules(filterRules(level));
}

} // namespace SubKit
