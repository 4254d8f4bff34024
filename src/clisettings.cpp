#include "clisettings.hpp"

#include "logging.hpp"

namespace SubKit {

namespace {
bool parseFlag(const QString& value, bool fallback)
{
    const QString text = value.trimmed().toLower();
    if (text == QStringLiteral("1") || text == QStringLiteral("true") || text == QStringLiteral("yes")) {
        return true;
    }
    if (text == QStringLiteral("0") || text == QStringLiteral("false") || text == QStringLiteral("no")) {
        return false;
    }
    return fallback;
}
}

void CliSettings::load(const QSettings& settings)
{
    format = settings.value(QStringLiteral("output/format"), format).toString().trimmed().toLower();
    logLevel = settings.value(QStringLiteral("log/level"), logLevel).toString().trimmed().toLower();
    strict = parseFlag(settings.value(QStringLiteral("validation/strict")).toString(), strict);
}

void CliSettings::loadEnvironment(const QProcessEnvironment& environment)
{
    if (environment.contains(QStringLiteral("SUBKIT_FORMAT"))) {
        format = environment.value(QStringLiteral("SUBKIT_FORMAT")).trimmed().toLower();
    }
    if (environment.contains(QStringLiteral("SUBKIT_LOG_LEVEL"))) {
        logLevel = environment.value(QStringLiteral("SUBKIT_LOG_LEVEL")).trimmed().toLower();
    }
    if (environment.contains(QStringLiteral("SUBKIT_STRICT"))) {
        strict = parseFlag(environment.value(QStringLiteral("SUBKIT_STRICT")), strict);
    }
}

bool CliSettings::validate(QString *errorMessage) const
{
    if (!isKnownFormat(format)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unknown output format \"%1\". Use json, yaml or uri.").arg(format);
        }
        return false;
    }

    if (!Logging::isKnownLevel(logLevel)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unknown log level \"%1\". Use debug, info, warning or critical.").arg(logLevel);
        }
        return false;
    }

    return true;
}

bool CliSettings::isKnownFormat(const QString& format)
{
    return format == QStringLiteral("json")
        || format == QStringLiteral("yaml")
        || format == QStringLiteral("uri");
}

} // namespace SubKit
