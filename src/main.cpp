#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcessEnvironment>
#include <QSettings>
#include <QTextStream>

#include <cstdio>
#include <optional>
#include <utility>

#include "clisettings.hpp"
#include "codecerror.hpp"
#include "linkbuilder.hpp"
#include "linkparser.hpp"
#include "logging.hpp"
#include "proxydocument.hpp"
#include "proxynode.hpp"
#include "subscriptionextractor.hpp"

using namespace SubKit;

namespace {
constexpr int ExitSuccess = 0;
constexpr int ExitCodecFailure = 1;
constexpr int ExitUsage = 2;

QTextStream& errorStream()
{
    static QTextStream stream(stderr);
    return stream;
}

void reportError(const QString& message)
{
    errorStream() << "subkit: " << message << Qt::endl;
}

void reportCodecError(const CodecError& error)
{
    reportError(QStringLiteral("%1: %2").arg(codecErrorKindName(error.kind), error.message));
}

QString usageText()
{
    return QStringLiteral(
        "Usage: subkit [options] <command> [inputs...]\n"
        "\n"
        "Commands:\n"
        "  decode <uri>...      Decode share links (reads lines from stdin when none are given).\n"
        "  encode [file|-]      Encode a JSON node, JSON array or YAML proxies document into links.\n"
        "  extract [file|-]     Extract nodes from subscription content.\n"
        "\n"
        "Options:\n"
        "  -f, --format <fmt>   Output format: json, yaml or uri.\n"
        "  --log-level <level>  Log level: debug, info, warning or critical.\n"
        "  -c, --config <file>  Read settings from an INI file.\n"
        "  --strict             Drop nodes without a server or with a port outside 1-65535.\n"
        "  -h, --help           Show this help.\n"
        "  -v, --version        Show the version.\n");
}

std::optional<QString> readInput(const QString& path)
{
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }

    if (!opened) {
        reportError(QStringLiteral("Could not open input \"%1\": %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    return QString::fromUtf8(file.readAll());
}

QList<ProxyNode> applyStrictFilter(const QList<ProxyNode>& nodes, bool strict)
{
    if (!strict) {
        return nodes;
    }

    QList<ProxyNode> kept;
    for (const ProxyNode& node : nodes) {
        if (node.isValid()) {
            kept.append(node);
        } else {
            qCWarning(lcCli) << "Dropping invalid node" << node.displayLabel();
        }
    }
    return kept;
}

int writeNodes(const QList<ProxyNode>& nodes, const QString& format)
{
    QTextStream out(stdout);

    if (format == QStringLiteral("json")) {
        QJsonArray array;
        for (const ProxyNode& node : nodes) {
            array.append(node.toJson());
        }
        out << QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
        return ExitSuccess;
    }

    if (format == QStringLiteral("uri")) {
        int exitCode = ExitSuccess;
        for (const ProxyNode& node : nodes) {
            CodecError error;
            const std::optional<QString> link = LinkBuilder::build(node, &error);
            if (!link) {
                reportCodecError(error);
                exitCode = ExitCodecFailure;
                continue;
            }
            out << *link << Qt::endl;
        }
        return exitCode;
    }

    out << ProxyDocument::render(nodes);
    return ExitSuccess;
}

std::optional<QList<ProxyNode>> readNodes(const QString& content, CodecError *error)
{
    const QString trimmed = content.trimmed();
    if (!trimmed.startsWith(QLatin1Char('{')) && !trimmed.startsWith(QLatin1Char('['))) {
        return ProxyDocument::parse(trimmed, error);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setCodecError(error, CodecErrorKind::InvalidFormat,
                      QStringLiteral("Input is not valid JSON: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    QJsonArray objects;
    if (doc.isArray()) {
        objects = doc.array();
    } else {
        objects.append(doc.object());
    }

    QList<ProxyNode> nodes;
    for (const QJsonValue& value : std::as_const(objects)) {
        const std::optional<ProxyNode> node = ProxyNode::fromJson(value.toObject(), error);
        if (!node) {
            return std::nullopt;
        }
        nodes.append(*node);
    }
    return nodes;
}

int runDecode(const QStringList& inputs, const CliSettings& settings)
{
    QStringList links = inputs;
    if (links.isEmpty()) {
        const std::optional<QString> content = readInput(QStringLiteral("-"));
        if (!content) {
            return ExitUsage;
        }
        links = content->split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    }

    int exitCode = ExitSuccess;
    QList<ProxyNode> nodes;
    for (const QString& link : std::as_const(links)) {
        if (link.trimmed().isEmpty()) {
            continue;
        }
        CodecError error;
        const std::optional<ProxyNode> node = LinkParser::parse(link, &error);
        if (!node) {
            reportCodecError(error);
            exitCode = ExitCodecFailure;
            continue;
        }
        nodes.append(*node);
    }

    const int writeCode = writeNodes(applyStrictFilter(nodes, settings.strict), settings.format);
    return exitCode != ExitSuccess ? exitCode : writeCode;
}

int runEncode(const QStringList& inputs)
{
    const std::optional<QString> content = readInput(inputs.value(0));
    if (!content) {
        return ExitUsage;
    }

    CodecError error;
    const std::optional<QList<ProxyNode>> nodes = readNodes(*content, &error);
    if (!nodes) {
        reportCodecError(error);
        return ExitCodecFailure;
    }

    return writeNodes(*nodes, QStringLiteral("uri"));
}

int runExtract(const QStringList& inputs, const CliSettings& settings)
{
    const std::optional<QString> content = readInput(inputs.value(0));
    if (!content) {
        return ExitUsage;
    }

    CodecError error;
    const std::optional<QList<ProxyNode>> nodes = SubscriptionExtractor::extract(*content, &error);
    if (!nodes) {
        reportCodecError(error);
        return ExitCodecFailure;
    }

    return writeNodes(applyStrictFilter(*nodes, settings.strict), settings.format);
}
}

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("genyleap.com"));
    QCoreApplication::setApplicationName(QStringLiteral("SubKit"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    QString configPath;
    QString formatOverride;
    QString logLevelOverride;
    bool strictOverride = false;
    QStringList positional;

    const QStringList args = app.arguments();
    for (int i = 1; i < args.size(); ++i) {
        const QString arg = args.at(i);
        if (arg == QStringLiteral("-h") || arg == QStringLiteral("--help")) {
            QTextStream(stdout) << usageText();
            return ExitSuccess;
        }
        if (arg == QStringLiteral("-v") || arg == QStringLiteral("--version")) {
            QTextStream(stdout) << QCoreApplication::applicationName() << ' '
                                << QCoreApplication::applicationVersion() << Qt::endl;
            return ExitSuccess;
        }
        if ((arg == QStringLiteral("-f") || arg == QStringLiteral("--format")) && i + 1 < args.size()) {
            formatOverride = args.at(++i).trimmed().toLower();
            continue;
        }
        if (arg == QStringLiteral("--log-level") && i + 1 < args.size()) {
            logLevelOverride = args.at(++i).trimmed().toLower();
            continue;
        }
        if ((arg == QStringLiteral("-c") || arg == QStringLiteral("--config")) && i + 1 < args.size()) {
            configPath = args.at(++i);
            continue;
        }
        if (arg == QStringLiteral("--strict")) {
            strictOverride = true;
            continue;
        }
        if (arg.startsWith(QLatin1Char('-')) && arg != QStringLiteral("-")) {
            reportError(QStringLiteral("Unknown or incomplete option \"%1\".").arg(arg));
            return ExitUsage;
        }
        positional.append(arg);
    }

    CliSettings settings;
    if (!configPath.isEmpty()) {
        if (!QFile::exists(configPath)) {
            reportError(QStringLiteral("Settings file \"%1\" does not exist.").arg(configPath));
            return ExitUsage;
        }
        const QSettings fileSettings(configPath, QSettings::IniFormat);
        settings.load(fileSettings);
    } else {
        const QSettings userSettings;
        settings.load(userSettings);
    }
    settings.loadEnvironment(QProcessEnvironment::systemEnvironment());

    if (!formatOverride.isEmpty()) {
        settings.format = formatOverride;
    }
    if (!logLevelOverride.isEmpty()) {
        settings.logLevel = logLevelOverride;
    }
    if (strictOverride) {
        settings.strict = true;
    }

    QString settingsError;
    if (!settings.validate(&settingsError)) {
        reportError(settingsError);
        return ExitUsage;
    }
    Logging::configure(settings.logLevel);

    if (positional.isEmpty()) {
        reportError(QStringLiteral("Missing command. Run with --help for usage."));
        return ExitUsage;
    }

    const QString command = positional.constFirst().toLower();
    const QStringList inputs = positional.mid(1);
    qCDebug(lcCli) << "Running" << command << "with" << inputs.size() << "inputs, format" << settings.format;

    if (command == QStringLiteral("decode")) {
        return runDecode(inputs, settings);
    }
    if (command == QStringLiteral("encode")) {
        return runEncode(inputs);
    }
    if (command == QStringLiteral("extract")) {
        return runExtract(inputs, settings);
    }

    reportError(QStringLiteral("Unknown command \"%1\". Use decode, encode or extract.").arg(command));
    return ExitUsage;
}
