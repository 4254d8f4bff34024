#include "subscriptionextractor.hpp"

#include "base64.hpp"
#include "linkparser.hpp"
#include "logging.hpp"
#include "proxydocument.hpp"

namespace SubKit {

std::optional<QList<ProxyNode>> SubscriptionExtractor::extract(const QString& content, CodecError *error)
{
    const QString trimmed = content.trimmed();

    if (isStructuredConfig(trimmed)) {
        qCInfo(lcExtractor) << "Detected structured config, parsing proxies...";
        return ProxyDocument::parse(trimmed, error);
    }

    qCDebug(lcExtractor) << "Attempting base64 decode of" << trimmed.size() << "characters";
    const std::optional<QString> decoded = decodeSubscriptionBlock(trimmed);
    if (decoded) {
        return extractFromLines(decoded->split(QLatin1Char('\n')), error);
    }

    if (trimmed.contains(QStringLiteral("://"))) {
        qCInfo(lcExtractor) << "Content is not base64, treating it as a plain link list";
        return extractFromLines(trimmed.split(QLatin1Char('\n')), error);
    }

    setCodecError(error, CodecErrorKind::NoProxiesFound,
                  QStringLiteral("Content is neither a structured config nor a base64 link block."));
    return std::nullopt;
}

std::optional<QList<ProxyNode>> SubscriptionExtractor::extractFromUris(const QStringList& uris, CodecError *error)
{
    return extractFromLines(uris, error);
}

bool SubscriptionExtractor::isStructuredConfig(const QString& content)
{
    const QString trimmed = content.trimmed();
    return trimmed.startsWith(QStringLiteral("proxies:"))
        || trimmed.startsWith(QStringLiteral("proxy-groups:"))
        || trimmed.contains(QStringLiteral("\nproxies:"))
        || trimmed.contains(QStringLiteral("\nproxy-groups:"));
}

std::optional<QString> SubscriptionExtractor::decodeSubscriptionBlock(const QString& content)
{
    std::optional<QByteArray> decoded = Base64::decode(content, Base64::Alphabet::Standard);
    if (!decoded) {
        decoded = Base64::decode(content, Base64::Alphabet::UrlSafe);
    }
    if (!decoded) {
        return std::nullopt;
    }
    return QString::fromUtf8(*decoded);
}

std::optional<QList<ProxyNode>> SubscriptionExtractor::extractFromLines(const QStringList& lines, CodecError *error)
{
    qCInfo(lcExtractor) << "Processing" << lines.size() << "lines";

    QList<ProxyNode> nodes;
    for (qsizetype i = 0; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        CodecError lineError;
        const std::optional<ProxyNode> node = LinkParser::parse(line, &lineError);
        if (!node) {
            qCDebug(lcExtractor) << "Line" << i + 1 << "parse failed:"
                                 << codecErrorKindName(lineError.kind) << lineError.message;
            continue;
        }
        nodes.append(*node);
    }

    if (nodes.isEmpty()) {
        setCodecError(error, CodecErrorKind::NoProxiesFound, QStringLiteral("No valid nodes found."));
        return std::nullopt;
    }

    qCInfo(lcExtractor) << "Successfully parsed" << nodes.size() << "valid nodes";
    return nodes;
}

} // namespace SubKit
