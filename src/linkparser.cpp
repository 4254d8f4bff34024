#include "linkparser.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QUrlQuery>

#include <algorithm>

#include "base64.hpp"
#include "fieldreader.hpp"
#include "logging.hpp"
#include "shareuri.hpp"

namespace SubKit {

namespace {
QString displayNameOr(const QString& fragment, const QString& fallback)
{
    const QString name = fragment.trimmed();
    return name.isEmpty() ? fallback : name;
}

QStringList splitAlpn(const QString& value)
{
    QStringList list;
    for (const QString& part : value.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            list.append(trimmed);
        }
    }
    return list;
}

QString decodeBase64Text(const QString& value)
{
    const std::optional<QByteArray> decoded = Base64::decodeFlexible(value);
    return decoded ? QString::fromUtf8(*decoded) : QString();
}

std::optional<QPair<QString, QString>> splitShadowsocksCredentials(const ShareUri& uri)
{
    const QString decoded = decodeBase64Text(uri.userInfo);
    const int colonIdx = decoded.indexOf(QLatin1Char(':'));
    if (colonIdx > 0) {
        return qMakePair(decoded.left(colonIdx), decoded.mid(colonIdx + 1));
    }

    // SIP002 allows plain percent-encoded `cipher:password` for AEAD-2022 ciphers.
    if (!uri.password.isEmpty() && !uri.user.isEmpty()) {
        return qMakePair(uri.user, uri.password);
    }

    return std::nullopt;
}
}

std::optional<ProxyNode> LinkParser::parse(const QString& rawLink, CodecError *error)
{
    const QString link = rawLink.trimmed();
    const int separatorIdx = link.indexOf(QStringLiteral("://"));
    if (separatorIdx < 0) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("Link is missing the \"://\" separator."));
        return std::nullopt;
    }

    QString scheme = link.left(separatorIdx).toLower();
    if (scheme == QStringLiteral("hy2")) {
        scheme = QStringLiteral("hysteria2");
    }

    const std::optional<ShareUri> uri = ShareUri::parse(link);
    if (!uri) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("Link could not be split."));
        return std::nullopt;
    }

    std::optional<ProxyNode> node;
    if (scheme == QStringLiteral("ss")) {
        node = parseShadowsocks(*uri, error);
    } else if (scheme == QStringLiteral("ssr")) {
        node = parseShadowsocksR(*uri, error);
    } else if (scheme == QStringLiteral("vmess")) {
        node = parseVmess(*uri, error);
    } else if (scheme == QStringLiteral("vless")) {
        node = parseVless(*uri, error);
    } else if (scheme == QStringLiteral("trojan")) {
        node = parseTrojan(*uri, error);
    } else if (scheme == QStringLiteral("hysteria")) {
        node = parseHysteria(*uri, error);
    } else if (scheme == QStringLiteral("hysteria2")) {
        node = parseHysteria2(*uri, error);
    } else if (scheme == QStringLiteral("tuic")) {
        node = parseTuic(*uri, error);
    } else {
        setCodecError(error, CodecErrorKind::UnsupportedProtocol,
                      QStringLiteral("Unsupported protocol: %1").arg(scheme));
        return std::nullopt;
    }

    if (!node) {
        return std::nullopt;
    }

    if (node->server.trimmed().isEmpty()) {
        setCodecError(error, CodecErrorKind::InvalidFormat,
                      QStringLiteral("%1 link is missing a server host.").arg(scheme.toUpper()));
        return std::nullopt;
    }

    qCDebug(lcCodec) << "Parsed" << node->type << "node" << node->name << "at" << node->server << node->port;
    return node;
}

std::optional<ProxyNode> LinkParser::parseShadowsocks(const ShareUri& uri, CodecError *error)
{
    ProxyNode node;
    node.type = QStringLiteral("ss");
    node.name = displayNameOr(uri.fragment, node.type);

    if (uri.hasUserInfo) {
        const auto credentials = splitShadowsocksCredentials(uri);
        if (!credentials) {
            setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("SS userinfo is not base64 \"cipher:password\"."));
            return std::nullopt;
        }

        node.server = uri.host;
        node.port = uri.port;
        node.cipher = credentials->first;
        node.password = credentials->second;

        const QString plugin = uri.queryValue(QStringLiteral("plugin"));
        if (!plugin.isEmpty()) {
            const QStringList pluginParts = plugin.split(QLatin1Char(';'));
            node.plugin = pluginParts.constFirst();

            const bool isObfs = node.plugin == QStringLiteral("obfs");
            for (qsizetype i = 1; i < pluginParts.size(); ++i) {
                const QString& option = pluginParts.at(i);
                const int equalsIdx = option.indexOf(QLatin1Char('='));
                if (equalsIdx <= 0) {
                    continue;
                }

                QString key = option.left(equalsIdx);
                if (isObfs && key == QStringLiteral("host")) {
                    key = QStringLiteral("obfs-host");
                }
                node.pluginOpts.insert(key, option.mid(equalsIdx + 1));
            }
        }

        return node;
    }

    QString blob = uri.body;
    while (blob.startsWith(QLatin1Char('/'))) {
        blob.remove(0, 1);
    }

    const std::optional<QByteArray> decoded = Base64::decodeFlexible(blob);
    if (!decoded) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("SS legacy payload could not be Base64-decoded."));
        return std::nullopt;
    }

    static const QRegularExpression legacyPattern(QStringLiteral("^([^:@]+):([^@]+)@([^:]+):(\\d+)$"));
    const QRegularExpressionMatch match = legacyPattern.match(QString::fromUtf8(*decoded).trimmed());
    if (!match.hasMatch()) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("SS legacy payload does not match cipher:password@host:port."));
        return std::nullopt;
    }

    node.cipher = match.captured(1);
    node.password = match.captured(2);
    node.server = match.captured(3);
    node.port = ShareUri::parsePort(match.captured(4));
    return node;
}

std::optional<ProxyNode> LinkParser::parseShadowsocksR(const ShareUri& uri, CodecError *error)
{
    const std::optional<QByteArray> decoded = Base64::decodeFlexible(uri.body);
    if (!decoded) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("SSR payload could not be Base64-decoded."));
        return std::nullopt;
    }

    const QString content = QString::fromUtf8(*decoded).trimmed();
    QString mainPart = content;
    QString queryPart;
    const int queryIdx = content.indexOf(QStringLiteral("/?"));
    if (queryIdx >= 0) {
        mainPart = content.left(queryIdx);
        queryPart = content.mid(queryIdx + 2);
    }

    // Fields are positional, so an IPv6 host shifts every later field.
    const QStringList parts = mainPart.split(QLatin1Char(':'));
    if (parts.size() < 6) {
        setCodecError(error, CodecErrorKind::InvalidFormat,
                      QStringLiteral("SSR payload has %1 fields, expected 6.").arg(parts.size()));
        return std::nullopt;
    }

    ProxyNode node;
    node.type = QStringLiteral("ssr");
    node.server = parts.at(0);
    node.port = ShareUri::parsePort(parts.at(1));
    node.protocol = parts.at(2);
    node.cipher = parts.at(3);
    node.obfs = parts.at(4);
    node.password = decodeBase64Text(parts.at(5));

    QString remarks;
    if (!queryPart.isEmpty()) {
        const QUrlQuery query(queryPart);
        node.obfsParam = decodeBase64Text(query.queryItemValue(QStringLiteral("obfsparam"), QUrl::FullyDecoded));
        node.protocolParam = decodeBase64Text(query.queryItemValue(QStringLiteral("protoparam"), QUrl::FullyDecoded));
        remarks = decodeBase64Text(query.queryItemValue(QStringLiteral("remarks"), QUrl::FullyDecoded));
    }
    node.name = displayNameOr(remarks, node.type);

    return node;
}

std::optional<ProxyNode> LinkParser::parseVmess(const ShareUri& uri, CodecError *error)
{
    const std::optional<QByteArray> decoded = Base64::decodeFlexible(uri.body);
    if (!decoded || decoded->isEmpty()) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("VMESS payload could not be Base64-decoded."));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(*decoded, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("VMESS payload is not valid JSON."));
        return std::nullopt;
    }

    const FieldReader reader(doc.object());

    ProxyNode node;
    node.type = QStringLiteral("vmess");
    node.name = displayNameOr(uri.fragment, displayNameOr(reader.stringValue(QStringLiteral("ps")), node.type));
    node.server = reader.stringValue(QStringLiteral("add")).trimmed();
    node.port = std::max(reader.intValue(QStringLiteral("port"), 0), 0);
    node.uuid = reader.stringValue(QStringLiteral("id")).trimmed();
    node.alterId = reader.intValue(QStringLiteral("aid"), 0);

    node.cipher = reader.stringValue(QStringLiteral("scy")).trimmed();
    if (node.cipher.isEmpty()) {
        node.cipher = QStringLiteral("auto");
    }

    node.network = reader.stringValue(QStringLiteral("net")).trimmed().toLower();
    if (node.network.isEmpty()) {
        node.network = QStringLiteral("tcp");
    }

    if (reader.stringValue(QStringLiteral("tls")).trimmed().toLower() == QStringLiteral("tls")) {
        node.tls = true;
        node.servername = reader.stringValue(QStringLiteral("sni")).trimmed();
        node.alpn = splitAlpn(reader.stringValue(QStringLiteral("alpn")));
        node.clientFingerprint = reader.stringValue(QStringLiteral("fp")).trimmed();
    }

    if (node.network == QStringLiteral("ws")) {
        WsOptions ws;
        ws.path = reader.stringValue(QStringLiteral("path"));
        if (ws.path.isEmpty()) {
            ws.path = QStringLiteral("/");
        }
        const QString host = reader.stringValue(QStringLiteral("host")).trimmed();
        if (!host.isEmpty()) {
            ws.headers.insert(QStringLiteral("Host"), host);
        }
        node.wsOpts = ws;
    } else if (node.network == QStringLiteral("grpc")) {
        node.grpcOpts = GrpcOptions {reader.stringValue(QStringLiteral("path"))};
    }

    return node;
}

std::optional<ProxyNode> LinkParser::parseVless(const ShareUri& uri, CodecError *error)
{
    Q_UNUSED(error);

    ProxyNode node;
    node.type = QStringLiteral("vless");
    node.name = displayNameOr(uri.fragment, node.type);
    node.server = uri.host;
    node.port = uri.port;
    node.uuid = uri.userInfo;

    node.network = uri.queryValue(QStringLiteral("type")).trimmed().toLower();
    if (node.network.isEmpty()) {
        node.network = QStringLiteral("tcp");
    }
    node.encryption = uri.queryValue(QStringLiteral("encryption"));
    node.flow = uri.queryValue(QStringLiteral("flow"));

    const QString security = uri.queryValue(QStringLiteral("security")).trimmed().toLower();
    const QString sni = uri.firstQueryValue({QStringLiteral("sni"), QStringLiteral("serverName")});
    if (security == QStringLiteral("reality")) {
        node.tls = true;
        node.realityOpts = RealityOptions {
            uri.queryValue(QStringLiteral("pbk")),
            uri.queryValue(QStringLiteral("sid"))
        };
        node.servername = sni;
        node.clientFingerprint = uri.queryValue(QStringLiteral("fp"));
    } else if (security == QStringLiteral("tls")) {
        node.tls = true;
        node.servername = sni;
        node.alpn = splitAlpn(uri.queryValue(QStringLiteral("alpn")));
        node.clientFingerprint = uri.queryValue(QStringLiteral("fp"));
    }

    node.skipCertVerify = uri.queryFlag(QStringLiteral("allowInsecure")) || uri.queryFlag(QStringLiteral("insecure"));
    applyTransportOptions(uri, node);

    return node;
}

std::optional<ProxyNode> LinkParser::parseTrojan(const ShareUri& uri, CodecError *error)
{
    Q_UNUSED(error);

    ProxyNode node;
    node.type = QStringLiteral("trojan");
    node.name = displayNameOr(uri.fragment, node.type);
    node.server = uri.host;
    node.port = uri.port;
    node.password = uri.userInfo;

    node.network = uri.queryValue(QStringLiteral("type")).trimmed().toLower();
    if (node.network.isEmpty()) {
        node.network = QStringLiteral("tcp");
    }

    const QString security = uri.queryValue(QStringLiteral("security")).trimmed().toLower();
    node.sni = uri.firstQueryValue({QStringLiteral("sni"), QStringLiteral("peer")});
    node.clientFingerprint = uri.queryValue(QStringLiteral("fp"));

    if (security == QStringLiteral("reality")) {
        node.tls = true;
        node.realityOpts = RealityOptions {
            uri.queryValue(QStringLiteral("pbk")),
            uri.queryValue(QStringLiteral("sid"))
        };
    } else {
        node.tls = security.isEmpty() || security == QStringLiteral("tls");
        node.alpn = splitAlpn(uri.queryValue(QStringLiteral("alpn")));
    }

    node.skipCertVerify = uri.queryFlag(QStringLiteral("allowInsecure")) || uri.queryFlag(QStringLiteral("insecure"));
    applyTransportOptions(uri, node);

    return node;
}

std::optional<ProxyNode> LinkParser::parseHysteria(const ShareUri& uri, CodecError *error)
{
    Q_UNUSED(error);

    ProxyNode node;
    node.type = QStringLiteral("hysteria");
    node.name = displayNameOr(uri.fragment, node.type);
    node.server = uri.host;
    node.port = uri.port;
    node.authStr = uri.userInfo.isEmpty() ? uri.queryValue(QStringLiteral("auth")) : uri.userInfo;

    node.protocol = uri.queryValue(QStringLiteral("protocol"));
    if (node.protocol.isEmpty()) {
        node.protocol = QStringLiteral("udp");
    }

    node.up = uri.firstQueryValue({QStringLiteral("up"), QStringLiteral("upmbps")});
    node.down = uri.firstQueryValue({QStringLiteral("down"), QStringLiteral("downmbps")});
    node.sni = uri.queryValue(QStringLiteral("sni"));
    node.skipCertVerify = uri.queryFlag(QStringLiteral("insecure"));
    node.obfs = uri.queryValue(QStringLiteral("obfs"));
    node.alpn = splitAlpn(uri.queryValue(QStringLiteral("alpn")));

    return node;
}

std::optional<ProxyNode> LinkParser::parseHysteria2(const ShareUri& uri, CodecError *error)
{
    Q_UNUSED(error);

    ProxyNode node;
    node.type = QStringLiteral("hysteria2");
    node.name = displayNameOr(uri.fragment, node.type);
    node.server = uri.host;
    node.port = uri.port;
    node.password = uri.userInfo;

    node.up = uri.firstQueryValue({QStringLiteral("up"), QStringLiteral("upmbps")});
    node.down = uri.firstQueryValue({QStringLiteral("down"), QStringLiteral("downmbps")});
    node.sni = uri.queryValue(QStringLiteral("sni"));
    node.skipCertVerify = uri.queryFlag(QStringLiteral("insecure"));
    node.obfs = uri.queryValue(QStringLiteral("obfs"));
    node.obfsPassword = uri.queryValue(QStringLiteral("obfs-password"));
    node.alpn = splitAlpn(uri.queryValue(QStringLiteral("alpn")));
    node.ports = uri.queryValue(QStringLiteral("ports"));

    return node;
}

std::optional<ProxyNode> LinkParser::parseTuic(const ShareUri& uri, CodecError *error)
{
    Q_UNUSED(error);

    ProxyNode node;
    node.type = QStringLiteral("tuic");
    node.name = displayNameOr(uri.fragment, node.type);
    node.server = uri.host;
    node.port = uri.port;

    static const QRegularExpression uuidPattern(QStringLiteral("^[0-9a-fA-F-]{36}$"));
    if (uuidPattern.match(uri.user).hasMatch()) {
        node.uuid = uri.user;
    } else {
        node.token = uri.user;
    }
    node.password = uri.password;

    const QString token = uri.queryValue(QStringLiteral("token"));
    if (!token.isEmpty()) {
        node.token = token;
    }

    node.sni = uri.queryValue(QStringLiteral("sni"));
    node.skipCertVerify = uri.queryFlag(QStringLiteral("skip-cert-verify"));
    node.alpn = splitAlpn(uri.queryValue(QStringLiteral("alpn")));
    node.disableSni = uri.queryFlag(QStringLiteral("disable-sni"));
    node.reduceRtt = uri.queryFlag(QStringLiteral("reduce-rtt"));
    node.udpRelayMode = uri.firstQueryValue({QStringLiteral("udp-relay-mode"), QStringLiteral("udp_relay_mode")});
    node.congestionController = uri.firstQueryValue({QStringLiteral("congestion-controller"), QStringLiteral("congestion_control")});

    return node;
}

void LinkParser::applyTransportOptions(const ShareUri& uri, ProxyNode& node)
{
    if (node.network == QStringLiteral("ws")) {
        WsOptions ws;
        ws.path = uri.queryValue(QStringLiteral("path"));
        if (ws.path.isEmpty()) {
            ws.path = QStringLiteral("/");
        }
        const QString host = uri.queryValue(QStringLiteral("host"));
        if (!host.isEmpty()) {
            ws.headers.insert(QStringLiteral("Host"), host);
        }
        node.wsOpts = ws;
    } else if (node.network == QStringLiteral("grpc")) {
        node.grpcOpts = GrpcOptions {uri.queryValue(QStringLiteral("serviceName"))};
    }
}

} // namespace SubKit
