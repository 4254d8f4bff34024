#include "linkbuilder.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include "base64.hpp"
#include "logging.hpp"
#include "shareuri.hpp"

namespace SubKit {

namespace {
QString valueOr(const QString& value, const QString& fallback)
{
    return value.isEmpty() ? fallback : value;
}

QString encodeUrlSafe(const QString& text)
{
    return Base64::encode(text.toUtf8(), Base64::Alphabet::UrlSafe, Base64::Padding::Unpadded);
}

QString pluginOptionText(const QVariant& value)
{
    if (value.typeId() == QMetaType::Bool) {
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    }
    return value.toString();
}
}

std::optional<QString> LinkBuilder::build(const ProxyNode& node, CodecError *error)
{
    const QString type = node.type.trimmed().toLower();

    QString link;
    if (type == QStringLiteral("ss")) {
        link = buildShadowsocks(node);
    } else if (type == QStringLiteral("ssr")) {
        link = buildShadowsocksR(node);
    } else if (type == QStringLiteral("vmess")) {
        link = buildVmess(node);
    } else if (type == QStringLiteral("vless")) {
        link = buildVless(node);
    } else if (type == QStringLiteral("trojan")) {
        link = buildTrojan(node);
    } else if (type == QStringLiteral("hysteria")) {
        link = buildHysteria(node);
    } else if (type == QStringLiteral("hysteria2")) {
        link = buildHysteria2(node);
    } else if (type == QStringLiteral("tuic")) {
        link = buildTuic(node);
    } else {
        setCodecError(error, CodecErrorKind::UnsupportedProtocol,
                      QStringLiteral("Unsupported node type: %1").arg(node.type));
        return std::nullopt;
    }

    qCDebug(lcCodec) << "Built" << type << "link for" << node.displayLabel();
    return link;
}

QString LinkBuilder::buildShadowsocks(const ProxyNode& node)
{
    ShareUriBuilder builder(QStringLiteral("ss"));
    builder.setRawUserInfo(encodeUrlSafe(node.cipher + QLatin1Char(':') + node.password))
           .setEndpoint(node.server, node.port)
           .setFragment(node.name);

    if (!node.plugin.isEmpty()) {
        builder.addQueryItem(QStringLiteral("plugin"), pluginValue(node));
    }

    return builder.toString();
}

QString LinkBuilder::buildShadowsocksR(const ProxyNode& node)
{
    const QString mainPart = QStringList {
        node.server,
        QString::number(node.port),
        valueOr(node.protocol, QStringLiteral("origin")),
        valueOr(node.cipher, QStringLiteral("aes-128-ctr")),
        valueOr(node.obfs, QStringLiteral("plain")),
        encodeUrlSafe(node.password)
    }.join(QLatin1Char(':'));

    QList<QPair<QString, QString>> query;
    if (!node.obfsParam.isEmpty()) {
        query.append(qMakePair(QStringLiteral("obfsparam"), encodeUrlSafe(node.obfsParam)));
    }
    if (!node.protocolParam.isEmpty()) {
        query.append(qMakePair(QStringLiteral("protoparam"), encodeUrlSafe(node.protocolParam)));
    }
    if (!node.name.isEmpty()) {
        query.append(qMakePair(QStringLiteral("remarks"), encodeUrlSafe(node.name)));
    }

    QString content = mainPart;
    if (!query.isEmpty()) {
        content += QStringLiteral("/?") + ShareUri::encodeQuery(query);
    }

    return QStringLiteral("ssr://") + encodeUrlSafe(content);
}

QString LinkBuilder::buildVmess(const ProxyNode& node)
{
    QJsonObject payload {
        {QStringLiteral("v"), QStringLiteral("2")},
        {QStringLiteral("ps"), valueOr(node.name, QStringLiteral("vmess"))},
        {QStringLiteral("add"), node.server},
        {QStringLiteral("port"), node.port},
        {QStringLiteral("id"), node.uuid},
        {QStringLiteral("aid"), node.alterId},
        {QStringLiteral("scy"), valueOr(node.cipher, QStringLiteral("auto"))},
        {QStringLiteral("net"), valueOr(node.network, QStringLiteral("tcp"))},
        {QStringLiteral("type"), QStringLiteral("none")},
        {QStringLiteral("host"), QString()},
        {QStringLiteral("path"), QString()},
        {QStringLiteral("tls"), QString()},
        {QStringLiteral("sni"), QString()}
    };

    if (node.tls) {
        payload.insert(QStringLiteral("tls"), QStringLiteral("tls"));
        payload.insert(QStringLiteral("sni"), valueOr(node.servername, node.sni));
        if (!node.alpn.isEmpty()) {
            payload.insert(QStringLiteral("alpn"), node.alpn.join(QLatin1Char(',')));
        }
        if (!node.clientFingerprint.isEmpty()) {
            payload.insert(QStringLiteral("fp"), node.clientFingerprint);
        }
    }

    if (node.network == QStringLiteral("ws") && node.wsOpts) {
        payload.insert(QStringLiteral("path"), node.wsOpts->path);
        payload.insert(QStringLiteral("host"), node.wsOpts->headers.value(QStringLiteral("Host")));
    } else if (node.network == QStringLiteral("grpc") && node.grpcOpts) {
        payload.insert(QStringLiteral("path"), node.grpcOpts->serviceName);
    }

    const QByteArray json = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    return QStringLiteral("vmess://") + Base64::encode(json, Base64::Alphabet::Standard, Base64::Padding::Padded);
}

QString LinkBuilder::buildVless(const ProxyNode& node)
{
    ShareUriBuilder builder(QStringLiteral("vless"));
    builder.setCredentials(node.uuid)
           .setEndpoint(node.server, node.port)
           .setFragment(node.name)
           .addQueryItem(QStringLiteral("type"), valueOr(node.network, QStringLiteral("tcp")))
           .addOptionalQueryItem(QStringLiteral("encryption"), node.encryption)
           .addOptionalQueryItem(QStringLiteral("flow"), node.flow);

    const QString sni = valueOr(node.servername, node.sni);
    if (node.realityOpts) {
        builder.addQueryItem(QStringLiteral("security"), QStringLiteral("reality"))
               .addQueryItem(QStringLiteral("pbk"), node.realityOpts->publicKey)
               .addQueryItem(QStringLiteral("sid"), node.realityOpts->shortId)
               .addOptionalQueryItem(QStringLiteral("sni"), sni)
               .addOptionalQueryItem(QStringLiteral("fp"), node.clientFingerprint);
    } else if (node.tls) {
        builder.addQueryItem(QStringLiteral("security"), QStringLiteral("tls"))
               .addOptionalQueryItem(QStringLiteral("sni"), sni)
               .addOptionalQueryItem(QStringLiteral("alpn"), node.alpn.join(QLatin1Char(',')))
               .addOptionalQueryItem(QStringLiteral("fp"), node.clientFingerprint);
    }

    if (node.skipCertVerify) {
        builder.addQueryItem(QStringLiteral("allowInsecure"), QStringLiteral("1"));
    }
    addTransportItems(node, builder);

    return builder.toString();
}

QString LinkBuilder::buildTrojan(const ProxyNode& node)
{
    ShareUriBuilder builder(QStringLiteral("trojan"));
    builder.setCredentials(node.password)
           .setEndpoint(node.server, node.port)
           .setFragment(node.name)
           .addQueryItem(QStringLiteral("type"), valueOr(node.network, QStringLiteral("tcp")));

    if (node.realityOpts) {
        builder.addQueryItem(QStringLiteral("security"), QStringLiteral("reality"))
               .addQueryItem(QStringLiteral("pbk"), node.realityOpts->publicKey)
               .addQueryItem(QStringLiteral("sid"), node.realityOpts->shortId);
    } else if (node.tls) {
        builder.addQueryItem(QStringLiteral("security"), QStringLiteral("tls"));
    } else {
        // Trojan links imply TLS unless told otherwise.
        builder.addQueryItem(QStringLiteral("security"), QStringLiteral("none"));
    }

    builder.addOptionalQueryItem(QStringLiteral("sni"), valueOr(node.sni, node.servername))
           .addOptionalQueryItem(QStringLiteral("alpn"), node.alpn.join(QLatin1Char(',')))
           .addOptionalQueryItem(QStringLiteral("fp"), node.clientFingerprint);

    if (node.skipCertVerify) {
        builder.addQueryItem(QStringLiteral("allowInsecure"), QStringLiteral("1"));
    }
    addTransportItems(node, builder);

    return builder.toString();
}

QString LinkBuilder::buildHysteria(const ProxyNode& node)
{
    ShareUriBuilder builder(QStringLiteral("hysteria"));
    builder.setCredentials(node.authStr)
           .setEndpoint(node.server, node.port)
           .setFragment(node.name)
           .addQueryItem(QStringLiteral("protocol"), valueOr(node.protocol, QStringLiteral("udp")))
           .addOptionalQueryItem(QStringLiteral("up"), node.up)
           .addOptionalQueryItem(QStringLiteral("down"), node.down)
           .addOptionalQueryItem(QStringLiteral("sni"), node.sni)
           .addOptionalQueryItem(QStringLiteral("obfs"), node.obfs)
           .addOptionalQueryItem(QStringLiteral("alpn"), node.alpn.join(QLatin1Char(',')));

    if (node.skipCertVerify) {
        builder.addQueryItem(QStringLiteral("insecure"), QStringLiteral("1"));
    }

    return builder.toString();
}

QString LinkBuilder::buildHysteria2(const ProxyNode& node)
{
    ShareUriBuilder builder(QStringLiteral("hysteria2"));
    builder.setCredentials(node.password)
           .setEndpoint(node.server, node.port)
           .setFragment(node.name)
           .addOptionalQueryItem(QStringLiteral("up"), node.up)
           .addOptionalQueryItem(QStringLiteral("down"), node.down)
           .addOptionalQueryItem(QStringLiteral("sni"), node.sni)
           .addOptionalQueryItem(QStringLiteral("obfs"), node.obfs)
           .addOptionalQueryItem(QStringLiteral("obfs-password"), node.obfsPassword)
           .addOptionalQueryItem(QStringLiteral("alpn"), node.alpn.join(QLatin1Char(',')))
           .addOptionalQueryItem(QStringLiteral("ports"), node.ports);

    if (node.skipCertVerify) {
        builder.addQueryItem(QStringLiteral("insecure"), QStringLiteral("1"));
    }

    return builder.toString();
}

QString LinkBuilder::buildTuic(const ProxyNode& node)
{
    ShareUriBuilder builder(QStringLiteral("tuic"));
    builder.setCredentials(node.uuid, node.password)
           .setEndpoint(node.server, node.port)
           .setFragment(node.name)
           .addOptionalQueryItem(QStringLiteral("token"), node.token)
           .addOptionalQueryItem(QStringLiteral("sni"), node.sni)
           .addOptionalQueryItem(QStringLiteral("alpn"), node.alpn.join(QLatin1Char(',')))
           .addOptionalQueryItem(QStringLiteral("udp-relay-mode"), node.udpRelayMode)
           .addOptionalQueryItem(QStringLiteral("congestion-controller"), node.congestionController);

    if (node.skipCertVerify) {
        builder.addQueryItem(QStringLiteral("skip-cert-verify"), QStringLiteral("1"));
    }
    if (node.disableSni) {
        builder.addQueryItem(QStringLiteral("disable-sni"), QStringLiteral("1"));
    }
    if (node.reduceRtt) {
        builder.addQueryItem(QStringLiteral("reduce-rtt"), QStringLiteral("1"));
    }

    return builder.toString();
}

void LinkBuilder::addTransportItems(const ProxyNode& node, ShareUriBuilder& builder)
{
    if (node.network == QStringLiteral("ws") && node.wsOpts) {
        builder.addQueryItem(QStringLiteral("path"), valueOr(node.wsOpts->path, QStringLiteral("/")))
               .addOptionalQueryItem(QStringLiteral("host"), node.wsOpts->headers.value(QStringLiteral("Host")));
    } else if (node.network == QStringLiteral("grpc") && node.grpcOpts) {
        builder.addQueryItem(QStringLiteral("serviceName"), node.grpcOpts->serviceName);
    }
}

QString LinkBuilder::pluginValue(const ProxyNode& node)
{
    QStringList parts {node.plugin};

    if (node.plugin == QStringLiteral("obfs")) {
        const QString mode = valueOr(pluginOptionText(node.pluginOpts.value(QStringLiteral("mode"))),
                                     pluginOptionText(node.pluginOpts.value(QStringLiteral("obfs"))));
        const QString host = valueOr(pluginOptionText(node.pluginOpts.value(QStringLiteral("host"))),
                                     pluginOptionText(node.pluginOpts.value(QStringLiteral("obfs-host"))));
        if (!mode.isEmpty()) {
            parts.append(QStringLiteral("obfs=") + mode);
        }
        if (!host.isEmpty()) {
            parts.append(QStringLiteral("obfs-host=") + host);
        }
    } else {
        for (auto it = node.pluginOpts.cbegin(); it != node.pluginOpts.cend(); ++it) {
            parts.append(it.key() + QLatin1Char('=') + pluginOptionText(it.value()));
        }
    }

    return parts.join(QLatin1Char(';'));
}

} // namespace SubKit
