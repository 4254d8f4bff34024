#include "proxynode.hpp"

#include <QJsonValue>

#include <string>

namespace SubKit {

namespace {
YAML::Node variantToYaml(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return YAML::Node(value.toBool());
    case QMetaType::Int:
    case QMetaType::LongLong:
        return YAML::Node(value.toLongLong());
    case QMetaType::Double:
        return YAML::Node(value.toDouble());
    case QMetaType::QStringList:
    case QMetaType::QVariantList: {
        YAML::Node sequence(YAML::NodeType::Sequence);
        const QVariantList items = value.toList();
        for (const QVariant& item : items) {
            sequence.push_back(variantToYaml(item));
        }
        return sequence;
    }
    case QMetaType::QVariantMap: {
        YAML::Node mapping(YAML::NodeType::Map);
        const QVariantMap map = value.toMap();
        for (auto it = map.cbegin(); it != map.cend(); ++it) {
            mapping[it.key().toStdString()] = variantToYaml(it.value());
        }
        return mapping;
    }
    default:
        return YAML::Node(value.toString().toStdString());
    }
}

QVariant yamlToVariant(const YAML::Node& node)
{
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return QString::fromStdString(node.Scalar());
    case YAML::NodeType::Sequence: {
        QVariantList list;
        for (const auto& item : node) {
            list.append(yamlToVariant(item));
        }
        return list;
    }
    case YAML::NodeType::Map: {
        QVariantMap map;
        for (auto it = node.begin(); it != node.end(); ++it) {
            map.insert(QString::fromStdString(it->first.Scalar()), yamlToVariant(it->second));
        }
        return map;
    }
    default:
        return {};
    }
}

QString readString(const QVariantMap& map, const QString& key)
{
    const QVariant value = map.value(key);
    if (!value.isValid() || value.typeId() == QMetaType::QVariantMap || value.typeId() == QMetaType::QVariantList) {
        return {};
    }
    return value.toString().trimmed();
}

int readInt(const QVariantMap& map, const QString& key)
{
    bool ok = false;
    const int value = map.value(key).toInt(&ok);
    if (ok) {
        return value;
    }
    const int parsed = readString(map, key).toInt(&ok);
    return ok ? parsed : 0;
}

bool readBool(const QVariantMap& map, const QString& key)
{
    const QString text = readString(map, key).toLower();
    return text == QStringLiteral("true") || text == QStringLiteral("1");
}

QStringList readStringList(const QVariantMap& map, const QString& key)
{
    QStringList list;
    const QVariant value = map.value(key);
    if (value.typeId() == QMetaType::QVariantList || value.typeId() == QMetaType::QStringList) {
        const QVariantList items = value.toList();
        for (const QVariant& item : items) {
            const QString text = item.toString().trimmed();
            if (!text.isEmpty()) {
                list.append(text);
            }
        }
        return list;
    }

    // Some producers write a comma-separated scalar.
    const QString text = readString(map, key);
    for (const QString& part : text.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        list.append(part.trimmed());
    }
    return list;
}
}

const QStringList& ProxyNode::supportedTypes()
{
    static const QStringList types {
        QStringLiteral("ss"),
        QStringLiteral("ssr"),
        QStringLiteral("vmess"),
        QStringLiteral("vless"),
        QStringLiteral("trojan"),
        QStringLiteral("hysteria"),
        QStringLiteral("hysteria2"),
        QStringLiteral("tuic")
    };
    return types;
}

bool ProxyNode::isSupportedType(const QString& type)
{
    return supportedTypes().contains(type.trimmed().toLower());
}

bool ProxyNode::isValid() const
{
    return isSupportedType(type)
       && !server.trimmed().isEmpty()
       && port > 0
       && port <= 65535;
}

QString ProxyNode::displayLabel() const
{
    if (!name.trimmed().isEmpty()) {
        return name.trimmed();
    }

    return QStringLiteral("%1:%2 (%3)")
        .arg(server.trimmed(), QString::number(port), type.toUpper());
}

QList<QPair<QString, QVariant>> ProxyNode::orderedFields() const
{
    QList<QPair<QString, QVariant>> fields;
    fields.append({QStringLiteral("name"), name});
    fields.append({QStringLiteral("type"), type});
    fields.append({QStringLiteral("server"), server});
    fields.append({QStringLiteral("port"), port});

    const auto addString = [&fields](const QString& key, const QString& value) {
        if (!value.isEmpty()) {
            fields.append({key, value});
        }
    };
    const auto addBool = [&fields](const QString& key, bool value) {
        if (value) {
            fields.append({key, true});
        }
    };

    addString(QStringLiteral("uuid"), uuid);
    addString(QStringLiteral("password"), password);
    addString(QStringLiteral("cipher"), cipher);
    if (alterId != 0) {
        fields.append({QStringLiteral("alterId"), alterId});
    }
    addString(QStringLiteral("network"), network);
    addBool(QStringLiteral("tls"), tls);
    addString(QStringLiteral("sni"), sni);
    addString(QStringLiteral("servername"), servername);
    addString(QStringLiteral("flow"), flow);
    addString(QStringLiteral("encryption"), encryption);
    addString(QStringLiteral("client-fingerprint"), clientFingerprint);
    addString(QStringLiteral("plugin"), plugin);
    if (!pluginOpts.isEmpty()) {
        fields.append({QStringLiteral("plugin-opts"), pluginOpts});
    }
    addString(QStringLiteral("protocol"), protocol);
    addString(QStringLiteral("obfs"), obfs);
    addString(QStringLiteral("obfs-param"), obfsParam);
    addString(QStringLiteral("protocol-param"), protocolParam);
    addString(QStringLiteral("auth-str"), authStr);
    addString(QStringLiteral("up"), up);
    addString(QStringLiteral("down"), down);
    addString(QStringLiteral("obfs-password"), obfsPassword);
    addBool(QStringLiteral("skip-cert-verify"), skipCertVerify);
    if (!alpn.isEmpty()) {
        fields.append({QStringLiteral("alpn"), alpn});
    }

    if (wsOpts) {
        QVariantMap ws {{QStringLiteral("path"), wsOpts->path}};
        if (!wsOpts->headers.isEmpty()) {
            QVariantMap headers;
            for (auto it = wsOpts->headers.cbegin(); it != wsOpts->headers.cend(); ++it) {
                headers.insert(it.key(), it.value());
            }
            ws.insert(QStringLiteral("headers"), headers);
        }
        fields.append({QStringLiteral("ws-opts"), ws});
    }
    if (grpcOpts) {
        fields.append({QStringLiteral("grpc-opts"), QVariantMap {
            {QStringLiteral("grpc-service-name"), grpcOpts->serviceName}
        }});
    }
    if (realityOpts) {
        fields.append({QStringLiteral("reality-opts"), QVariantMap {
            {QStringLiteral("public-key"), realityOpts->publicKey},
            {QStringLiteral("short-id"), realityOpts->shortId}
        }});
    }

    addString(QStringLiteral("token"), token);
    addBool(QStringLiteral("disable-sni"), disableSni);
    addBool(QStringLiteral("reduce-rtt"), reduceRtt);
    addString(QStringLiteral("udp-relay-mode"), udpRelayMode);
    addString(QStringLiteral("congestion-controller"), congestionController);
    addString(QStringLiteral("ports"), ports);

    return fields;
}

QJsonObject ProxyNode::toJson() const
{
    QJsonObject json;
    const QList<QPair<QString, QVariant>> fields = orderedFields();
    for (const auto& field : fields) {
        json.insert(field.first, QJsonValue::fromVariant(field.second));
    }
    return json;
}

std::optional<ProxyNode> ProxyNode::fromJson(const QJsonObject& json, CodecError *error)
{
    return fromVariantMap(json.toVariantMap(), error);
}

YAML::Node ProxyNode::toYaml() const
{
    YAML::Node yaml(YAML::NodeType::Map);
    const QList<QPair<QString, QVariant>> fields = orderedFields();
    for (const auto& field : fields) {
        yaml[field.first.toStdString()] = variantToYaml(field.second);
    }
    return yaml;
}

std::optional<ProxyNode> ProxyNode::fromYaml(const YAML::Node& yaml, CodecError *error)
{
    if (!yaml.IsMap()) {
        setCodecError(error, CodecErrorKind::InvalidFormat, QStringLiteral("Proxy entry is not a mapping."));
        return std::nullopt;
    }
    return fromVariantMap(yamlToVariant(yaml).toMap(), error);
}

std::optional<ProxyNode> ProxyNode::fromVariantMap(const QVariantMap& map, CodecError *error)
{
    ProxyNode node;
    node.type = readString(map, QStringLiteral("type")).toLower();
    if (!isSupportedType(node.type)) {
        setCodecError(error, CodecErrorKind::UnsupportedProtocol,
                      QStringLiteral("Unsupported node type: %1").arg(node.type));
        return std::nullopt;
    }

    node.name = readString(map, QStringLiteral("name"));
    node.server = readString(map, QStringLiteral("server"));
    node.port = readInt(map, QStringLiteral("port"));

    node.uuid = readString(map, QStringLiteral("uuid"));
    node.password = readString(map, QStringLiteral("password"));
    node.cipher = readString(map, QStringLiteral("cipher"));
    node.alterId = readInt(map, QStringLiteral("alterId"));
    node.network = readString(map, QStringLiteral("network")).toLower();
    node.tls = readBool(map, QStringLiteral("tls"));
    node.sni = readString(map, QStringLiteral("sni"));
    node.servername = readString(map, QStringLiteral("servername"));
    node.flow = readString(map, QStringLiteral("flow"));
    node.encryption = readString(map, QStringLiteral("encryption"));
    node.clientFingerprint = readString(map, QStringLiteral("client-fingerprint"));

    node.plugin = readString(map, QStringLiteral("plugin"));
    node.pluginOpts = map.value(QStringLiteral("plugin-opts")).toMap();
    node.protocol = readString(map, QStringLiteral("protocol"));
    node.obfs = readString(map, QStringLiteral("obfs"));
    node.obfsParam = readString(map, QStringLiteral("obfs-param"));
    node.protocolParam = readString(map, QStringLiteral("protocol-param"));
    node.authStr = readString(map, QStringLiteral("auth-str"));
    node.up = readString(map, QStringLiteral("up"));
    node.down = readString(map, QStringLiteral("down"));
    node.obfsPassword = readString(map, QStringLiteral("obfs-password"));
    node.skipCertVerify = readBool(map, QStringLiteral("skip-cert-verify"));
    node.alpn = readStringList(map, QStringLiteral("alpn"));

    if (map.contains(QStringLiteral("ws-opts"))) {
        const QVariantMap ws = map.value(QStringLiteral("ws-opts")).toMap();
        WsOptions options;
        options.path = readString(ws, QStringLiteral("path"));
        const QVariantMap headers = ws.value(QStringLiteral("headers")).toMap();
        for (auto it = headers.cbegin(); it != headers.cend(); ++it) {
            options.headers.insert(it.key(), it.value().toString());
        }
        node.wsOpts = options;
    }
    if (map.contains(QStringLiteral("grpc-opts"))) {
        const QVariantMap grpc = map.value(QStringLiteral("grpc-opts")).toMap();
        node.grpcOpts = GrpcOptions {readString(grpc, QStringLiteral("grpc-service-name"))};
    }
    if (map.contains(QStringLiteral("reality-opts"))) {
        const QVariantMap reality = map.value(QStringLiteral("reality-opts")).toMap();
        node.realityOpts = RealityOptions {
            readString(reality, QStringLiteral("public-key")),
            readString(reality, QStringLiteral("short-id"))
        };
        node.tls = true;
    }

    node.token = readString(map, QStringLiteral("token"));
    node.disableSni = readBool(map, QStringLiteral("disable-sni"));
    node.reduceRtt = readBool(map, QStringLiteral("reduce-rtt"));
    node.udpRelayMode = readString(map, QStringLiteral("udp-relay-mode"));
    node.congestionController = readString(map, QStringLiteral("congestion-controller"));
    node.ports = readString(map, QStringLiteral("ports"));

    if (node.server.isEmpty()) {
        setCodecError(error, CodecErrorKind::InvalidFormat,
                      QStringLiteral("Node \"%1\" is missing a server.").arg(node.name));
        return std::nullopt;
    }

    return node;
}

} // namespace SubKit
