#include "proxydocument.hpp"

#include <yaml-cpp/yaml.h>

#include "logging.hpp"

namespace SubKit {

std::optional<QList<ProxyNode>> ProxyDocument::parse(const QString& content, CodecError *error)
{
    YAML::Node root;
    try {
        root = YAML::Load(content.toStdString());
    } catch (const YAML::Exception& e) {
        qCWarning(lcDocument) << "YAML parse error:" << e.what();
        setCodecError(error, CodecErrorKind::NoProxiesFound,
                      QStringLiteral("Structured config could not be parsed: %1").arg(QString::fromStdString(e.what())));
        return std::nullopt;
    }

    const YAML::Node proxies = root.IsMap() ? root["proxies"] : YAML::Node();
    if (!proxies || !proxies.IsSequence() || proxies.size() == 0) {
        setCodecError(error, CodecErrorKind::NoProxiesFound, QStringLiteral("No proxies found in structured config."));
        return std::nullopt;
    }

    QList<ProxyNode> nodes;
    int index = 0;
    for (const auto& entry : proxies) {
        ++index;
        CodecError entryError;
        const std::optional<ProxyNode> node = ProxyNode::fromYaml(entry, &entryError);
        if (!node) {
            qCWarning(lcDocument) << "Skipping proxy entry" << index << ":" << entryError.message;
            continue;
        }
        nodes.append(*node);
    }

    if (nodes.isEmpty()) {
        setCodecError(error, CodecErrorKind::NoProxiesFound, QStringLiteral("No supported proxies found in structured config."));
        return std::nullopt;
    }

    qCInfo(lcDocument) << "Parsed" << nodes.size() << "nodes from structured config";
    return nodes;
}

QString ProxyDocument::render(const QList<ProxyNode>& nodes)
{
    YAML::Node proxies(YAML::NodeType::Sequence);
    for (const ProxyNode& node : nodes) {
        proxies.push_back(node.toYaml());
    }

    YAML::Node root(YAML::NodeType::Map);
    root["proxies"] = proxies;

    YAML::Emitter out;
    out.SetIndent(2);
    out << root;

    return QString::fromUtf8(out.c_str()) + QLatin1Char('\n');
}

} // namespace SubKit
