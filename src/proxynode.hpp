/*!
 * @file        proxynode.hpp
 * @brief       Canonical proxy node data model for SubKit.
 *
 * @details
 * Defines the `ProxyNode` value type shared by all supported share-link
 * protocols. The record is flat and its fields map one-to-one to
 * the `proxies` entries of the routing-client YAML schema, including the
 * hyphenated keys that schema uses. JSON and YAML mapping helpers live
 * here as well.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_PROXYNODE_HPP
#define SUBKIT_PROXYNODE_HPP

#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

#include <yaml-cpp/yaml.h>

#include <optional>

#include "codecerror.hpp"

namespace SubKit {

/**
 * @struct WsOptions
 * @brief WebSocket transport options (`ws-opts`).
 */
struct WsOptions {
    QString path;                    //!< Request path.
    QMap<QString, QString> headers;  //!< Extra request headers, usually `Host`.

    bool operator==(const WsOptions& other) const = default;
};

/**
 * @struct GrpcOptions
 * @brief gRPC transport options (`grpc-opts`).
 */
struct GrpcOptions {
    QString serviceName; //!< `grpc-service-name`.

    bool operator==(const GrpcOptions& other) const = default;
};

/**
 * @struct RealityOptions
 * @brief REALITY camouflage options (`reality-opts`).
 */
struct RealityOptions {
    QString publicKey; //!< `public-key`.
    QString shortId;   //!< `short-id`.

    bool operator==(const RealityOptions& other) const = default;
};

/**
 * @struct ProxyNode
 * @brief Canonical proxy endpoint used across the converter.
 *
 * @details
 * Optional values are absent when empty (`QString()`, `false`, `0`, empty
 * list or disengaged option block) and are left out of every structured
 * serialization.
 */
struct ProxyNode {
    QString name;                    //!< Display name.
    QString type;                    //!< Protocol tag (ss, ssr, vmess, ...).
    QString server;                  //!< Remote host or IP address.
    int port = 0;                    //!< Remote port, 0 when unknown.

    QString uuid;                    //!< User UUID (vmess/vless/tuic).
    QString password;                //!< Password (ss/ssr/trojan/hysteria2/tuic).
    QString cipher;                  //!< Cipher or vmess security.
    int alterId = 0;                 //!< VMess alter id.
    QString network;                 //!< Transport network (tcp/ws/grpc/...).
    bool tls = false;                //!< TLS enabled.
    QString sni;                     //!< `sni` key (trojan/hysteria/tuic).
    QString servername;              //!< `servername` key (vmess/vless).
    QString flow;                    //!< XTLS flow.
    QString encryption;              //!< VLESS encryption.
    QString clientFingerprint;       //!< uTLS fingerprint hint.

    QString plugin;                  //!< Shadowsocks plugin name.
    QVariantMap pluginOpts;          //!< Shadowsocks plugin options.
    QString protocol;                //!< SSR protocol or hysteria transport protocol.
    QString obfs;                    //!< Obfuscation mode.
    QString obfsParam;               //!< SSR obfs parameter.
    QString protocolParam;           //!< SSR protocol parameter.
    QString authStr;                 //!< Hysteria v1 auth string.
    QString up;                      //!< Upload bandwidth hint.
    QString down;                    //!< Download bandwidth hint.
    QString obfsPassword;            //!< Hysteria2 obfuscation password.
    bool skipCertVerify = false;     //!< Skip certificate verification.
    QStringList alpn;                //!< ALPN list.

    std::optional<WsOptions> wsOpts;           //!< WebSocket options.
    std::optional<GrpcOptions> grpcOpts;       //!< gRPC options.
    std::optional<RealityOptions> realityOpts; //!< REALITY options; implies `tls`.

    QString token;                   //!< TUIC v4 token.
    bool disableSni = false;         //!< TUIC disable SNI.
    bool reduceRtt = false;          //!< TUIC 0-RTT.
    QString udpRelayMode;            //!< TUIC UDP relay mode.
    QString congestionController;    //!< TUIC congestion controller.
    QString ports;                   //!< Hysteria2 port-hopping range.

    bool operator==(const ProxyNode& other) const = default;

    /**
     * @brief Protocol tags the codec understands.
     * @return List of lower-case tags.
     */
    static const QStringList& supportedTypes();

    /**
     * @brief Check whether a tag is one of the supported protocols.
     * @param type Protocol tag, compared case-insensitively.
     * @return True for supported tags.
     */
    static bool isSupportedType(const QString& type);

    /**
     * @brief Validate essential endpoint fields.
     * @return True when the tag is supported, server is set and port is 1..65535.
     */
    bool isValid() const;

    /**
     * @brief Build a compact label for listings.
     * @return Display-ready node label.
     */
    QString displayLabel() const;

    /**
     * @brief Serialize the node into JSON using routing-client key names.
     * @return JSON object without absent fields.
     */
    QJsonObject toJson() const;

    /**
     * @brief Deserialize a node from JSON.
     * @param json Source object.
     * @param error Optional output on failure.
     * @return Parsed node or empty optional on unsupported type or missing server.
     */
    static std::optional<ProxyNode> fromJson(const QJsonObject& json, CodecError *error = nullptr);

    /**
     * @brief Serialize the node into a YAML mapping using routing-client key names.
     * @return YAML map without absent fields.
     */
    YAML::Node toYaml() const;

    /**
     * @brief Deserialize a node from a YAML mapping.
     * @param yaml Source mapping.
     * @param error Optional output on failure.
     * @return Parsed node or empty optional on unsupported type or missing server.
     */
    static std::optional<ProxyNode> fromYaml(const YAML::Node& yaml, CodecError *error = nullptr);

private:
    QList<QPair<QString, QVariant>> orderedFields() const;
    static std::optional<ProxyNode> fromVariantMap(const QVariantMap& map, CodecError *error);
};

} // namespace SubKit

#endif // SUBKIT_PROXYNODE_HPP
