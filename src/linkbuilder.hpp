/*!
 * @file        linkbuilder.hpp
 * @brief       Share-link builder for canonical proxy nodes.
 *
 * @details
 * Declares the inverse of `LinkParser`: it routes a `ProxyNode` by its
 * protocol tag and composes the matching share link. Output keeps
 * server, port, identity, TLS and transport kind stable across a
 * parse/build round trip; query ordering and cosmetics may differ from
 * the link the node originally came from.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_LINKBUILDER_HPP
#define SUBKIT_LINKBUILDER_HPP

#include <QString>

#include <optional>

#include "codecerror.hpp"
#include "proxynode.hpp"

namespace SubKit {

class ShareUriBuilder;

/**
 * @class LinkBuilder
 * @brief Builds share links from canonical proxy nodes.
 */
class LinkBuilder
{
public:
    /**
     * @brief Build a share link for a node.
     * @param node Source node.
     * @param error Optional output on failure (`UnsupportedProtocol`).
     * @return Share link or empty optional.
     */
    static std::optional<QString> build(const ProxyNode& node, CodecError *error = nullptr);

private:
    static QString buildShadowsocks(const ProxyNode& node);
    static QString buildShadowsocksR(const ProxyNode& node);
    static QString buildVmess(const ProxyNode& node);
    static QString buildVless(const ProxyNode& node);
    static QString buildTrojan(const ProxyNode& node);
    static QString buildHysteria(const ProxyNode& node);
    static QString buildHysteria2(const ProxyNode& node);
    static QString buildTuic(const ProxyNode& node);

    /**
     * @brief Emit `path`/`host` or `serviceName` for ws and grpc transports.
     * @param node Source node.
     * @param builder Link under construction.
     */
    static void addTransportItems(const ProxyNode& node, ShareUriBuilder& builder);

    /**
     * @brief Serialize plugin name and options as `name;k=v;k=v`.
     * @param node Source node.
     * @return Plugin value, or the bare name when there are no options.
     */
    static QString pluginValue(const ProxyNode& node);
};

} // namespace SubKit

#endif // SUBKIT_LINKBUILDER_HPP
