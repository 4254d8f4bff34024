/*!
 * @file        linkparser.hpp
 * @brief       Parser interface for proxy share links.
 *
 * @details
 * Declares the scheme-sniffing entry point that turns ss, ssr, vmess,
 * vless, trojan, hysteria, hysteria2 (also `hy2`) and tuic share links into
 * canonical `ProxyNode` records, plus the per-protocol decoders behind it.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_LINKPARSER_HPP
#define SUBKIT_LINKPARSER_HPP

#include <QString>

#include <optional>

#include "codecerror.hpp"
#include "proxynode.hpp"

namespace SubKit {

struct ShareUri;

/**
 * @class LinkParser
 * @brief Parses share links into canonical proxy nodes.
 *
 * @details
 * Decoding is pure: no I/O and no shared state. A missing or unparsable
 * port never fails a link; it decodes as 0 and is left to `isValid()`.
 */
class LinkParser
{
public:
    /**
     * @brief Parse a raw share link.
     * @param rawLink Input link string.
     * @param error Optional output on failure (`InvalidFormat`, `UnsupportedProtocol`).
     * @return Parsed node or empty optional.
     */
    static std::optional<ProxyNode> parse(const QString& rawLink, CodecError *error = nullptr);

private:
    static std::optional<ProxyNode> parseShadowsocks(const ShareUri& uri, CodecError *error);
    static std::optional<ProxyNode> parseShadowsocksR(const ShareUri& uri, CodecError *error);

    /**
     * @brief Parse a VMess link payload (base64 JSON).
     * @param uri Split link.
     * @param error Optional output on failure.
     * @return Parsed node or empty optional.
     */
    static std::optional<ProxyNode> parseVmess(const ShareUri& uri, CodecError *error);

    static std::optional<ProxyNode> parseVless(const ShareUri& uri, CodecError *error);
    static std::optional<ProxyNode> parseTrojan(const ShareUri& uri, CodecError *error);
    static std::optional<ProxyNode> parseHysteria(const ShareUri& uri, CodecError *error);
    static std::optional<ProxyNode> parseHysteria2(const ShareUri& uri, CodecError *error);

    /**
     * @brief Parse a TUIC link.
     * @details A UUID-shaped user slot selects v5 credentials; anything else
     * is treated as a v4 token.
     * @param uri Split link.
     * @param error Optional output on failure.
     * @return Parsed node or empty optional.
     */
    static std::optional<ProxyNode> parseTuic(const ShareUri& uri, CodecError *error);

    /**
     * @brief Fill ws/grpc option blocks from `type`, `path`, `host` and `serviceName`.
     * @param uri Split link.
     * @param node Node to update.
     */
    static void applyTransportOptions(const ShareUri& uri, ProxyNode& node);
};

} // namespace SubKit

#endif // SUBKIT_LINKPARSER_HPP
