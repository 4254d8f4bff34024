/*!
 * @file        subscriptionextractor.hpp
 * @brief       Subscription content sniffer and batch node extractor.
 *
 * @details
 * Classifies raw subscription text as either a structured routing-client
 * document or a base64 block of share links and turns it into canonical
 * nodes. Batch decoding is best-effort per line: malformed links are
 * dropped and only an empty result is reported as an error.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_SUBSCRIPTIONEXTRACTOR_HPP
#define SUBKIT_SUBSCRIPTIONEXTRACTOR_HPP

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "codecerror.hpp"
#include "proxynode.hpp"

namespace SubKit {

/**
 * @class SubscriptionExtractor
 * @brief Extracts proxy nodes from subscription payloads.
 */
class SubscriptionExtractor
{
public:
    /**
     * @brief Extract nodes from raw subscription content.
     * @param content Structured YAML, a base64 block of links, or a plain link list.
     * @param error Optional output on failure (`NoProxiesFound`).
     * @return Nodes in input order, or empty optional when none were found.
     */
    static std::optional<QList<ProxyNode>> extract(const QString& content, CodecError *error = nullptr);

    /**
     * @brief Decode a list of share links, dropping the ones that fail.
     * @param uris Share links.
     * @param error Optional output on failure (`NoProxiesFound`).
     * @return Nodes in input order, or empty optional when none decoded.
     */
    static std::optional<QList<ProxyNode>> extractFromUris(const QStringList& uris, CodecError *error = nullptr);

    /**
     * @brief Check for a `proxies:` or `proxy-groups:` marker.
     * @param content Raw content.
     * @return True when the content is a structured document.
     */
    static bool isStructuredConfig(const QString& content);

private:
    /**
     * @brief Decode a whole subscription block, standard alphabet first.
     * @param content Trimmed content.
     * @return Decoded text or empty optional when the block is not base64.
     */
    static std::optional<QString> decodeSubscriptionBlock(const QString& content);

    static std::optional<QList<ProxyNode>> extractFromLines(const QStringList& lines, CodecError *error);
};

} // namespace SubKit

#endif // SUBKIT_SUBSCRIPTIONEXTRACTOR_HPP
