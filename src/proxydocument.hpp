/*!
 * @file        proxydocument.hpp
 * @brief       Structured routing-client documents holding a proxy list.
 *
 * @details
 * Reads the `proxies` section of a routing-client YAML configuration into
 * canonical nodes and renders canonical nodes back as a `proxies:`
 * document. Other sections are ignored on read and never produced.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_PROXYDOCUMENT_HPP
#define SUBKIT_PROXYDOCUMENT_HPP

#include <QList>
#include <QString>

#include <optional>

#include "codecerror.hpp"
#include "proxynode.hpp"

namespace SubKit {

/**
 * @class ProxyDocument
 * @brief YAML reader/writer for the `proxies` section.
 */
class ProxyDocument
{
public:
    /**
     * @brief Parse the `proxies` list of a YAML document.
     * @details Entries with an unsupported `type` or without a server are skipped.
     * @param content YAML text.
     * @param error Optional output on failure (`NoProxiesFound`).
     * @return Parsed nodes in document order, or empty optional when none survive.
     */
    static std::optional<QList<ProxyNode>> parse(const QString& content, CodecError *error = nullptr);

    /**
     * @brief Render nodes as a YAML document with a single `proxies` key.
     * @param nodes Nodes to render.
     * @return UTF-8 YAML text with 2-space indentation.
     */
    static QString render(const QList<ProxyNode>& nodes);
};

} // namespace SubKit

#endif // SUBKIT_PROXYDOCUMENT_HPP
