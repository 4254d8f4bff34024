/*!
 * @file        shareuri.hpp
 * @brief       Lenient splitter and composer for share-link URIs.
 *
 * @details
 * Share links follow the authority shape
 * `scheme://[user[:pass]@]host[:port][/path][?query][#fragment]` only
 * loosely: userinfo may be raw base64, ports may be missing or garbage
 * and query values may carry unescaped `;`. `ShareUri` splits such text
 * without ever rejecting it over the port, and `ShareUriBuilder` composes
 * the inverse with standard percent-encoding.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_SHAREURI_HPP
#define SUBKIT_SHAREURI_HPP

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QUrlQuery>

#include <optional>

namespace SubKit {

/**
 * @struct ShareUri
 * @brief Components of a split share link.
 */
struct ShareUri {
    QString scheme;           //!< Lower-cased scheme token.
    QString body;             //!< Raw text between `://` and the query/fragment.
    bool hasUserInfo = false; //!< True when the authority carries an `@`.
    QString rawUserInfo;      //!< Userinfo exactly as written.
    QString userInfo;         //!< Percent-decoded userinfo.
    QString user;             //!< Percent-decoded text before the first `:`.
    QString password;         //!< Percent-decoded text after the first `:`.
    QString host;             //!< Host without IPv6 brackets.
    int port = 0;             //!< Parsed port, 0 when missing or unparsable.
    QString path;             //!< Raw path including the leading `/`.
    QString rawQuery;         //!< Query text without `?`.
    QString fragment;         //!< Percent-decoded fragment.

    /**
     * @brief Split a share link.
     * @param uri Input link.
     * @return Components, or empty optional when `://` is missing.
     */
    static std::optional<ShareUri> parse(const QString& uri);

    /**
     * @brief Read a decoded query value by exact key.
     * @param key Query key.
     * @return Value, or empty string when absent.
     */
    QString queryValue(const QString& key) const;

    /**
     * @brief Read the first non-empty value among several keys.
     * @param keys Keys in priority order.
     * @return Value, or empty string when none is set.
     */
    QString firstQueryValue(const QStringList& keys) const;

    /**
     * @brief Check a query flag spelled `1` or `true`.
     * @param key Query key.
     * @return True when the flag is enabled.
     */
    bool queryFlag(const QString& key) const;

    /**
     * @brief Parse a port string of ASCII digits.
     * @param text Port text.
     * @return Port value, or 0 when the text is empty, signed, padded or out of int range.
     */
    static int parsePort(const QString& text);

    /**
     * @brief Percent-decode a component.
     * @param text Encoded text.
     * @return Decoded UTF-8 text.
     */
    static QString decodeComponent(const QString& text);

    /**
     * @brief Percent-encode a component, keeping only unreserved characters.
     * @param text Plain text.
     * @return Encoded text.
     */
    static QString encodeComponent(const QString& text);

    /**
     * @brief Encode a list of query items as `k=v&k=v`.
     * @param items Keys and plain values in output order.
     * @return Encoded query without a leading `?`.
     */
    static QString encodeQuery(const QList<QPair<QString, QString>>& items);

private:
    QUrlQuery m_query;
};

/**
 * @class ShareUriBuilder
 * @brief Composes authority-style share links.
 */
class ShareUriBuilder
{
public:
    explicit ShareUriBuilder(const QString& scheme);

    /**
     * @brief Set userinfo from plain credentials.
     * @param user First slot, percent-encoded on output.
     * @param password Optional second slot, percent-encoded on output.
     * @return Builder reference.
     */
    ShareUriBuilder& setCredentials(const QString& user, const QString& password = QString());

    /**
     * @brief Set userinfo verbatim (already URI-safe text such as base64url).
     * @param userInfo Raw userinfo.
     * @return Builder reference.
     */
    ShareUriBuilder& setRawUserInfo(const QString& userInfo);

    /**
     * @brief Set the endpoint. IPv6 literals are bracketed on output.
     * @param host Server host.
     * @param port Server port.
     * @return Builder reference.
     */
    ShareUriBuilder& setEndpoint(const QString& host, int port);

    /**
     * @brief Append a query item.
     * @param key Query key.
     * @param value Plain value.
     * @return Builder reference.
     */
    ShareUriBuilder& addQueryItem(const QString& key, const QString& value);

    /**
     * @brief Append a query item only when the value is non-empty.
     * @param key Query key.
     * @param value Plain value.
     * @return Builder reference.
     */
    ShareUriBuilder& addOptionalQueryItem(const QString& key, const QString& value);

    /**
     * @brief Set the display-name fragment.
     * @param name Plain display name.
     * @return Builder reference.
     */
    ShareUriBuilder& setFragment(const QString& name);

    /**
     * @brief Compose the link.
     * @return Complete share link.
     */
    QString toString() const;

private:
    QString m_scheme;
    QString m_userInfo;
    QString m_host;
    int m_port = 0;
    QList<QPair<QString, QString>> m_queryItems;
    QString m_fragment;
};

} // namespace SubKit

#endif // SUBKIT_SHAREURI_HPP
