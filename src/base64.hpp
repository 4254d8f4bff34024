/*!
 * @file        base64.hpp
 * @brief       Base64 helpers for share-link payloads.
 *
 * @details
 * Share links embed near-binary payloads (credentials, JSON documents,
 * whole subscription blocks) in base64. Producers disagree on alphabet
 * and padding, so decoding is available both per alphabet and in a
 * flexible mode that accepts any mix.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_BASE64_HPP
#define SUBKIT_BASE64_HPP

#include <QByteArray>
#include <QString>

#include <optional>

namespace SubKit {

/**
 * @class Base64
 * @brief Encodes and decodes the base64 flavours found in share links.
 */
class Base64
{
public:
    /**
     * @enum Alphabet
     * @brief Character set used for the 62nd/63rd symbols.
     */
    enum class Alphabet
    {
        Standard, //!< `+` and `/`.
        UrlSafe   //!< `-` and `_`.
    };

    /**
     * @enum Padding
     * @brief Trailing `=` policy when encoding.
     */
    enum class Padding
    {
        Padded,  //!< Keep trailing `=`.
        Unpadded //!< Omit trailing `=`.
    };

    /**
     * @brief Encode raw bytes.
     * @param data Input bytes.
     * @param alphabet Output alphabet.
     * @param padding Trailing padding policy.
     * @return Encoded text.
     */
    static QString encode(const QByteArray& data, Alphabet alphabet, Padding padding);

    /**
     * @brief Strictly decode text in a single alphabet.
     * @param text Encoded input. Line breaks are ignored and padding is optional.
     * @param alphabet Expected alphabet; symbols of the other alphabet are rejected.
     * @return Decoded bytes or empty optional on malformed input.
     */
    static std::optional<QByteArray> decode(const QString& text, Alphabet alphabet);

    /**
     * @brief Decode URL-safe or standard base64 text, padded or not.
     * @param text Encoded input.
     * @return Decoded bytes or empty optional on malformed input.
     */
    static std::optional<QByteArray> decodeFlexible(const QString& text);

private:
    /**
     * @brief Strip line breaks and restore canonical padding.
     * @param text Encoded input.
     * @return Normalized bytes or empty optional when the length is impossible.
     */
    static std::optional<QByteArray> normalize(const QString& text);
};

} // namespace SubKit

#endif // SUBKIT_BASE64_HPP
