/*!
 * @file        codecerror.hpp
 * @brief       Error reporting types shared by the share-link codec.
 *
 * @details
 * Declares the error kinds produced while decoding share links, encoding
 * proxy nodes and extracting subscription content, together with the
 * out-parameter helper used by every codec entry point.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_CODECERROR_HPP
#define SUBKIT_CODECERROR_HPP

#include <QString>

namespace SubKit {

/**
 * @enum CodecErrorKind
 * @brief Failure categories reported by the codec.
 */
enum class CodecErrorKind
{
    InvalidFormat,       //!< Missing separator, pattern mismatch, malformed base64/JSON.
    UnsupportedProtocol, //!< Unknown scheme token or node type.
    NoProxiesFound       //!< Batch extraction yielded zero nodes.
};

/**
 * @struct CodecError
 * @brief Error kind plus a human-readable message.
 */
struct CodecError {
    CodecErrorKind kind = CodecErrorKind::InvalidFormat; //!< Failure category.
    QString message;                                      //!< Description for logs and users.
};

/**
 * @brief Return the stable name of an error kind.
 * @param kind Error kind.
 * @return Name such as `InvalidFormat`.
 */
inline QString codecErrorKindName(CodecErrorKind kind)
{
    switch (kind) {
    case CodecErrorKind::InvalidFormat:
        return QStringLiteral("InvalidFormat");
    case CodecErrorKind::UnsupportedProtocol:
        return QStringLiteral("UnsupportedProtocol");
    case CodecErrorKind::NoProxiesFound:
        return QStringLiteral("NoProxiesFound");
    }
    return QStringLiteral("Unknown");
}

/**
 * @brief Helper to set consistent codec errors.
 * @param error Optional output pointer.
 * @param kind Failure category.
 * @param message Message value.
 */
inline void setCodecError(CodecError *error, CodecErrorKind kind, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

} // namespace SubKit

#endif // SUBKIT_CODECERROR_HPP
