/*!
 * @file        logging.hpp
 * @brief       Logging categories and runtime log configuration.
 *
 * @details
 * Declares the Qt logging categories used by the converter and the CLI
 * and the helper that maps a textual log level onto category filter
 * rules and a message pattern.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_LOGGING_HPP
#define SUBKIT_LOGGING_HPP

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcCodec)
Q_DECLARE_LOGGING_CATEGORY(lcExtractor)
Q_DECLARE_LOGGING_CATEGORY(lcDocument)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

namespace SubKit {

/**
 * @class Logging
 * @brief Applies log level and format for the whole process.
 */
class Logging
{
public:
    /**
     * @brief Check a textual log level.
     * @param level Level name (debug, info, warning, critical).
     * @return True for a known level.
     */
    static bool isKnownLevel(const QString& level);

    /**
     * @brief Enable categories at and above a level and install the message pattern.
     * @param level Level name; unknown names fall back to `info`.
     */
    static void configure(const QString& level);

    /**
     * @brief Build filter rules for a level.
     * @param level Level name.
     * @return Rules string suitable for `QLoggingCategory::setFilterRules()`.
     */
    static QString filterRules(const QString& level);
};

} // namespace SubKit

#endif // SUBKIT_LOGGING_HPP
