/*!
 * @file        clisettings.hpp
 * @brief       Runtime settings for the SubKit command-line tool.
 *
 * @details
 * Holds output, logging and validation preferences. Values are layered:
 * built-in defaults, then a `QSettings` store (the user's settings file or
 * an explicit INI file), then `SUBKIT_*` environment variables, and finally
 * command-line options applied by the caller.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_CLISETTINGS_HPP
#define SUBKIT_CLISETTINGS_HPP

#include <QProcessEnvironment>
#include <QSettings>
#include <QString>

namespace SubKit {

/**
 * @struct CliSettings
 * @brief Resolved command-line preferences.
 */
struct CliSettings {
    QString format = QStringLiteral("yaml");     //!< Output format: json, yaml or uri.
    QString logLevel = QStringLiteral("warning"); //!< Minimum log level.
    bool strict = false;                          //!< Drop nodes failing `ProxyNode::isValid()`.

    /**
     * @brief Overlay values stored in a settings object.
     * @param settings Source store (`output/format`, `log/level`, `validation/strict`).
     */
    void load(const QSettings& settings);

    /**
     * @brief Overlay `SUBKIT_FORMAT`, `SUBKIT_LOG_LEVEL` and `SUBKIT_STRICT`.
     * @param environment Process environment.
     */
    void loadEnvironment(const QProcessEnvironment& environment);

    /**
     * @brief Check that every value is one the tool understands.
     * @param errorMessage Optional output message on failure.
     * @return True when the settings are usable.
     */
    bool validate(QString *errorMessage = nullptr) const;

    /**
     * @brief Check an output format name.
     * @param format Format name.
     * @return True for json, yaml and uri.
     */
    static bool isKnownFormat(const QString& format);
};

} // namespace SubKit

#endif // SUBKIT_CLISETTINGS_HPP
