/*!
 * @file        fieldreader.hpp
 * @brief       Tolerant typed accessors over loosely-typed JSON payloads.
 *
 * @details
 * Share-link producers disagree on JSON value types: ports and alter ids
 * arrive as numbers, floats or numeric strings. `FieldReader` reads a
 * `QJsonObject` key by key and coerces values instead of rejecting the
 * payload.
 *
 * @author      Kambiz Asadzadeh
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef SUBKIT_FIELDREADER_HPP
#define SUBKIT_FIELDREADER_HPP

#include <QJsonObject>
#include <QString>

namespace SubKit {

/**
 * @class FieldReader
 * @brief Reads string and integer fields from a generic key-value object.
 */
class FieldReader
{
public:
    explicit FieldReader(const QJsonObject& object);

    /**
     * @brief Read a string field.
     * @param key Field name.
     * @param fallback Value used when the key is absent or not scalar.
     * @return Field value; numbers and booleans are rendered as text.
     */
    QString stringValue(const QString& key, const QString& fallback = QString()) const;

    /**
     * @brief Read an integer field.
     * @param key Field name.
     * @param fallback Value used when the key is absent or not numeric.
     * @return Field value; floats are truncated, numeric strings are parsed.
     */
    int intValue(const QString& key, int fallback = 0) const;

private:
    QJsonObject m_object;
};

} // namespace SubKit

#endif // SUBKIT_FIELDREADER_HPP
