#include "fieldreader.hpp"

#include <QJsonValue>

#include <cmath>
#include <limits>

namespace SubKit {

FieldReader::FieldReader(const QJsonObject& object)
    : m_object(object)
{
}

QString FieldReader::stringValue(const QString& key, const QString& fallback) const
{
    const QJsonValue value = m_object.value(key);
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Double: {
        const double number = value.toDouble();
        if (std::trunc(number) == number && std::abs(number) < 1e15) {
            return QString::number(static_cast<qint64>(number));
        }
        return QString::number(number);
    }
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    default:
        return fallback;
    }
}

int FieldReader::intValue(const QString& key, int fallback) const
{
    const QJsonValue value = m_object.value(key);
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (!std::isfinite(number)
            || number > std::numeric_limits<int>::max()
            || number < std::numeric_limits<int>::min()) {
            return fallback;
        }
        return static_cast<int>(number);
    }

    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        return ok ? parsed : fallback;
    }

    return fallback;
}

} // namespace SubKit
