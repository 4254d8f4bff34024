#include "shareuri.hpp"

#include <QUrl>

namespace SubKit {

std::optional<ShareUri> ShareUri::parse(const QString& uri)
{
    const QString link = uri.trimmed();
    const int separatorIdx = link.indexOf(QStringLiteral("://"));
    if (separatorIdx < 0) {
        return std::nullopt;
    }

    ShareUri result;
    result.scheme = link.left(separatorIdx).toLower();

    QString rest = link.mid(separatorIdx + 3);

    const int fragmentIdx = rest.indexOf(QLatin1Char('#'));
    if (fragmentIdx >= 0) {
        result.fragment = decodeComponent(rest.mid(fragmentIdx + 1));
        rest = rest.left(fragmentIdx);
    }

    const int queryIdx = rest.indexOf(QLatin1Char('?'));
    if (queryIdx >= 0) {
        result.rawQuery = rest.mid(queryIdx + 1);
        rest = rest.left(queryIdx);
    }
    result.body = rest;
    result.m_query = QUrlQuery(result.rawQuery);

    // Raw base64 userinfo may contain '/', so the path starts after the last '@'.
    const int atIdx = rest.lastIndexOf(QLatin1Char('@'));
    const int pathIdx = rest.indexOf(QLatin1Char('/'), atIdx + 1);
    QString authority = rest;
    if (pathIdx >= 0) {
        result.path = rest.mid(pathIdx);
        authority = rest.left(pathIdx);
    }

    QString hostPort = authority;
    if (atIdx >= 0) {
        result.hasUserInfo = true;
        result.rawUserInfo = authority.left(atIdx);
        result.userInfo = decodeComponent(result.rawUserInfo);
        hostPort = authority.mid(atIdx + 1);

        const int colonIdx = result.rawUserInfo.indexOf(QLatin1Char(':'));
        if (colonIdx >= 0) {
            result.user = decodeComponent(result.rawUserInfo.left(colonIdx));
            result.password = decodeComponent(result.rawUserInfo.mid(colonIdx + 1));
        } else {
            result.user = result.userInfo;
        }
    }

    if (hostPort.startsWith(QLatin1Char('['))) {
        const int closeIdx = hostPort.indexOf(QLatin1Char(']'));
        if (closeIdx >= 0) {
            result.host = hostPort.mid(1, closeIdx - 1);
            const QString tail = hostPort.mid(closeIdx + 1);
            if (tail.startsWith(QLatin1Char(':'))) {
                result.port = parsePort(tail.mid(1));
            }
        } else {
            result.host = hostPort.mid(1);
        }
    } else if (hostPort.count(QLatin1Char(':')) == 1) {
        const int colonIdx = hostPort.indexOf(QLatin1Char(':'));
        result.host = hostPort.left(colonIdx);
        result.port = parsePort(hostPort.mid(colonIdx + 1));
    } else {
        result.host = hostPort;
    }

    return result;
}

QString ShareUri::queryValue(const QString& key) const
{
    return m_query.queryItemValue(key, QUrl::FullyDecoded);
}

QString ShareUri::firstQueryValue(const QStringList& keys) const
{
    for (const QString& key : keys) {
        const QString value = queryValue(key);
        if (!value.isEmpty()) {
            return value;
        }
    }
    return {};
}

bool ShareUri::queryFlag(const QString& key) const
{
    const QString value = queryValue(key).trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true");
}

int ShareUri::parsePort(const QString& text)
{
    if (text.isEmpty()) {
        return 0;
    }
    for (const QChar ch : text) {
        if (ch < QLatin1Char('0') || ch > QLatin1Char('9')) {
            return 0;
        }
    }

    bool ok = false;
    const int port = text.toInt(&ok);
    return ok ? port : 0;
}

QString ShareUri::decodeComponent(const QString& text)
{
    return QUrl::fromPercentEncoding(text.toUtf8());
}

QString ShareUri::encodeComponent(const QString& text)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(text));
}

QString ShareUri::encodeQuery(const QList<QPair<QString, QString>>& items)
{
    QStringList parts;
    parts.reserve(items.size());
    for (const auto& item : items) {
        parts.append(encodeComponent(item.first) + QLatin1Char('=') + encodeComponent(item.second));
    }
    return parts.join(QLatin1Char('&'));
}

ShareUriBuilder::ShareUriBuilder(const QString& scheme)
    : m_scheme(scheme)
{
}

ShareUriBuilder& ShareUriBuilder::setCredentials(const QString& user, const QString& password)
{
    m_userInfo = ShareUri::encodeComponent(user);
    if (!password.isEmpty()) {
        m_userInfo += QLatin1Char(':') + ShareUri::encodeComponent(password);
    }
    return *this;
}

ShareUriBuilder& ShareUriBuilder::setRawUserInfo(const QString& userInfo)
{
    m_userInfo = userInfo;
    return *this;
}

ShareUriBuilder& ShareUriBuilder::setEndpoint(const QString& host, int port)
{
    m_host = host;
    m_port = port;
    return *this;
}

ShareUriBuilder& ShareUriBuilder::addQueryItem(const QString& key, const QString& value)
{
    m_queryItems.append(qMakePair(key, value));
    return *this;
}

ShareUriBuilder& ShareUriBuilder::addOptionalQueryItem(const QString& key, const QString& value)
{
    if (!value.isEmpty()) {
        m_queryItems.append(qMakePair(key, value));
    }
    return *this;
}

ShareUriBuilder& ShareUriBuilder::setFragment(const QString& name)
{
    m_fragment = name;
    return *this;
}

QString ShareUriBuilder::toString() const
{
    QString link = m_scheme + QStringLiteral("://");
    if (!m_userInfo.isEmpty()) {
        link += m_userInfo + QLatin1Char('@');
    }

    if (m_host.contains(QLatin1Char(':'))) {
        link += QLatin1Char('[') + m_host + QLatin1Char(']');
    } else {
        link += m_host;
    }
    link += QLatin1Char(':') + QString::number(m_port);

    if (!m_queryItems.isEmpty()) {
        link += QLatin1Char('?') + ShareUri::encodeQuery(m_queryItems);
    }

    link += QLatin1Char('#') + ShareUri::encodeComponent(m_fragment.isEmpty() ? m_scheme : m_fragment);
    return link;
}

} // namespace SubKit
