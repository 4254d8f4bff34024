#include "base64.hpp"

namespace SubKit {

QString Base64::encode(const QByteArray& data, Alphabet alphabet, Padding padding)
{
    QByteArray::Base64Options options = alphabet == Alphabet::UrlSafe
        ? QByteArray::Base64UrlEncoding
        : QByteArray::Base64Encoding;
    if (padding == Padding::Unpadded) {
        options |= QByteArray::OmitTrailingEquals;
    }

    return QString::fromLatin1(data.toBase64(options));
}

std::optional<QByteArray> Base64::decode(const QString& text, Alphabet alphabet)
{
    const std::optional<QByteArray> raw = normalize(text);
    if (!raw) {
        return std::nullopt;
    }

    QByteArray::Base64Options options = alphabet == Alphabet::UrlSafe
        ? QByteArray::Base64UrlEncoding
        : QByteArray::Base64Encoding;
    options |= QByteArray::AbortOnBase64DecodingErrors;

    const QByteArray::FromBase64Result result = QByteArray::fromBase64Encoding(*raw, options);
    if (result.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
        return std::nullopt;
    }

    return result.decoded;
}

std::optional<QByteArray> Base64::decodeFlexible(const QString& text)
{
    QString unified = text.trimmed();
    unified.replace(QLatin1Char('-'), QLatin1Char('+'));
    unified.replace(QLatin1Char('_'), QLatin1Char('/'));

    return decode(unified, Alphabet::Standard);
}

std::optional<QByteArray> Base64::normalize(const QString& text)
{
    QByteArray raw = text.toLatin1();
    raw.replace('\r', QByteArray());
    raw.replace('\n', QByteArray());

    while (raw.endsWith('=')) {
        raw.chop(1);
    }

    // A single dangling symbol carries fewer than eight bits.
    const qsizetype remainder = raw.size() % 4;
    if (remainder == 1) {
        return std::nullopt;
    }
    if (remainder > 0) {
        raw.append(QByteArray(4 - remainder, '='));
    }

    return raw;
}

} // namespace SubKit
