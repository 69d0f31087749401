#include "core/query/text_normalizer.h"

namespace rb {

namespace {

bool isKeptCharacter(QChar ch)
{
    const char16_t code = ch.unicode();
    return (code >= u'a' && code <= u'z') || (code >= u'0' && code <= u'9');
}

} // namespace

QString TextNormalizer::normalize(const QString& raw)
{
    const QString lowered = raw.toLower();

    QString normalized;
    normalized.reserve(lowered.size());

    for (const QChar ch : lowered) {
        if (isKeptCharacter(ch)) {
            normalized.append(ch);
            continue;
        }

        // Punctuation and whitespace both collapse into a single separator
        if (!normalized.isEmpty() && normalized.back() != QLatin1Char(' ')) {
            normalized.append(QLatin1Char(' '));
        }
    }

    if (!normalized.isEmpty() && normalized.back() == QLatin1Char(' ')) {
        normalized.chop(1);
    }
    return normalized;
}

} // namespace rb
