#include "core/shared/match_result.h"

#include <QJsonArray>

namespace rb {

QJsonObject ScoreDetail::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("matched_keywords")] = QJsonArray::fromStringList(matchedKeywords);
    json[QStringLiteral("matched_regex")] = QJsonArray::fromStringList(matchedRegex);
    json[QStringLiteral("exact")] = exact;
    json[QStringLiteral("ratio")] = similarityRatio;
    json[QStringLiteral("similarity_points")] = similarityPoints;
    json[QStringLiteral("priority")] = priority;
    return json;
}

QJsonObject MatchResult::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("matched")] = matched;
    json[QStringLiteral("answer")] = answer;
    json[QStringLiteral("question")] = question.has_value() ? QJsonValue(*question)
                                                            : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("qna_id")] = candidateId.has_value()
        ? QJsonValue(static_cast<qint64>(*candidateId))
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("confidence")] = confidence;
    if (debug.has_value()) {
        json[QStringLiteral("debug")] = debug->toJson();
    }
    return json;
}

} // namespace rb
