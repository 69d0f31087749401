#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

namespace rb {

// Per-candidate scoring breakdown, kept for transparency/debugging.
struct ScoreDetail {
    QStringList matchedKeywords;
    QStringList matchedRegex;   // pattern text, in spec order
    bool exact = false;
    double similarityRatio = 0.0;
    int similarityPoints = 0;
    int priority = 0;

    int keywordHits() const
    {
        return static_cast<int>(matchedKeywords.size() + matchedRegex.size());
    }

    QJsonObject toJson() const;
};

struct MatchResult {
    bool matched = false;
    QString answer;
    std::optional<QString> question;
    std::optional<int64_t> candidateId;
    int confidence = 0;                 // never negative
    std::optional<ScoreDetail> debug;   // only when explicitly requested

    QJsonObject toJson() const;
};

} // namespace rb
