#pragma once

#include "core/shared/scoring_types.h"

#include <QString>

namespace rb {

struct Settings {
    // Database
    QString dbPath;

    // CLI default bot
    QString defaultBotSlug = QStringLiteral("cozy-cafe");

    // Attach score details to results and log per-candidate scores.
    bool debug = false;

    // Parsed keyword specs kept across calls (0 disables caching)
    int keywordCacheEntries = 256;

    ScoringWeights weights;
};

} // namespace rb
