#pragma once

#include "core/index/bot_store.h"
#include "core/query/keyword_spec_cache.h"
#include "core/ranking/match_selector.h"
#include "core/shared/match_result.h"
#include "core/shared/scoring_types.h"
#include "core/shared/settings.h"

#include <QString>
#include <memory>

namespace rb {

// Answer returned when the requested bot does not exist.
constexpr const char* kBotNotFoundAnswer = "Bot not found.";

struct EngineConfig {
    ScoringWeights weights;

    // Attach the winning ScoreDetail to every result and log each
    // candidate's score. Never changes which candidate wins.
    bool debug = false;

    int keywordCacheEntries = 256;   // 0 parses keyword specs on every call

    static EngineConfig fromSettings(const Settings& settings);
};

// RulesEngine -- resolves a bot through the store and matches a message
// against its Q&A records.
class RulesEngine {
public:
    explicit RulesEngine(BotStore& store, const EngineConfig& config = {});

    MatchResult matchRule(const QString& botSlug, const QString& userMessage);

    // Answer text only; the fallback message when nothing matched.
    QString chatOnce(const QString& botSlug, const QString& userMessage);

    const EngineConfig& config() const { return m_config; }

    // Zeroed when caching is disabled.
    KeywordSpecCache::Stats keywordCacheStats() const;

private:
    BotStore& m_store;
    EngineConfig m_config;
    std::shared_ptr<KeywordSpecCache> m_cache;
    MatchSelector m_selector;
};

} // namespace rb
