#include "core/query/rules_engine.h"
#include "core/shared/logging.h"

namespace rb {

namespace {

std::shared_ptr<KeywordSpecCache> makeCache(int maxEntries)
{
    if (maxEntries <= 0) {
        return nullptr;
    }
    KeywordSpecCacheConfig cacheConfig;
    cacheConfig.maxEntries = maxEntries;
    return std::make_shared<KeywordSpecCache>(cacheConfig);
}

} // namespace

EngineConfig EngineConfig::fromSettings(const Settings& settings)
{
    EngineConfig config;
    config.weights = settings.weights;
    config.debug = settings.debug;
    config.keywordCacheEntries = settings.keywordCacheEntries;
    return config;
}

RulesEngine::RulesEngine(BotStore& store, const EngineConfig& config)
    : m_store(store)
    , m_config(config)
    , m_cache(makeCache(config.keywordCacheEntries))
    , m_selector(Scorer(config.weights, m_cache))
{
}

MatchResult RulesEngine::matchRule(const QString& botSlug, const QString& userMessage)
{
    const std::optional<Bot> bot = m_store.fetchBotBySlug(botSlug);
    if (!bot.has_value()) {
        LOG_INFO(rbMatch, "matchRule: unknown bot '%s'", qUtf8Printable(botSlug));
        MatchResult notFound;
        notFound.answer = QString::fromUtf8(kBotNotFoundAnswer);
        return notFound;
    }

    const std::vector<Candidate> candidates = m_store.fetchCandidates(bot->id);

    MatchOptions options;
    options.includeDebug = m_config.debug;
    options.logCandidateScores = m_config.debug;

    MatchResult result = m_selector.selectBest(*bot, userMessage, candidates, options);
    LOG_DEBUG(rbMatch, "matchRule: bot='%s' matched=%d qna=%lld confidence=%d",
              qUtf8Printable(botSlug), result.matched ? 1 : 0,
              static_cast<long long>(result.candidateId.value_or(0)), result.confidence);
    return result;
}

QString RulesEngine::chatOnce(const QString& botSlug, const QString& userMessage)
{
    return matchRule(botSlug, userMessage).answer;
}

KeywordSpecCache::Stats RulesEngine::keywordCacheStats() const
{
    if (!m_cache) {
        return {};
    }
    return m_cache->stats();
}

} // namespace rb
