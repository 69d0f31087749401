#include "core/ranking/match_selector.h"
#include "core/query/text_normalizer.h"
#include "core/shared/logging.h"

#include <QJsonDocument>

#include <algorithm>
#include <utility>

namespace rb {

MatchSelector::MatchSelector(Scorer scorer)
    : m_scorer(std::move(scorer))
{
}

bool MatchSelector::isMatch(const ScoreDetail& detail) const
{
    return detail.exact
        || detail.keywordHits() > 0
        || detail.similarityRatio >= m_scorer.weights().similarityMatchThreshold;
}

bool MatchSelector::isCanonicalOrder(const std::vector<Candidate>& candidates)
{
    return std::is_sorted(candidates.begin(), candidates.end(),
                          [](const Candidate& a, const Candidate& b) {
                              if (a.priority != b.priority) {
                                  return a.priority > b.priority;
                              }
                              return a.id < b.id;
                          });
}

MatchResult MatchSelector::selectBest(const Bot& bot,
                                      const QString& userMessage,
                                      const std::vector<Candidate>& candidates,
                                      const MatchOptions& options) const
{
    MatchResult result;
    result.answer = bot.fallbackMessage;

    if (candidates.empty()) {
        LOG_DEBUG(rbMatch, "selectBest: bot '%s' has no candidates",
                  qUtf8Printable(bot.slug));
        return result;
    }

    if (!isCanonicalOrder(candidates)) {
        LOG_WARN(rbMatch, "selectBest: candidates for bot '%s' are not ordered by "
                          "priority DESC, id ASC; tie-breaks follow input order",
                 qUtf8Printable(bot.slug));
    }

    const QString userNormalized = TextNormalizer::normalize(userMessage);

    const Candidate* best = nullptr;
    CandidateScore bestScore;
    for (const Candidate& candidate : candidates) {
        CandidateScore scored = m_scorer.computeScore(userNormalized, candidate);
        if (options.logCandidateScores) {
            LOG_DEBUG(rbMatch, "QNA %lld score=%d :: %s :: Q='%s'",
                      static_cast<long long>(candidate.id), scored.score,
                      QJsonDocument(scored.detail.toJson()).toJson(QJsonDocument::Compact)
                          .constData(),
                      qUtf8Printable(candidate.question.left(70)));
        }
        if (best == nullptr || scored.score > bestScore.score) {
            best = &candidate;
            bestScore = std::move(scored);
        }
    }

    result.confidence = std::max(0, bestScore.score);
    if (options.includeDebug) {
        result.debug = bestScore.detail;
    }

    if (!isMatch(bestScore.detail)) {
        LOG_DEBUG(rbMatch, "selectBest: no match for '%s' (best id=%lld score=%d)",
                  qUtf8Printable(userNormalized), static_cast<long long>(best->id),
                  bestScore.score);
        return result;
    }

    result.matched = true;
    result.answer = best->answer;
    result.question = best->question;
    result.candidateId = best->id;
    return result;
}

} // namespace rb
