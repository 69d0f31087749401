#include "core/ranking/scorer.h"
#include "core/query/text_normalizer.h"
#include "core/ranking/sequence_matcher.h"
#include "core/shared/logging.h"

#include <cmath>
#include <utility>

namespace rb {

Scorer::Scorer(const ScoringWeights& weights, std::shared_ptr<KeywordSpecCache> cache)
    : m_weights(weights)
    , m_cache(std::move(cache))
{
}

int Scorer::computeSimilarityPoints(double ratio) const
{
    // nearbyint honours the default FE_TONEAREST mode: halves go to even
    return static_cast<int>(std::nearbyint(m_weights.similarityWeight * ratio));
}

int Scorer::computePriorityPoints(int priority) const
{
    return priority * m_weights.priorityWeight;
}

std::shared_ptr<const ParsedKeywordSpec> Scorer::keywordSpecFor(const Candidate& candidate) const
{
    if (m_cache) {
        return m_cache->get(candidate.id, candidate.keywordSpec);
    }
    return std::make_shared<const ParsedKeywordSpec>(
        KeywordSpecParser::parse(candidate.keywordSpec));
}

CandidateScore Scorer::computeScore(const QString& userNormalized,
                                    const Candidate& candidate) const
{
    CandidateScore result;
    ScoreDetail& detail = result.detail;
    detail.priority = candidate.priority;

    // 1. Exact match on normalized text
    const QString questionNormalized = TextNormalizer::normalize(candidate.question);
    if (userNormalized == questionNormalized) {
        result.score += m_weights.exactMatchBonus;
        detail.exact = true;
    }

    // 2. Keyword phrases and regexes, each counted once
    const auto spec = keywordSpecFor(candidate);
    for (const KeywordMatcher& matcher : spec->matchers) {
        if (!matcher.matches(userNormalized)) {
            continue;
        }
        if (matcher.kind == KeywordMatcher::Kind::Phrase) {
            result.score += m_weights.keywordPhrasePoints;
            detail.matchedKeywords.append(matcher.text);
        } else {
            result.score += m_weights.keywordRegexPoints;
            detail.matchedRegex.append(matcher.text);
        }
    }

    // 3. Lexical similarity, recorded even when it decides nothing
    detail.similarityRatio = SequenceMatcher::ratio(userNormalized, questionNormalized);
    detail.similarityPoints = computeSimilarityPoints(detail.similarityRatio);
    result.score += detail.similarityPoints;

    // 4. Author-assigned priority (negative values are not rejected)
    result.score += computePriorityPoints(candidate.priority);

    return result;
}

} // namespace rb
