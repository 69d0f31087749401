#pragma once

#include "core/query/keyword_spec.h"
#include "core/query/keyword_spec_cache.h"
#include "core/shared/match_result.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QString>
#include <memory>

namespace rb {

struct CandidateScore {
    int score = 0;
    ScoreDetail detail;
};

class Scorer {
public:
    // cache is optional; without one every call parses the keyword spec.
    explicit Scorer(const ScoringWeights& weights = {},
                    std::shared_ptr<KeywordSpecCache> cache = nullptr);

    // Score one candidate against an already normalized user message.
    // Sum of: exact-match bonus, points per matched phrase and regex,
    // weighted similarity, and weighted priority.
    CandidateScore computeScore(const QString& userNormalized,
                                const Candidate& candidate) const;

    // round(similarityWeight * ratio), ties to even
    int computeSimilarityPoints(double ratio) const;

    int computePriorityPoints(int priority) const;

    const ScoringWeights& weights() const { return m_weights; }

private:
    std::shared_ptr<const ParsedKeywordSpec> keywordSpecFor(const Candidate& candidate) const;

    ScoringWeights m_weights;
    std::shared_ptr<KeywordSpecCache> m_cache;
};

} // namespace rb
