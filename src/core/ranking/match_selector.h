#pragma once

#include "core/ranking/scorer.h"
#include "core/shared/match_result.h"
#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace rb {

struct MatchOptions {
    bool includeDebug = false;        // attach the winning ScoreDetail
    bool logCandidateScores = false;  // one debug line per evaluated candidate
};

class MatchSelector {
public:
    explicit MatchSelector(Scorer scorer = Scorer());

    // Score every candidate and decide on the best one.
    //
    // Precondition: candidates are ordered by (priority DESC, id ASC). The
    // best is tracked with a strict greater-than, so on equal scores the
    // earliest candidate wins; the input order decides ties.
    MatchResult selectBest(const Bot& bot,
                           const QString& userMessage,
                           const std::vector<Candidate>& candidates,
                           const MatchOptions& options = {}) const;

    // exact OR any keyword/regex hit OR ratio >= similarityMatchThreshold
    bool isMatch(const ScoreDetail& detail) const;

    // True when candidates follow the (priority DESC, id ASC) contract.
    static bool isCanonicalOrder(const std::vector<Candidate>& candidates);

    const Scorer& scorer() const { return m_scorer; }

private:
    Scorer m_scorer;
};

} // namespace rb
