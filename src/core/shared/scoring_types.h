#pragma once

namespace rb {

// Scoring weights for candidate evaluation. Passed by value into the
// Scorer and MatchSelector; alternate profiles are plain struct copies.
struct ScoringWeights {
    int exactMatchBonus = 40;      // normalized user text == normalized question
    int keywordPhrasePoints = 12;  // per matched plain phrase
    int keywordRegexPoints = 14;   // per matched regex
    int similarityWeight = 30;     // multiplied by the similarity ratio, then rounded
    int priorityWeight = 2;        // multiplied by candidate priority

    // Below this ratio, similarity alone does not make a match.
    double similarityMatchThreshold = 0.55;
};

} // namespace rb
