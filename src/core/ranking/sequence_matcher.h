#pragma once

#include <QString>
#include <unordered_map>
#include <vector>

namespace rb {

// Block-matching similarity between two strings (Ratcliff/Obershelp).
//
// The longest common block is found first, then the regions to its left
// and right are matched recursively. ratio() is 2*M / (|a| + |b|) where M is
// the total size of the matching blocks. This is not an edit distance.
class SequenceMatcher {
public:
    struct Block {
        int aStart = 0;
        int bStart = 0;
        int size = 0;
    };

    SequenceMatcher(const QString& a, const QString& b);

    // Matching blocks in increasing order, adjacent blocks merged, terminated
    // by a zero-size sentinel at (|a|, |b|).
    const std::vector<Block>& matchingBlocks() const { return m_blocks; }

    // In [0, 1]; two empty strings are identical (1.0).
    double ratio() const;

    static double ratio(const QString& a, const QString& b);

    // Strings at least this long have very frequent characters ignored as
    // block anchors.
    static constexpr int kPopularThresholdLength = 200;

private:
    Block findLongestMatch(int aLo, int aHi, int bLo, int bHi) const;
    void computeMatchingBlocks();

    QString m_a;
    QString m_b;
    std::unordered_map<char16_t, std::vector<int>> m_bIndex;  // char -> positions in b
    std::vector<Block> m_blocks;
};

} // namespace rb
