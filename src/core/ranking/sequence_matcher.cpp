#include "core/ranking/sequence_matcher.h"

#include <algorithm>
#include <tuple>

namespace rb {

SequenceMatcher::SequenceMatcher(const QString& a, const QString& b)
    : m_a(a)
    , m_b(b)
{
    const int n = static_cast<int>(m_b.size());
    for (int j = 0; j < n; ++j) {
        m_bIndex[m_b.at(j).unicode()].push_back(j);
    }

    // Drop characters that are too common to be useful anchors
    if (n >= kPopularThresholdLength) {
        const size_t popularLimit = static_cast<size_t>(n / 100 + 1);
        for (auto it = m_bIndex.begin(); it != m_bIndex.end();) {
            if (it->second.size() > popularLimit) {
                it = m_bIndex.erase(it);
            } else {
                ++it;
            }
        }
    }

    computeMatchingBlocks();
}

SequenceMatcher::Block SequenceMatcher::findLongestMatch(int aLo, int aHi,
                                                         int bLo, int bHi) const
{
    int bestI = aLo;
    int bestJ = bLo;
    int bestSize = 0;

    // lengths[j] = length of the match ending at a[i-1], b[j]
    std::unordered_map<int, int> lengths;
    for (int i = aLo; i < aHi; ++i) {
        std::unordered_map<int, int> nextLengths;
        const auto found = m_bIndex.find(m_a.at(i).unicode());
        if (found != m_bIndex.end()) {
            for (const int j : found->second) {
                if (j < bLo) {
                    continue;
                }
                if (j >= bHi) {
                    break;
                }
                const auto prev = lengths.find(j - 1);
                const int k = (prev != lengths.end() ? prev->second : 0) + 1;
                nextLengths[j] = k;
                if (k > bestSize) {
                    bestI = i - k + 1;
                    bestJ = j - k + 1;
                    bestSize = k;
                }
            }
        }
        lengths.swap(nextLengths);
    }

    // Popular characters were never anchors, but may still extend a block.
    while (bestI > aLo && bestJ > bLo && m_a.at(bestI - 1) == m_b.at(bestJ - 1)) {
        --bestI;
        --bestJ;
        ++bestSize;
    }
    while (bestI + bestSize < aHi && bestJ + bestSize < bHi
           && m_a.at(bestI + bestSize) == m_b.at(bestJ + bestSize)) {
        ++bestSize;
    }

    return {bestI, bestJ, bestSize};
}

void SequenceMatcher::computeMatchingBlocks()
{
    const int la = static_cast<int>(m_a.size());
    const int lb = static_cast<int>(m_b.size());

    struct Range {
        int aLo;
        int aHi;
        int bLo;
        int bHi;
    };

    std::vector<Block> found;
    std::vector<Range> pending{{0, la, 0, lb}};
    while (!pending.empty()) {
        const Range r = pending.back();
        pending.pop_back();

        const Block block = findLongestMatch(r.aLo, r.aHi, r.bLo, r.bHi);
        if (block.size == 0) {
            continue;
        }
        found.push_back(block);
        if (r.aLo < block.aStart && r.bLo < block.bStart) {
            pending.push_back({r.aLo, block.aStart, r.bLo, block.bStart});
        }
        if (block.aStart + block.size < r.aHi && block.bStart + block.size < r.bHi) {
            pending.push_back({block.aStart + block.size, r.aHi,
                               block.bStart + block.size, r.bHi});
        }
    }

    std::sort(found.begin(), found.end(), [](const Block& x, const Block& y) {
        return std::tie(x.aStart, x.bStart, x.size) < std::tie(y.aStart, y.bStart, y.size);
    });

    Block current;
    for (const Block& next : found) {
        if (current.aStart + current.size == next.aStart
            && current.bStart + current.size == next.bStart) {
            current.size += next.size;
            continue;
        }
        if (current.size > 0) {
            m_blocks.push_back(current);
        }
        current = next;
    }
    if (current.size > 0) {
        m_blocks.push_back(current);
    }
    m_blocks.push_back({la, lb, 0});
}

double SequenceMatcher::ratio() const
{
    const int total = static_cast<int>(m_a.size() + m_b.size());
    if (total == 0) {
        return 1.0;
    }

    int matches = 0;
    for (const Block& block : m_blocks) {
        matches += block.size;
    }
    return 2.0 * matches / total;
}

double SequenceMatcher::ratio(const QString& a, const QString& b)
{
    return SequenceMatcher(a, b).ratio();
}

} // namespace rb
