#pragma once

#include "core/query/keyword_spec.h"

#include <QString>

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace rb {

struct KeywordSpecCacheConfig {
    int maxEntries = 256;
};

// KeywordSpecCache -- parsed keyword specs keyed by candidate id.
//
// An entry is only reused while the candidate's spec string is unchanged;
// a different string re-parses and replaces the entry. Safe to share
// between threads.
class KeywordSpecCache {
public:
    explicit KeywordSpecCache(KeywordSpecCacheConfig config = {});

    std::shared_ptr<const ParsedKeywordSpec> get(int64_t candidateId, const QString& spec);
    void invalidate(int64_t candidateId);
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    struct Entry {
        int64_t candidateId = 0;
        QString spec;
        std::shared_ptr<const ParsedKeywordSpec> parsed;
    };

    KeywordSpecCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used
    std::unordered_map<int64_t, std::list<Entry>::iterator> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace rb
