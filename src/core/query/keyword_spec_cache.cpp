#include "core/query/keyword_spec_cache.h"

namespace rb {

KeywordSpecCache::KeywordSpecCache(KeywordSpecCacheConfig config)
    : m_config(config)
{
}

std::shared_ptr<const ParsedKeywordSpec> KeywordSpecCache::get(int64_t candidateId,
                                                               const QString& spec)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(candidateId);
    if (it != m_index.end()) {
        if (it->second->spec == spec) {
            if (it->second != m_list.begin()) {
                m_list.splice(m_list.begin(), m_list, it->second);
            }
            ++m_hits;
            return it->second->parsed;
        }

        // Spec edited since it was cached
        m_list.erase(it->second);
        m_index.erase(it);
    }

    ++m_misses;
    auto parsed = std::make_shared<const ParsedKeywordSpec>(KeywordSpecParser::parse(spec));
    if (m_config.maxEntries <= 0) {
        return parsed;
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        m_index.erase(m_list.back().candidateId);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({candidateId, spec, parsed});
    m_index[candidateId] = m_list.begin();
    return parsed;
}

void KeywordSpecCache::invalidate(int64_t candidateId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(candidateId);
    if (it == m_index.end()) {
        return;
    }
    m_list.erase(it->second);
    m_index.erase(it);
}

void KeywordSpecCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

KeywordSpecCache::Stats KeywordSpecCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
}

} // namespace rb
