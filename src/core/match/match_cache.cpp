#include "core/match/match_cache.h"


namespace pm {

MatchCache::MatchCache(MatchCacheConfig config)
    : m_config(config)
{
}

QString MatchCache::makeKey(const QString& scope, const QString& normalizedQuery,
                            int limit, double threshold, uint64_t snapshotVersion)
{
    return QStringLiteral("%1|%2|%3|%4|%5")
        .arg(scope, normalizedQuery)
        .arg(limit)
        .arg(threshold, 0, 'f', 4)
        .arg(static_cast<qulonglong>(snapshotVersion));
}

std::optional<CachedMatch> MatchCache::get(const QString& cacheKey)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(cacheKey);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto age = std::chrono::duration_cast<std::chrono::seconds>(
        now - it->second->insertedAt);
    if (age.count() >= m_config.ttlSeconds) {
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_misses;
        return std::nullopt;
    }

    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    return it->second->value;
}

void MatchCache::put(const QString& cacheKey, const CachedMatch& result)
{
    if (m_config.maxEntries <= 0 || m_config.ttlSeconds <= 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_index.find(cacheKey);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        const auto& back = m_list.back();
        m_index.erase(back.key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({cacheKey, result, std::chrono::steady_clock::now()});
    m_index[cacheKey] = m_list.begin();
}

void MatchCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

MatchCache::Stats MatchCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
}

} // namespace pm
