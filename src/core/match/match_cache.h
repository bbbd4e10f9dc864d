#pragma once

#include "core/shared/match_result.h"

#include <QHash>
#include <QString>

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pm {

struct MatchCacheConfig {
    int maxEntries = 256;
    int ttlSeconds = 60;
};

struct CachedMatch {
    std::vector<MatchCandidate> candidates;
    std::optional<MatchTier> tier;
};

// LRU + TTL cache of match results. Keys embed the snapshot version, so a
// new snapshot makes older entries unreachable; they age out through LRU.
class MatchCache {
public:
    explicit MatchCache(MatchCacheConfig config = {});

    static QString makeKey(const QString& scope, const QString& normalizedQuery,
                           int limit, double threshold, uint64_t snapshotVersion);

    // Returns cached result or nullopt. Lazily evicts expired entries.
    std::optional<CachedMatch> get(const QString& cacheKey);
    void put(const QString& cacheKey, const CachedMatch& result);
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
        QString key;
        CachedMatch value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    MatchCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace pm
