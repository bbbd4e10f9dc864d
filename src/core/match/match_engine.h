#pragma once

#include "core/match/catalog_snapshot.h"
#include "core/match/candidate_retriever.h"
#include "core/match/match_cache.h"
#include "core/shared/match_options.h"
#include "core/shared/match_result.h"
#include "core/shared/scoring_types.h"
#include "core/signals/vector_scorer.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace pm {

class CatalogStore;

struct MatchEngineOptions {
    MatchConfig config;
    MatchCacheConfig cache;
    int batchWorkers = 0;          // 0 = hardware_concurrency clamped to [1, 8]
    bool embeddingEnabled = false;
};

// Wall-clock budget of one match call.
class MatchDeadline {
public:
    MatchDeadline() = default;
    explicit MatchDeadline(int timeoutMs);

    bool expired() const;

private:
    bool m_enabled = false;
    std::chrono::steady_clock::time_point m_expiresAt;
};

// Tiered matching over per-scope catalog snapshots.
//
// Tiers run in the order of kTierOrder and the first one producing any
// candidate wins. Matching is a pure read path: it never writes to the
// store, so a timed-out call leaves nothing behind. Snapshots are swapped
// atomically when approvals are applied or a scope is reloaded.
class MatchEngine {
public:
    using Clock = std::function<double()>;  // epoch seconds

    static constexpr MatchTier kTierOrder[] = {
        MatchTier::TrainingExact,
        MatchTier::TrainingGood,
        MatchTier::Algorithmic,
        MatchTier::FallbackFuzzy,
    };

    explicit MatchEngine(CatalogStore* store,
                         MatchEngineOptions options = {},
                         std::shared_ptr<EmbeddingProvider> embeddingProvider = nullptr);

    MatchEngine(const MatchEngine&) = delete;
    MatchEngine& operator=(const MatchEngine&) = delete;

    MatchOutcome match(const MatchQuery& query);

    // Each text is matched independently on a bounded worker pool; results
    // come back ordered by input index.
    std::vector<BatchMatchResult> matchBatch(const QStringList& texts,
                                             int limit = 10,
                                             double threshold = 0.3,
                                             const QString& scope = defaultScope(),
                                             int timeoutMs = 0);

    // Runs a single tier; exposed so each tier can be exercised in isolation.
    std::vector<MatchCandidate> runTier(MatchTier tier,
                                        const PreparedQuery& query,
                                        const CatalogSnapshot& snapshot,
                                        int limit,
                                        double threshold,
                                        const MatchDeadline& deadline = MatchDeadline()) const;

    // Current snapshot for `scope`, loading it from the store on first use.
    // nullptr when the catalog cannot be read.
    SnapshotPtr snapshot(const QString& scope);

    // Rebuilds the scope's snapshot from the store.
    SnapshotPtr reload(const QString& scope);

    // Publish a new snapshot version containing a freshly written row.
    void applyTrainingExample(const TrainingExample& example);
    void applyAlias(const Alias& alias);

    const MatchConfig& config() const { return m_config; }
    MatchCache& cache() { return m_cache; }
    int batchWorkerCount(int jobs) const;

    void setClock(Clock clock);
    double now() const;

    static int clampLimit(int limit);
    static double clampThreshold(double threshold);

private:
    std::vector<MatchCandidate> trainingTier(MatchTier tier, const PreparedQuery& query,
                                             const CatalogSnapshot& snapshot, int limit) const;
    std::vector<MatchCandidate> scoredTier(MatchTier tier, const PreparedQuery& query,
                                           const CatalogSnapshot& snapshot, int limit,
                                           double threshold, const MatchDeadline& deadline) const;

    SnapshotPtr loadSnapshot(const QString& scope);
    SnapshotPtr loadFromStore(const QString& scope);  // caller holds m_loadMutex
    void publish(const QString& scope,
                 const std::function<SnapshotPtr(const CatalogSnapshot&)>& derive);

    CatalogStore* m_store = nullptr;
    MatchConfig m_config;
    int m_batchWorkers = 0;
    bool m_embeddingEnabled = false;

    CandidateRetriever m_retriever;
    AliasScorer m_aliasScorer;
    VectorScorer m_vectorScorer;
    MatchCache m_cache;

    mutable std::shared_mutex m_snapshotMutex;
    std::map<QString, SnapshotPtr> m_snapshots;
    std::mutex m_loadMutex;
    std::atomic<uint64_t> m_nextVersion{1};

    mutable std::mutex m_clockMutex;
    Clock m_clock;
};

} // namespace pm
