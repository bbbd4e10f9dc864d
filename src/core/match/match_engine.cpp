#include "core/match/match_engine.h"
#include "core/index/catalog_store.h"
#include "core/shared/logging.h"
#include "core/signals/learned_scorer.h"

#include <QDateTime>

#include <algorithm>
#include <thread>

namespace pm {

namespace {

constexpr double kSecondsPerDay = 86400.0;
constexpr int kDeadlineCheckInterval = 16;
constexpr int kMaxBatchWorkers = 8;

struct TrainingHit {
    const PreparedExample* example = nullptr;
    int productIndex = -1;
    double similarity = 0.0;
};

QString dominantSignalOf(const SignalScores& s)
{
    if (s.learned > 0.6) {
        return QStringLiteral("learned");
    }
    if (s.alias > 0.7) {
        return QStringLiteral("alias");
    }
    if (s.vector > s.fuzzy && s.vector > s.trigram) {
        return QStringLiteral("vector");
    }
    return s.fuzzy > s.trigram ? QStringLiteral("fuzzy") : QStringLiteral("trigram");
}

double weightedScore(const SignalScores& s, const MatchWeights& w)
{
    return clampUnit(s.trigram * w.trigram + s.fuzzy * w.fuzzy + s.alias * w.alias
                     + s.learned * w.learned + s.vector * w.vector);
}

MatchCandidate candidateFor(const IndexedProduct& indexed, MatchTier tier)
{
    MatchCandidate candidate;
    candidate.productId = indexed.product.id;
    candidate.sku = indexed.product.sku;
    candidate.name = indexed.product.name;
    candidate.manufacturer = indexed.product.manufacturer;
    candidate.tier = tier;
    return candidate;
}

// final desc, then name, SKU and id ascending
bool rankBefore(const MatchCandidate& a, const MatchCandidate& b)
{
    if (a.finalScore != b.finalScore) {
        return a.finalScore > b.finalScore;
    }
    if (a.name != b.name) {
        return a.name < b.name;
    }
    if (a.sku != b.sku) {
        return a.sku < b.sku;
    }
    return a.productId < b.productId;
}

} // anonymous namespace

MatchDeadline::MatchDeadline(int timeoutMs)
    : m_enabled(timeoutMs > 0)
    , m_expiresAt(std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs))
{
}

bool MatchDeadline::expired() const
{
    return m_enabled && std::chrono::steady_clock::now() >= m_expiresAt;
}

MatchEngine::MatchEngine(CatalogStore* store,
                         MatchEngineOptions options,
                         std::shared_ptr<EmbeddingProvider> embeddingProvider)
    : m_store(store)
    , m_config(options.config.normalized())
    , m_batchWorkers(options.batchWorkers)
    , m_embeddingEnabled(options.embeddingEnabled)
    , m_retriever(m_config.retrieval, m_config.signals)
    , m_aliasScorer(m_config.signals.aliasFloor)
    , m_vectorScorer(std::move(embeddingProvider))
    , m_cache(options.cache)
{
}

int MatchEngine::clampLimit(int limit)
{
    return std::clamp(limit, MatchQuery::kMinLimit, MatchQuery::kMaxLimit);
}

double MatchEngine::clampThreshold(double threshold)
{
    return clampUnit(threshold);
}

void MatchEngine::setClock(Clock clock)
{
    std::lock_guard<std::mutex> lock(m_clockMutex);
    m_clock = std::move(clock);
}

double MatchEngine::now() const
{
    std::lock_guard<std::mutex> lock(m_clockMutex);
    if (m_clock) {
        return m_clock();
    }
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

int MatchEngine::batchWorkerCount(int jobs) const
{
    int workers = m_batchWorkers;
    if (workers <= 0) {
        workers = static_cast<int>(std::thread::hardware_concurrency());
    }
    workers = std::clamp(workers, 1, kMaxBatchWorkers);
    return std::max(1, std::min(workers, jobs));
}

// ── Matching ────────────────────────────────────────────────

MatchOutcome MatchEngine::match(const MatchQuery& query)
{
    MatchOutcome outcome;

    const QString scope = query.scope.trimmed().isEmpty() ? defaultScope() : query.scope.trimmed();
    const int limit = clampLimit(query.limit);
    const double threshold = clampThreshold(query.threshold);

    if (query.text.trimmed().isEmpty()) {
        return outcome;
    }

    const MatchDeadline deadline(query.timeoutMs);
    PreparedQuery prepared = prepareQuery(query.text);
    if (prepared.isEmpty()) {
        return outcome;
    }

    const SnapshotPtr snap = snapshot(scope);
    if (!snap) {
        LOG_WARN(pmMatch, "Catalog unavailable for scope %s", qUtf8Printable(scope));
        outcome.status = MatchStatus::CatalogUnavailable;
        return outcome;
    }
    outcome.snapshotVersion = snap->version();

    const QString cacheKey =
        MatchCache::makeKey(scope, prepared.normalized, limit, threshold, snap->version());
    if (auto cached = m_cache.get(cacheKey)) {
        outcome.candidates = std::move(cached->candidates);
        outcome.tier = cached->tier;
        outcome.fromCache = true;
        return outcome;
    }

    for (const MatchTier tier : kTierOrder) {
        if (deadline.expired()) {
            break;
        }
        if (tier == MatchTier::Algorithmic && m_embeddingEnabled && m_vectorScorer.hasProvider()
            && !prepared.embedding.has_value()) {
            prepared.embedding = m_vectorScorer.embedQuery(prepared.normalized);
        }

        std::vector<MatchCandidate> candidates =
            runTier(tier, prepared, *snap, limit, threshold, deadline);
        if (deadline.expired()) {
            break;
        }
        if (!candidates.empty()) {
            LOG_DEBUG(pmMatch, "Query '%s' resolved by %s with %d candidates",
                      qUtf8Printable(prepared.normalized),
                      qUtf8Printable(matchTierToString(tier)),
                      static_cast<int>(candidates.size()));
            outcome.candidates = std::move(candidates);
            outcome.tier = tier;
            break;
        }
    }

    if (deadline.expired()) {
        LOG_WARN(pmMatch, "Match timed out after %d ms: %s",
                 query.timeoutMs, qUtf8Printable(prepared.normalized));
        outcome.status = MatchStatus::TimedOut;
        outcome.candidates.clear();
        outcome.tier.reset();
        return outcome;
    }

    m_cache.put(cacheKey, CachedMatch{outcome.candidates, outcome.tier});
    return outcome;
}

std::vector<BatchMatchResult> MatchEngine::matchBatch(const QStringList& texts,
                                                      int limit,
                                                      double threshold,
                                                      const QString& scope,
                                                      int timeoutMs)
{
    std::vector<BatchMatchResult> results(static_cast<size_t>(texts.size()));
    if (texts.isEmpty()) {
        return results;
    }

    std::atomic<int> nextIndex{0};
    auto worker = [&]() {
        for (;;) {
            const int index = nextIndex.fetch_add(1);
            if (index >= texts.size()) {
                return;
            }
            MatchQuery query;
            query.text = texts.at(index);
            query.scope = scope;
            query.limit = limit;
            query.threshold = threshold;
            query.timeoutMs = timeoutMs;

            BatchMatchResult& result = results[static_cast<size_t>(index)];
            result.queryIndex = index;
            result.queryText = texts.at(index);
            result.outcome = match(query);
        }
    };

    const int workerCount = batchWorkerCount(static_cast<int>(texts.size()));
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workerCount - 1));
    for (int i = 1; i < workerCount; ++i) {
        threads.emplace_back(worker);
    }
    worker();
    for (std::thread& thread : threads) {
        thread.join();
    }

    LOG_INFO(pmMatch, "Batch of %d queries matched with %d workers",
             static_cast<int>(texts.size()), workerCount);
    return results;
}

std::vector<MatchCandidate> MatchEngine::runTier(MatchTier tier,
                                                 const PreparedQuery& query,
                                                 const CatalogSnapshot& snapshot,
                                                 int limit,
                                                 double threshold,
                                                 const MatchDeadline& deadline) const
{
    limit = clampLimit(limit);
    threshold = clampThreshold(threshold);
    if (query.isEmpty()) {
        return {};
    }

    switch (tier) {
    case MatchTier::TrainingExact:
    case MatchTier::TrainingGood:
        return trainingTier(tier, query, snapshot, limit);
    case MatchTier::Algorithmic:
    case MatchTier::FallbackFuzzy:
        return scoredTier(tier, query, snapshot, limit, threshold, deadline);
    }
    return {};
}

std::vector<MatchCandidate> MatchEngine::trainingTier(MatchTier tier,
                                                      const PreparedQuery& query,
                                                      const CatalogSnapshot& snapshot,
                                                      int limit) const
{
    const TierThresholds& t = m_config.tiers;
    const double nowSecs = now();
    const double maxAge = t.trainingRecencyDays * kSecondsPerDay;

    std::vector<TrainingHit> hits;
    for (const PreparedExample& prepared : snapshot.examples()) {
        const TrainingExample& ex = prepared.example;
        if (!isHighQuality(ex.quality) || nowSecs - ex.approvedAt > maxAge) {
            continue;
        }
        const std::optional<int> productIndex = snapshot.productIndex(ex.productId);
        if (!productIndex.has_value()) {
            continue;
        }

        // The literal comparison keeps examples stored under older
        // normalization rules reachable.
        const double sim = ex.normalizedText == query.normalized
            ? 1.0
            : std::max(TrigramIndex::similarity(query.trigrams, prepared.normalizedTrigrams),
                       TrigramIndex::similarity(query.literalTrigrams, prepared.literalTrigrams));
        const bool inBand = tier == MatchTier::TrainingExact
            ? sim >= t.exactSimilarity
            : (sim >= t.goodSimilarity && sim < t.exactSimilarity);
        if (inBand) {
            hits.push_back({&prepared, *productIndex, sim});
        }
    }

    std::sort(hits.begin(), hits.end(), [tier](const TrainingHit& a, const TrainingHit& b) {
        const TrainingExample& ea = a.example->example;
        const TrainingExample& eb = b.example->example;
        if (tier == MatchTier::TrainingGood && a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        if (ea.weight != eb.weight) {
            return ea.weight > eb.weight;
        }
        if (ea.approvedAt != eb.approvedAt) {
            return ea.approvedAt > eb.approvedAt;
        }
        return ea.id < eb.id;
    });

    std::vector<MatchCandidate> candidates;
    std::vector<bool> seen(static_cast<size_t>(snapshot.productCount()), false);
    for (const TrainingHit& hit : hits) {
        if (static_cast<int>(candidates.size()) >= limit) {
            break;
        }
        if (seen[static_cast<size_t>(hit.productIndex)]) {
            continue;
        }
        seen[static_cast<size_t>(hit.productIndex)] = true;

        const TrainingExample& ex = hit.example->example;
        MatchCandidate candidate = candidateFor(snapshot.product(hit.productIndex), tier);
        candidate.trainingExampleId = ex.id;

        if (tier == MatchTier::TrainingExact) {
            candidate.scores = SignalScores{1.0, 1.0, 1.0, 1.0, 1.0};
            candidate.finalScore = 1.0;
            candidate.reasoning = QStringLiteral("Exact match to approved training example "
                                                 "(quality %1, referenced %2 times)")
                                      .arg(matchQualityToString(ex.quality))
                                      .arg(ex.timesReferenced);
        } else {
            const double band = t.exactSimilarity - t.goodSimilarity;
            const double position = band > 0.0 ? (hit.similarity - t.goodSimilarity) / band : 0.0;
            const double ceiling = t.goodScoreBase + t.goodScoreSpan;
            double score = t.goodScoreBase + position * t.goodScoreSpan;
            score = std::min(score, ceiling - 1e-6);
            candidate.scores.trigram = hit.similarity;
            candidate.scores.fuzzy = hit.similarity;
            candidate.scores.learned = hit.similarity;
            candidate.finalScore = clampUnit(score);
            candidate.reasoning = QStringLiteral("High-confidence match to approved example "
                                                 "\"%1\" (similarity %2)")
                                      .arg(ex.queryText)
                                      .arg(hit.similarity, 0, 'f', 3);
        }
        candidate.scores.clamp();
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<MatchCandidate> MatchEngine::scoredTier(MatchTier tier,
                                                    const PreparedQuery& query,
                                                    const CatalogSnapshot& snapshot,
                                                    int limit,
                                                    double threshold,
                                                    const MatchDeadline& deadline) const
{
    const bool relaxed = tier == MatchTier::FallbackFuzzy;
    const std::vector<int> pool = m_retriever.retrieve(
        query, snapshot, relaxed ? RetrievalMode::Relaxed : RetrievalMode::Standard);

    const LearnedScorer learnedScorer(m_config.signals, now());
    const MatchWeights& weights = m_config.weights;

    std::vector<MatchCandidate> candidates;
    candidates.reserve(pool.size());
    int visited = 0;
    for (const int index : pool) {
        if (++visited % kDeadlineCheckInterval == 0 && deadline.expired()) {
            return {};
        }

        const IndexedProduct& indexed = snapshot.product(index);
        SignalScores scores;
        scores.trigram = CandidateRetriever::trigramScore(query, indexed);
        scores.fuzzy = CandidateRetriever::fuzzyScore(query, indexed, m_config.signals.fuzzyCutoff);
        scores.alias = m_aliasScorer.score(query, snapshot.aliasesFor(index));
        scores.learned = learnedScorer.score(query, snapshot.examplesFor(index));
        if (query.embedding.has_value() && !indexed.embedding.empty()) {
            scores.vector = VectorScorer::cosine(*query.embedding, indexed.embedding);
        }
        scores.clamp();

        const double computed = weightedScore(scores, weights);
        double finalScore = computed;
        if (relaxed) {
            const bool lexical = std::max(scores.trigram, scores.fuzzy) > m_config.retrieval.relaxedFloor;
            if (!lexical && scores.alias <= 0.0 && scores.learned <= 0.0) {
                continue;
            }
            finalScore = std::max(computed, threshold);
        } else if (computed < threshold) {
            continue;
        }

        MatchCandidate candidate = candidateFor(indexed, tier);
        candidate.scores = scores;
        candidate.finalScore = clampUnit(finalScore);
        candidate.dominantSignal = dominantSignalOf(scores);
        candidate.reasoning = QStringLiteral("trigram %1, fuzzy %2, alias %3, learned %4, vector %5; "
                                             "dominant signal: %6")
                                  .arg(scores.trigram, 0, 'f', 3)
                                  .arg(scores.fuzzy, 0, 'f', 3)
                                  .arg(scores.alias, 0, 'f', 3)
                                  .arg(scores.learned, 0, 'f', 3)
                                  .arg(scores.vector, 0, 'f', 3)
                                  .arg(candidate.dominantSignal);
        if (relaxed && computed < threshold) {
            candidate.reasoning += QStringLiteral(" (relaxed match, raised from %1 to threshold)")
                                       .arg(computed, 0, 'f', 3);
        }
        candidates.push_back(std::move(candidate));
    }

    std::sort(candidates.begin(), candidates.end(), rankBefore);
    if (static_cast<int>(candidates.size()) > limit) {
        candidates.resize(static_cast<size_t>(limit));
    }
    return candidates;
}

// ── Snapshots ───────────────────────────────────────────────

SnapshotPtr MatchEngine::snapshot(const QString& scope)
{
    {
        std::shared_lock<std::shared_mutex> lock(m_snapshotMutex);
        auto it = m_snapshots.find(scope);
        if (it != m_snapshots.end()) {
            return it->second;
        }
    }
    return loadSnapshot(scope);
}

SnapshotPtr MatchEngine::loadSnapshot(const QString& scope)
{
    std::lock_guard<std::mutex> loadLock(m_loadMutex);
    {
        std::shared_lock<std::shared_mutex> lock(m_snapshotMutex);
        auto it = m_snapshots.find(scope);
        if (it != m_snapshots.end()) {
            return it->second;
        }
    }
    return loadFromStore(scope);
}

SnapshotPtr MatchEngine::reload(const QString& scope)
{
    std::lock_guard<std::mutex> loadLock(m_loadMutex);
    return loadFromStore(scope);
}

SnapshotPtr MatchEngine::loadFromStore(const QString& scope)
{
    if (!m_store) {
        return nullptr;
    }

    auto products = m_store->loadProducts(scope);
    if (!products.has_value()) {
        LOG_ERROR(pmMatch, "Failed to load products for scope %s", qUtf8Printable(scope));
        return nullptr;
    }

    CatalogSnapshot::Contents contents;
    contents.scope = scope;
    contents.products = std::move(*products);

    if (auto aliases = m_store->loadAliases(scope)) {
        contents.aliases = std::move(*aliases);
    } else {
        LOG_WARN(pmMatch, "Aliases unavailable for scope %s, alias signal disabled",
                 qUtf8Printable(scope));
    }
    if (auto examples = m_store->loadTrainingExamples(scope)) {
        contents.examples = std::move(*examples);
    } else {
        LOG_WARN(pmMatch, "Training examples unavailable for scope %s, training tiers disabled",
                 qUtf8Printable(scope));
    }
    if (m_embeddingEnabled) {
        if (auto embeddings = m_store->loadProductEmbeddings(scope)) {
            contents.embeddings = std::move(*embeddings);
        } else {
            LOG_WARN(pmMatch, "Product embeddings unavailable for scope %s", qUtf8Printable(scope));
        }
    }

    const SnapshotPtr snap = CatalogSnapshot::build(std::move(contents), m_nextVersion.fetch_add(1));
    {
        std::unique_lock<std::shared_mutex> lock(m_snapshotMutex);
        m_snapshots[scope] = snap;
    }
    LOG_INFO(pmMatch, "Loaded snapshot v%llu for scope %s: %d products, %d aliases, %d examples",
             static_cast<unsigned long long>(snap->version()), qUtf8Printable(scope),
             snap->productCount(), static_cast<int>(snap->aliases().size()),
             static_cast<int>(snap->examples().size()));
    return snap;
}

void MatchEngine::publish(const QString& scope,
                          const std::function<SnapshotPtr(const CatalogSnapshot&)>& derive)
{
    // Serialized with reload() so a stale store read never replaces a derived snapshot.
    std::lock_guard<std::mutex> loadLock(m_loadMutex);

    SnapshotPtr current;
    {
        std::shared_lock<std::shared_mutex> lock(m_snapshotMutex);
        auto it = m_snapshots.find(scope);
        if (it == m_snapshots.end()) {
            return;  // next match loads a fresh snapshot from the store
        }
        current = it->second;
    }

    const SnapshotPtr next = derive(*current);
    std::unique_lock<std::shared_mutex> lock(m_snapshotMutex);
    m_snapshots[scope] = next;
}

void MatchEngine::applyTrainingExample(const TrainingExample& example)
{
    const QString scope = example.scope.isEmpty() ? defaultScope() : example.scope;
    publish(scope, [this, &example](const CatalogSnapshot& current) {
        return current.withTrainingExample(example, m_nextVersion.fetch_add(1));
    });
}

void MatchEngine::applyAlias(const Alias& alias)
{
    const QString scope = alias.scope.isEmpty() ? defaultScope() : alias.scope;
    publish(scope, [this, &alias](const CatalogSnapshot& current) {
        return current.withAlias(alias, m_nextVersion.fetch_add(1));
    });
}

} // namespace pm
