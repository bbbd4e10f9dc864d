#pragma once

#include "core/match/catalog_snapshot.h"
#include "core/shared/scoring_types.h"
#include "core/signals/alias_scorer.h"

#include <vector>

namespace pm {

enum class RetrievalMode {
    Standard,  // trigram >= retrievalFloor
    Relaxed,   // max(trigram, fuzzy) > relaxedFloor
};

// Narrows a snapshot to a bounded working set before the per-candidate
// scorers run. Products with a qualifying alias or a training example
// close to the query are always included.
class CandidateRetriever {
public:
    CandidateRetriever(const RetrievalConfig& config, const SignalConfig& signalConfig);

    // Product indexes into `snapshot`, best prefilter score first, at most
    // maxCandidates entries.
    std::vector<int> retrieve(const PreparedQuery& query,
                              const CatalogSnapshot& snapshot,
                              RetrievalMode mode) const;

    // Max over normalized name, SKU and manufacturer.
    static double trigramScore(const PreparedQuery& query, const IndexedProduct& product);
    static double fuzzyScore(const PreparedQuery& query, const IndexedProduct& product, int cutoff);

private:
    RetrievalConfig m_config;
    SignalConfig m_signals;
    AliasScorer m_aliasScorer;
};

} // namespace pm
