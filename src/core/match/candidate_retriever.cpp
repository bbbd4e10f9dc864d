#include "core/match/candidate_retriever.h"
#include "core/signals/edit_distance.h"

#include <algorithm>
#include <unordered_map>

namespace pm {

CandidateRetriever::CandidateRetriever(const RetrievalConfig& config,
                                       const SignalConfig& signalConfig)
    : m_config(config)
    , m_signals(signalConfig)
    , m_aliasScorer(signalConfig.aliasFloor)
{
}

double CandidateRetriever::trigramScore(const PreparedQuery& query, const IndexedProduct& product)
{
    return std::max({TrigramIndex::similarity(query.trigrams, product.nameTrigrams),
                     TrigramIndex::similarity(query.trigrams, product.skuTrigrams),
                     TrigramIndex::similarity(query.trigrams, product.manufacturerTrigrams)});
}

double CandidateRetriever::fuzzyScore(const PreparedQuery& query, const IndexedProduct& product,
                                      int cutoff)
{
    return std::max({EditDistance::fuzzyScore(query.normalized, product.normalizedName, cutoff),
                     EditDistance::fuzzyScore(query.normalized, product.normalizedSku, cutoff),
                     EditDistance::fuzzyScore(query.normalized, product.normalizedManufacturer,
                                              cutoff)});
}

std::vector<int> CandidateRetriever::retrieve(const PreparedQuery& query,
                                              const CatalogSnapshot& snapshot,
                                              RetrievalMode mode) const
{
    if (query.isEmpty() || snapshot.productCount() == 0) {
        return {};
    }

    // product index -> prefilter score
    std::unordered_map<int, double> kept;
    auto keep = [&kept](int index, double score) {
        auto it = kept.find(index);
        if (it == kept.end()) {
            kept.emplace(index, score);
        } else {
            it->second = std::max(it->second, score);
        }
    };

    auto considerLexical = [&](int index) {
        const IndexedProduct& product = snapshot.product(index);
        const double trigram = trigramScore(query, product);
        if (mode == RetrievalMode::Standard) {
            if (trigram >= m_config.retrievalFloor) {
                keep(index, trigram);
            }
            return;
        }
        const double relaxed = std::max(trigram, fuzzyScore(query, product, m_signals.fuzzyCutoff));
        if (relaxed > m_config.relaxedFloor) {
            keep(index, relaxed);
        }
    };

    if (snapshot.productCount() <= m_config.fullScanLimit) {
        for (int i = 0; i < snapshot.productCount(); ++i) {
            considerLexical(i);
        }
    } else {
        for (const int i : snapshot.trigramIndex().lookup(query.trigrams)) {
            considerLexical(i);
        }
    }

    for (const PreparedAlias& alias : snapshot.aliases()) {
        const std::optional<int> index = snapshot.productIndex(alias.alias.productId);
        if (!index.has_value() || !m_aliasScorer.qualifies(query, alias)) {
            continue;
        }
        keep(*index, AliasScorer::similarity(query, alias) * clampUnit(alias.alias.confidence));
    }

    const double exampleFloor = mode == RetrievalMode::Standard ? m_config.retrievalFloor
                                                                : m_config.relaxedFloor;
    for (const PreparedExample& example : snapshot.examples()) {
        if (!isHighQuality(example.example.quality)) {
            continue;
        }
        const std::optional<int> index = snapshot.productIndex(example.example.productId);
        if (!index.has_value()) {
            continue;
        }
        const double sim = TrigramIndex::similarity(query.trigrams, example.normalizedTrigrams);
        if (sim >= exampleFloor && sim > 0.0) {
            keep(*index, sim);
        }
    }

    struct Hit {
        int index;
        double score;
    };
    std::vector<Hit> hits;
    hits.reserve(kept.size());
    for (const auto& entry : kept) {
        hits.push_back({entry.first, entry.second});
    }

    std::sort(hits.begin(), hits.end(), [&snapshot](const Hit& a, const Hit& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        const Product& pa = snapshot.product(a.index).product;
        const Product& pb = snapshot.product(b.index).product;
        if (pa.name != pb.name) {
            return pa.name < pb.name;
        }
        if (pa.sku != pb.sku) {
            return pa.sku < pb.sku;
        }
        return pa.id < pb.id;
    });

    if (static_cast<int>(hits.size()) > m_config.maxCandidates) {
        hits.resize(static_cast<size_t>(m_config.maxCandidates));
    }

    std::vector<int> result;
    result.reserve(hits.size());
    for (const Hit& hit : hits) {
        result.push_back(hit.index);
    }
    return result;
}

} // namespace pm
