#include "core/shared/scoring_types.h"

#include <algorithm>
#include <cmath>

namespace pm {

namespace {

double clampRange(double value, double lo, double hi, double fallback)
{
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::clamp(value, lo, hi);
}

bool usableWeight(double w)
{
    return std::isfinite(w) && w >= 0.0;
}

} // anonymous namespace

MatchConfig MatchConfig::normalized() const
{
    MatchConfig out = *this;
    const MatchConfig defaults;

    MatchWeights& w = out.weights;
    const bool usable = usableWeight(w.trigram) && usableWeight(w.fuzzy)
        && usableWeight(w.alias) && usableWeight(w.learned) && usableWeight(w.vector)
        && w.sum() > 0.0;
    if (!usable) {
        w = defaults.weights;
    }
    const double total = w.sum();
    w.trigram /= total;
    w.fuzzy /= total;
    w.alias /= total;
    w.learned /= total;
    w.vector /= total;

    TierThresholds& t = out.tiers;
    t.exactSimilarity = clampRange(t.exactSimilarity, 0.0, 1.0, defaults.tiers.exactSimilarity);
    t.goodSimilarity = clampRange(t.goodSimilarity, 0.0, t.exactSimilarity,
                                  defaults.tiers.goodSimilarity);
    t.goodScoreBase = clampRange(t.goodScoreBase, 0.0, 1.0, defaults.tiers.goodScoreBase);
    t.goodScoreSpan = clampRange(t.goodScoreSpan, 0.0, 1.0 - t.goodScoreBase,
                                 defaults.tiers.goodScoreSpan);
    t.trainingRecencyDays = std::max(1, t.trainingRecencyDays);

    SignalConfig& s = out.signals;
    s.aliasFloor = clampRange(s.aliasFloor, 0.0, 1.0, defaults.signals.aliasFloor);
    s.learnedFloor = clampRange(s.learnedFloor, 0.0, 1.0, defaults.signals.learnedFloor);
    s.learnedCap = clampRange(s.learnedCap, 0.0, 1.0, defaults.signals.learnedCap);
    s.learnedRecencyDays = std::max(1, s.learnedRecencyDays);
    s.fuzzyCutoff = std::max(0, s.fuzzyCutoff);

    RetrievalConfig& r = out.retrieval;
    r.fullScanLimit = std::max(0, r.fullScanLimit);
    r.retrievalFloor = clampRange(r.retrievalFloor, 0.0, 1.0, defaults.retrieval.retrievalFloor);
    r.relaxedFloor = clampRange(r.relaxedFloor, 0.0, 1.0, defaults.retrieval.relaxedFloor);
    r.maxCandidates = std::max(1, r.maxCandidates);

    return out;
}

} // namespace pm
