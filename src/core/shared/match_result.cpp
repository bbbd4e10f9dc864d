#include "core/shared/match_result.h"

namespace pm {

QString matchTierToString(MatchTier tier)
{
    switch (tier) {
    case MatchTier::TrainingExact: return QStringLiteral("training_exact");
    case MatchTier::TrainingGood:  return QStringLiteral("training_good");
    case MatchTier::Algorithmic:   return QStringLiteral("algorithmic");
    case MatchTier::FallbackFuzzy: return QStringLiteral("fallback_fuzzy");
    }
    return QStringLiteral("algorithmic");
}

QString matchStatusToString(MatchStatus status)
{
    switch (status) {
    case MatchStatus::Ok:                 return QStringLiteral("ok");
    case MatchStatus::CatalogUnavailable: return QStringLiteral("catalog_unavailable");
    case MatchStatus::TimedOut:           return QStringLiteral("timed_out");
    }
    return QStringLiteral("ok");
}

QJsonObject candidateToJson(const MatchCandidate& candidate)
{
    QJsonObject json;
    json[QStringLiteral("product_id")] = candidate.productId;
    json[QStringLiteral("sku")] = candidate.sku;
    json[QStringLiteral("name")] = candidate.name;
    json[QStringLiteral("manufacturer")] = candidate.manufacturer;
    json[QStringLiteral("vector_score")] = candidate.scores.vector;
    json[QStringLiteral("trigram_score")] = candidate.scores.trigram;
    json[QStringLiteral("fuzzy_score")] = candidate.scores.fuzzy;
    json[QStringLiteral("alias_score")] = candidate.scores.alias;
    json[QStringLiteral("learned_score")] = candidate.scores.learned;
    json[QStringLiteral("final_score")] = candidate.finalScore;
    json[QStringLiteral("matched_via")] = candidate.matchedVia();
    if (!candidate.dominantSignal.isEmpty()) {
        json[QStringLiteral("dominant_signal")] = candidate.dominantSignal;
    }
    json[QStringLiteral("reasoning")] = candidate.reasoning;
    if (candidate.trainingExampleId.has_value()) {
        json[QStringLiteral("training_example_id")] =
            static_cast<qint64>(*candidate.trainingExampleId);
    }
    return json;
}

} // namespace pm
