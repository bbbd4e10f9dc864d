#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace pm {

// Priority levels of the matching state machine, highest first.
enum class MatchTier {
    TrainingExact,   // final_score fixed at 1.0
    TrainingGood,    // final_score scaled into [0.85, 0.95)
    Algorithmic,     // weighted signal combination, final_score >= threshold
    FallbackFuzzy,   // relaxed retrieval, final_score floored at threshold
};

QString matchTierToString(MatchTier tier);

struct MatchCandidate {
    QString productId;
    QString sku;
    QString name;
    QString manufacturer;
    SignalScores scores;
    double finalScore = 0.0;
    MatchTier tier = MatchTier::Algorithmic;
    QString dominantSignal;
    QString reasoning;
    std::optional<int64_t> trainingExampleId;

    QString matchedVia() const { return matchTierToString(tier); }
};

enum class MatchStatus {
    Ok,
    CatalogUnavailable,
    TimedOut,
};

QString matchStatusToString(MatchStatus status);

struct MatchOutcome {
    MatchStatus status = MatchStatus::Ok;
    std::vector<MatchCandidate> candidates;
    // Tier that produced the candidates; unset when the result is empty.
    std::optional<MatchTier> tier;
    uint64_t snapshotVersion = 0;
    bool fromCache = false;

    bool ok() const { return status == MatchStatus::Ok; }
};

struct BatchMatchResult {
    int queryIndex = 0;
    QString queryText;
    MatchOutcome outcome;
};

QJsonObject candidateToJson(const MatchCandidate& candidate);

} // namespace pm
