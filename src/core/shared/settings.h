#pragma once

#include "core/shared/scoring_types.h"

#include <QString>

namespace pm {

struct Settings {
    // Database
    QString dbPath;

    // Scope used when a request does not name one
    QString defaultScope = QStringLiteral("default");

    // Scoring, tier and retrieval tuning
    MatchConfig match;

    // Result cache
    int cacheCapacity = 256;
    int cacheTtlSeconds = 60;

    // Batch matching worker count; 0 selects hardware_concurrency clamped to [1, 8]
    int batchWorkers = 0;

    // Vector signal is skipped entirely when disabled
    bool embeddingEnabled = false;
};

} // namespace pm
