#pragma once

#include "core/shared/types.h"

#include <QString>

namespace pm {

// Input value object for a single match call. limit and threshold are
// clamped by MatchEngine before tier 1 runs; out-of-range values are never
// reported back to the caller.
struct MatchQuery {
    QString text;
    QString scope = defaultScope();
    int limit = 10;
    double threshold = 0.3;
    int timeoutMs = 0; // 0 = no deadline

    static constexpr int kMinLimit = 1;
    static constexpr int kMaxLimit = 100;
};

} // namespace pm
