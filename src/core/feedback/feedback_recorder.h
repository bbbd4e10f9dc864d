#pragma once

#include "core/shared/types.h"

#include <QString>

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace pm {

class CatalogStore;
class MatchEngine;

// Turns human approvals into training examples (and, for high-quality
// approvals, aliases) that the next match call consults.
class FeedbackRecorder {
public:
    struct Approval {
        QString scope = defaultScope();
        QString lineItemText;
        QString productId;
        std::optional<SignalScores> scores;
        std::optional<double> finalScore;
        MatchQuality quality = MatchQuality::Good;
        double confidence = 0.8;
    };

    static constexpr int kMaxAttempts = 3;
    static constexpr int kMinAliasLength = 4;

    // `engine` may be null; approvals are then only persisted.
    FeedbackRecorder(CatalogStore* store, MatchEngine* engine = nullptr);

    // Idempotent upsert keyed on (scope, normalized text, product id).
    // Returns the stored row, or nullopt when the product is unknown or the
    // write failed after all retries. With `publish` false the engine is left
    // untouched and the caller reloads once after a batch of approvals.
    std::optional<TrainingExample> recordApproval(const Approval& approval, bool publish = true);

    // Best-effort usage counter; failures are logged, never propagated.
    bool touchReference(int64_t exampleId);

    static bool qualifiesForAlias(const Approval& approval);

    void setClock(std::function<double()> clock) { m_clock = std::move(clock); }
    MatchEngine* engine() const { return m_engine; }

private:
    static constexpr int kStripeCount = 64;

    std::mutex& stripeFor(const QString& scope, const QString& normalized,
                          const QString& productId);
    double now() const;

    CatalogStore* m_store = nullptr;
    MatchEngine* m_engine = nullptr;
    std::function<double()> m_clock;
    std::array<std::mutex, kStripeCount> m_stripes;
};

} // namespace pm
