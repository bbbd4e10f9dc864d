#pragma once

#include "core/shared/scoring_types.h"
#include "core/signals/prepared_text.h"

#include <optional>
#include <vector>

namespace pm {

// Learned similarity against a product's approved training examples.
//
// Only excellent/good examples inside the recency window count, and only
// when their text similarity clears a high floor. Each qualifying example is
// weighted by quality, original confidence, age and manual weight, plus a
// bonus for identical thread/length tokens. The result blends the best and
// mean weighted scores, discounts small sample counts and never reaches 1.0.
class LearnedScorer {
public:
    static constexpr double kThreadBonus = 0.3;
    static constexpr double kLengthBonus = 0.2;
    static constexpr int kDecayGraceDays = 90;
    static constexpr int kMinQueryLength = 3;

    LearnedScorer(const SignalConfig& config, double nowSeconds);

    double score(const PreparedQuery& query,
                 const std::vector<const PreparedExample*>& examples) const;

    // Weighted score for one example; nullopt when it does not qualify.
    std::optional<double> exampleScore(const PreparedQuery& query,
                                       const PreparedExample& example) const;

    static double textSimilarity(const PreparedQuery& query, const PreparedExample& example);

private:
    SignalConfig m_config;
    double m_now;
};

} // namespace pm
