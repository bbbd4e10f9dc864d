#include "core/signals/learned_scorer.h"
#include "core/signals/edit_distance.h"

#include <algorithm>
#include <cmath>

namespace pm {

namespace {

constexpr double kSecondsPerDay = 86400.0;
constexpr double kExcellentMultiplier = 1.2;
constexpr double kGoodMultiplier = 1.1;
constexpr double kHighConfidence = 0.8;
constexpr double kHighConfidenceMultiplier = 1.1;
constexpr double kBestShare = 0.8;
constexpr double kMeanShare = 0.2;

} // anonymous namespace

LearnedScorer::LearnedScorer(const SignalConfig& config, double nowSeconds)
    : m_config(config)
    , m_now(nowSeconds)
{
}

double LearnedScorer::textSimilarity(const PreparedQuery& query, const PreparedExample& example)
{
    if (query.normalized == example.example.normalizedText) {
        return 1.0;
    }
    const double normalizedTrigram =
        TrigramIndex::similarity(query.trigrams, example.normalizedTrigrams);
    const double literalTrigram =
        TrigramIndex::similarity(query.literalTrigrams, example.literalTrigrams);
    const double fuzzy = EditDistance::fuzzyScore(query.normalized, example.example.normalizedText);
    const double composite =
        EditDistance::compositeScore(query.normalized, example.example.normalizedText);
    return std::max({normalizedTrigram, literalTrigram, fuzzy, composite});
}

std::optional<double> LearnedScorer::exampleScore(const PreparedQuery& query,
                                                  const PreparedExample& example) const
{
    const TrainingExample& ex = example.example;
    if (!isHighQuality(ex.quality)) {
        return std::nullopt;
    }

    const double ageDays = std::max(0.0, (m_now - ex.approvedAt) / kSecondsPerDay);
    if (ageDays > m_config.learnedRecencyDays) {
        return std::nullopt;
    }

    const double sim = textSimilarity(query, example);
    if (sim < m_config.learnedFloor) {
        return std::nullopt;
    }

    double bonus = 0.0;
    if (!query.dimensions.thread.isEmpty() && query.dimensions.thread == example.dimensions.thread) {
        bonus += kThreadBonus;
    }
    if (!query.dimensions.length.isEmpty() && query.dimensions.length == example.dimensions.length) {
        bonus += kLengthBonus;
    }

    double weighted = sim + bonus;
    weighted *= ex.quality == MatchQuality::Excellent ? kExcellentMultiplier : kGoodMultiplier;
    if (ex.confidence > kHighConfidence) {
        weighted *= kHighConfidenceMultiplier;
    }
    if (ageDays > kDecayGraceDays) {
        weighted *= std::max(0.0, 1.0 - (ageDays - kDecayGraceDays) / 365.0);
    }
    weighted *= std::max(0.0, ex.weight);
    return weighted;
}

double LearnedScorer::score(const PreparedQuery& query,
                            const std::vector<const PreparedExample*>& examples) const
{
    if (query.normalized.length() < kMinQueryLength) {
        return 0.0;
    }

    double best = 0.0;
    double total = 0.0;
    int count = 0;
    for (const PreparedExample* example : examples) {
        if (!example) {
            continue;
        }
        const std::optional<double> weighted = exampleScore(query, *example);
        if (!weighted.has_value()) {
            continue;
        }
        best = std::max(best, *weighted);
        total += *weighted;
        ++count;
    }
    if (count == 0) {
        return 0.0;
    }

    const double blended = kBestShare * best + kMeanShare * (total / count);
    const double diminishing = 1.0 - std::exp(-static_cast<double>(count) / 3.0);
    const double result = std::min(blended * diminishing, m_config.learnedCap);
    return clampUnit(result);
}

} // namespace pm
