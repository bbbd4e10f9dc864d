#include "core/signals/alias_scorer.h"
#include "core/signals/edit_distance.h"

#include <algorithm>

namespace pm {

AliasScorer::AliasScorer(double similarityFloor)
    : m_floor(clampUnit(similarityFloor))
{
}

double AliasScorer::similarity(const PreparedQuery& query, const PreparedAlias& alias)
{
    if (query.isEmpty()) {
        return 0.0;
    }
    if (!alias.normalizedName.isEmpty() && alias.normalizedName == query.normalized) {
        return 1.0;
    }
    if (!alias.normalizedSku.isEmpty() && alias.normalizedSku == query.normalized) {
        return 1.0;
    }
    if (alias.normalizedName.isEmpty()) {
        return 0.0;
    }

    const double trigram = TrigramIndex::similarity(query.trigrams, alias.nameTrigrams);
    const double composite = EditDistance::compositeScore(query.normalized, alias.normalizedName);
    return std::max(trigram, composite);
}

bool AliasScorer::qualifies(const PreparedQuery& query, const PreparedAlias& alias) const
{
    return alias.alias.confidence > 0.0 && similarity(query, alias) > m_floor;
}

double AliasScorer::score(const PreparedQuery& query,
                          const std::vector<const PreparedAlias*>& aliases) const
{
    double best = 0.0;
    for (const PreparedAlias* alias : aliases) {
        if (!alias) {
            continue;
        }
        const double sim = similarity(query, *alias);
        if (sim <= m_floor) {
            continue;
        }
        best = std::max(best, clampUnit(alias->alias.confidence) * sim);
    }
    return clampUnit(best);
}

} // namespace pm
