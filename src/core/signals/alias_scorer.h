#pragma once

#include "core/signals/prepared_text.h"

#include <vector>

namespace pm {

// Alias boost: max(confidence * similarity) over a product's aliases whose
// similarity to the query clears the floor.
class AliasScorer {
public:
    explicit AliasScorer(double similarityFloor = 0.25);

    double score(const PreparedQuery& query,
                 const std::vector<const PreparedAlias*>& aliases) const;

    // 1.0 on exact normalized name or SKU equality, else the better of
    // trigram and composite fuzzy similarity against the alias name.
    static double similarity(const PreparedQuery& query, const PreparedAlias& alias);

    // Whether the alias alone would contribute a non-zero boost.
    bool qualifies(const PreparedQuery& query, const PreparedAlias& alias) const;

private:
    double m_floor;
};

} // namespace pm
