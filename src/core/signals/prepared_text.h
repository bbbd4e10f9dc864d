#pragma once

#include "core/shared/types.h"
#include "core/signals/trigram_index.h"
#include "core/text/text_normalizer.h"

#include <QString>

#include <optional>
#include <vector>

namespace pm {

// Query text with everything the scorers need precomputed once per call.
struct PreparedQuery {
    QString literal;
    QString lowered;           // literal, lowercased and trimmed
    QString normalized;
    TrigramSet trigrams;       // of normalized
    TrigramSet literalTrigrams;
    DimensionTokens dimensions;
    std::optional<std::vector<float>> embedding;

    bool isEmpty() const { return normalized.isEmpty(); }
};

struct PreparedAlias {
    Alias alias;
    QString normalizedName;
    QString normalizedSku;
    TrigramSet nameTrigrams;
};

struct PreparedExample {
    TrainingExample example;
    TrigramSet normalizedTrigrams;
    TrigramSet literalTrigrams;
    DimensionTokens dimensions;
};

PreparedQuery prepareQuery(const QString& text);
PreparedAlias prepareAlias(const Alias& alias);
PreparedExample prepareExample(const TrainingExample& example);

} // namespace pm
