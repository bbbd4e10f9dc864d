#include "core/signals/prepared_text.h"

namespace pm {

PreparedQuery prepareQuery(const QString& text)
{
    PreparedQuery query;
    query.literal = text;
    query.lowered = text.trimmed().toLower();
    query.normalized = TextNormalizer::normalize(text);
    query.trigrams = TrigramIndex::extract(query.normalized);
    query.literalTrigrams = TrigramIndex::extract(query.lowered);
    query.dimensions = TextNormalizer::dimensionTokens(query.normalized);
    return query;
}

PreparedAlias prepareAlias(const Alias& alias)
{
    PreparedAlias prepared;
    prepared.alias = alias;
    prepared.normalizedName = TextNormalizer::normalize(alias.competitorName);
    prepared.normalizedSku = TextNormalizer::normalize(alias.competitorSku);
    prepared.nameTrigrams = TrigramIndex::extract(prepared.normalizedName);
    return prepared;
}

PreparedExample prepareExample(const TrainingExample& example)
{
    PreparedExample prepared;
    prepared.example = example;
    if (prepared.example.normalizedText.isEmpty()) {
        prepared.example.normalizedText = TextNormalizer::normalize(example.queryText);
    }
    prepared.normalizedTrigrams = TrigramIndex::extract(prepared.example.normalizedText);
    prepared.literalTrigrams = TrigramIndex::extract(example.queryText.trimmed().toLower());
    prepared.dimensions = TextNormalizer::dimensionTokens(prepared.example.normalizedText);
    return prepared;
}

} // namespace pm
