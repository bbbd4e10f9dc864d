#include "core/match/catalog_snapshot.h"
#include "core/text/text_normalizer.h"

#include <algorithm>
#include <utility>

namespace pm {

namespace {

TrigramSet unionOf(const TrigramSet& a, const TrigramSet& b, const TrigramSet& c)
{
    TrigramSet merged;
    merged.reserve(a.size() + b.size() + c.size());
    merged.insert(merged.end(), a.begin(), a.end());
    merged.insert(merged.end(), b.begin(), b.end());
    merged.insert(merged.end(), c.begin(), c.end());
    std::sort(merged.begin(), merged.end());
    merged.erase(std::unique(merged.begin(), merged.end()), merged.end());
    return merged;
}

} // anonymous namespace

std::shared_ptr<const CatalogSnapshot::ProductCatalog> CatalogSnapshot::buildCatalog(
    std::vector<Product> products, const QHash<QString, std::vector<float>>& embeddings)
{
    auto catalog = std::make_shared<ProductCatalog>();
    catalog->products.reserve(products.size());

    for (Product& product : products) {
        if (catalog->byId.contains(product.id)) {
            continue;
        }
        IndexedProduct indexed;
        indexed.normalizedName = TextNormalizer::normalize(product.name);
        indexed.normalizedSku = TextNormalizer::normalize(product.sku);
        indexed.normalizedManufacturer = TextNormalizer::normalize(product.manufacturer);
        indexed.nameTrigrams = TrigramIndex::extract(indexed.normalizedName);
        indexed.skuTrigrams = TrigramIndex::extract(indexed.normalizedSku);
        indexed.manufacturerTrigrams = TrigramIndex::extract(indexed.normalizedManufacturer);
        indexed.allTrigrams = unionOf(indexed.nameTrigrams, indexed.skuTrigrams,
                                      indexed.manufacturerTrigrams);
        const auto embedding = embeddings.constFind(product.id);
        if (embedding != embeddings.constEnd()) {
            indexed.embedding = embedding.value();
        }
        indexed.product = std::move(product);

        catalog->byId.insert(indexed.product.id, static_cast<int>(catalog->products.size()));
        catalog->products.push_back(std::move(indexed));
    }

    std::vector<const TrigramSet*> documents;
    documents.reserve(catalog->products.size());
    for (const IndexedProduct& indexed : catalog->products) {
        documents.push_back(&indexed.allTrigrams);
    }
    catalog->index.build(documents);
    return catalog;
}

std::shared_ptr<const CatalogSnapshot::AliasSet> CatalogSnapshot::buildAliases(
    std::vector<PreparedAlias> aliases, const ProductCatalog& catalog)
{
    auto set = std::make_shared<AliasSet>();
    set->aliases = std::move(aliases);
    set->byProduct.resize(catalog.products.size());
    for (const PreparedAlias& alias : set->aliases) {
        const auto it = catalog.byId.constFind(alias.alias.productId);
        if (it != catalog.byId.constEnd()) {
            set->byProduct[static_cast<size_t>(it.value())].push_back(&alias);
        }
    }
    return set;
}

std::shared_ptr<const CatalogSnapshot::TrainingSet> CatalogSnapshot::buildTraining(
    std::vector<PreparedExample> examples, const ProductCatalog& catalog)
{
    auto set = std::make_shared<TrainingSet>();
    set->examples = std::move(examples);
    set->byProduct.resize(catalog.products.size());
    for (const PreparedExample& example : set->examples) {
        const auto it = catalog.byId.constFind(example.example.productId);
        if (it != catalog.byId.constEnd()) {
            set->byProduct[static_cast<size_t>(it.value())].push_back(&example);
        }
    }
    return set;
}

std::shared_ptr<const CatalogSnapshot> CatalogSnapshot::build(Contents contents, uint64_t version)
{
    std::shared_ptr<CatalogSnapshot> snapshot(new CatalogSnapshot());
    snapshot->m_scope = contents.scope;
    snapshot->m_version = version;
    snapshot->m_catalog = buildCatalog(std::move(contents.products), contents.embeddings);

    std::vector<PreparedAlias> aliases;
    aliases.reserve(contents.aliases.size());
    for (const Alias& alias : contents.aliases) {
        aliases.push_back(prepareAlias(alias));
    }
    snapshot->m_aliases = buildAliases(std::move(aliases), *snapshot->m_catalog);

    std::vector<PreparedExample> examples;
    examples.reserve(contents.examples.size());
    for (const TrainingExample& example : contents.examples) {
        examples.push_back(prepareExample(example));
    }
    snapshot->m_training = buildTraining(std::move(examples), *snapshot->m_catalog);

    return snapshot;
}

std::shared_ptr<const CatalogSnapshot> CatalogSnapshot::withTrainingExample(
    const TrainingExample& example, uint64_t version) const
{
    std::vector<PreparedExample> examples;
    examples.reserve(m_training->examples.size() + 1);
    bool replaced = false;
    for (const PreparedExample& existing : m_training->examples) {
        if (existing.example.id == example.id) {
            examples.push_back(prepareExample(example));
            replaced = true;
        } else {
            examples.push_back(existing);
        }
    }
    if (!replaced) {
        examples.push_back(prepareExample(example));
    }

    std::shared_ptr<CatalogSnapshot> snapshot(new CatalogSnapshot());
    snapshot->m_scope = m_scope;
    snapshot->m_version = version;
    snapshot->m_catalog = m_catalog;
    snapshot->m_aliases = m_aliases;
    snapshot->m_training = buildTraining(std::move(examples), *m_catalog);
    return snapshot;
}

std::shared_ptr<const CatalogSnapshot> CatalogSnapshot::withAlias(const Alias& alias,
                                                                  uint64_t version) const
{
    std::vector<PreparedAlias> aliases;
    aliases.reserve(m_aliases->aliases.size() + 1);
    bool replaced = false;
    for (const PreparedAlias& existing : m_aliases->aliases) {
        if (alias.id != 0 && existing.alias.id == alias.id) {
            aliases.push_back(prepareAlias(alias));
            replaced = true;
        } else {
            aliases.push_back(existing);
        }
    }
    if (!replaced) {
        aliases.push_back(prepareAlias(alias));
    }

    std::shared_ptr<CatalogSnapshot> snapshot(new CatalogSnapshot());
    snapshot->m_scope = m_scope;
    snapshot->m_version = version;
    snapshot->m_catalog = m_catalog;
    snapshot->m_aliases = buildAliases(std::move(aliases), *m_catalog);
    snapshot->m_training = m_training;
    return snapshot;
}

std::optional<int> CatalogSnapshot::productIndex(const QString& productId) const
{
    const auto it = m_catalog->byId.constFind(productId);
    if (it == m_catalog->byId.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

const std::vector<const PreparedAlias*>& CatalogSnapshot::aliasesFor(int productIndex) const
{
    static const std::vector<const PreparedAlias*> kEmpty;
    if (productIndex < 0 || static_cast<size_t>(productIndex) >= m_aliases->byProduct.size()) {
        return kEmpty;
    }
    return m_aliases->byProduct[static_cast<size_t>(productIndex)];
}

const std::vector<const PreparedExample*>& CatalogSnapshot::examplesFor(int productIndex) const
{
    static const std::vector<const PreparedExample*> kEmpty;
    if (productIndex < 0 || static_cast<size_t>(productIndex) >= m_training->byProduct.size()) {
        return kEmpty;
    }
    return m_training->byProduct[static_cast<size_t>(productIndex)];
}

} // namespace pm
