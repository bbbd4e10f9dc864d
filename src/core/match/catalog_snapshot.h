#pragma once

#include "core/shared/types.h"
#include "core/signals/prepared_text.h"
#include "core/signals/trigram_index.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace pm {

// Product with the normalized text and trigram sets of every field the
// lexical signals compare against.
struct IndexedProduct {
    Product product;
    QString normalizedName;
    QString normalizedSku;
    QString normalizedManufacturer;
    TrigramSet nameTrigrams;
    TrigramSet skuTrigrams;
    TrigramSet manufacturerTrigrams;
    TrigramSet allTrigrams;  // union, used for the inverted index
    std::vector<float> embedding;
};

// Immutable, versioned view of one scope's products, aliases and training
// examples. Shared between concurrent match calls as
// std::shared_ptr<const CatalogSnapshot>; never mutated after construction.
class CatalogSnapshot {
public:
    struct Contents {
        QString scope;
        std::vector<Product> products;
        std::vector<Alias> aliases;
        std::vector<TrainingExample> examples;
        QHash<QString, std::vector<float>> embeddings;
    };

    static std::shared_ptr<const CatalogSnapshot> build(Contents contents, uint64_t version);

    // New snapshot sharing this one's products and aliases, with `example`
    // inserted or replacing the row that has the same id.
    std::shared_ptr<const CatalogSnapshot> withTrainingExample(const TrainingExample& example,
                                                               uint64_t version) const;

    // New snapshot sharing products and examples, with `alias` applied.
    std::shared_ptr<const CatalogSnapshot> withAlias(const Alias& alias, uint64_t version) const;

    const QString& scope() const { return m_scope; }
    uint64_t version() const { return m_version; }

    int productCount() const { return static_cast<int>(m_catalog->products.size()); }
    const IndexedProduct& product(int index) const { return m_catalog->products[index]; }
    std::optional<int> productIndex(const QString& productId) const;

    const TrigramIndex& trigramIndex() const { return m_catalog->index; }

    const std::vector<PreparedExample>& examples() const { return m_training->examples; }
    const std::vector<PreparedAlias>& aliases() const { return m_aliases->aliases; }

    // Per-product views (product index -> entries).
    const std::vector<const PreparedAlias*>& aliasesFor(int productIndex) const;
    const std::vector<const PreparedExample*>& examplesFor(int productIndex) const;

private:
    struct ProductCatalog {
        std::vector<IndexedProduct> products;
        QHash<QString, int> byId;
        TrigramIndex index;
    };

    struct AliasSet {
        std::vector<PreparedAlias> aliases;
        std::vector<std::vector<const PreparedAlias*>> byProduct;
    };

    struct TrainingSet {
        std::vector<PreparedExample> examples;
        std::vector<std::vector<const PreparedExample*>> byProduct;
    };

    CatalogSnapshot() = default;

    static std::shared_ptr<const ProductCatalog> buildCatalog(
        std::vector<Product> products, const QHash<QString, std::vector<float>>& embeddings);
    static std::shared_ptr<const AliasSet> buildAliases(std::vector<PreparedAlias> aliases,
                                                        const ProductCatalog& catalog);
    static std::shared_ptr<const TrainingSet> buildTraining(std::vector<PreparedExample> examples,
                                                            const ProductCatalog& catalog);

    QString m_scope;
    uint64_t m_version = 0;
    std::shared_ptr<const ProductCatalog> m_catalog;
    std::shared_ptr<const AliasSet> m_aliases;
    std::shared_ptr<const TrainingSet> m_training;
};

using SnapshotPtr = std::shared_ptr<const CatalogSnapshot>;

} // namespace pm
