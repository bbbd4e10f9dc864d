#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace pm {

// CatalogStore: owner of the SQLite database holding products, aliases,
// training examples and product embeddings, all partitioned by scope.
//
// The connection is opened in serialized mode so the match engine and the
// feedback recorder may share one store across threads. Every write is a
// single statement; callers never need a transaction for consistency.
class CatalogStore {
public:
    ~CatalogStore();

    // Move-only (owns sqlite3* handle)
    CatalogStore(CatalogStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    CatalogStore& operator=(CatalogStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and applies migrations on open.
    static std::optional<CatalogStore> open(const QString& dbPath);

    // ── Products ────────────────────────────────────────────

    // Catalog CRUD belongs to external tooling; this exists for fixtures.
    bool upsertProduct(const Product& product);

    // nullopt when the products table cannot be read.
    std::optional<std::vector<Product>> loadProducts(const QString& scope);
    std::optional<Product> getProduct(const QString& scope, const QString& productId);
    std::optional<Product> findProductBySku(const QString& scope, const QString& sku);
    int productCount(const QString& scope);

    // ── Aliases ─────────────────────────────────────────────

    // Upsert keyed on (scope, normalized competitor name, product id).
    // Confidence only ever rises on conflict. Returns the stored row.
    std::optional<Alias> upsertAlias(const Alias& alias);
    std::optional<std::vector<Alias>> loadAliases(const QString& scope);

    // ── Training examples ───────────────────────────────────

    // Upsert keyed on (scope, normalized text, product id). On conflict the
    // literal text, scores, quality, confidence and approval time are
    // replaced; weight and reference counters are kept.
    std::optional<TrainingExample> upsertTrainingExample(const TrainingExample& example);
    std::optional<std::vector<TrainingExample>> loadTrainingExamples(const QString& scope);
    std::optional<TrainingExample> getTrainingExample(int64_t id);
    bool setTrainingWeight(int64_t id, double weight);

    // times_referenced += 1, last_referenced_at = now.
    bool touchTrainingExample(int64_t id, double now);

    // ── Embeddings ──────────────────────────────────────────

    bool setProductEmbedding(const QString& scope, const QString& productId,
                             const std::vector<float>& vector);
    std::optional<QHash<QString, std::vector<float>>> loadProductEmbeddings(const QString& scope);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    CatalogStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    int stepWithRetry(sqlite3_stmt* stmt);
    std::optional<TrainingExample> findTrainingExample(const QString& scope,
                                                       const QString& normalizedText,
                                                       const QString& productId);

    sqlite3* m_db = nullptr;
};

} // namespace pm
