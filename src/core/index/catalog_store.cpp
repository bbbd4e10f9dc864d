#include "core/index/catalog_store.h"
#include "core/index/schema.h"
#include "core/index/migration.h"
#include "core/shared/logging.h"
#include "core/text/text_normalizer.h"

#include <QDateTime>
#include <QFile>
#include <QThread>

#include <cstring>

namespace pm {

namespace {

constexpr const char* kTrainingColumns = R"(
    id, scope, query_text, normalized_text, product_id, product_sku, product_name,
    trigram_score, fuzzy_score, alias_score, learned_score, vector_score, final_score,
    quality, confidence, weight, times_referenced, approved_at, last_referenced_at
)";

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return val ? QString::fromUtf8(val) : QString();
}

Product readProduct(sqlite3_stmt* stmt)
{
    Product product;
    product.scope = columnText(stmt, 0);
    product.id = columnText(stmt, 1);
    product.sku = columnText(stmt, 2);
    product.name = columnText(stmt, 3);
    product.manufacturer = columnText(stmt, 4);
    product.category = columnText(stmt, 5);
    product.description = columnText(stmt, 6);
    return product;
}

Alias readAlias(sqlite3_stmt* stmt)
{
    Alias alias;
    alias.id = sqlite3_column_int64(stmt, 0);
    alias.scope = columnText(stmt, 1);
    alias.productId = columnText(stmt, 2);
    alias.competitorName = columnText(stmt, 3);
    alias.competitorSku = columnText(stmt, 4);
    alias.confidence = sqlite3_column_double(stmt, 5);
    alias.createdAt = sqlite3_column_double(stmt, 6);
    return alias;
}

TrainingExample readTrainingExample(sqlite3_stmt* stmt)
{
    TrainingExample ex;
    ex.id = sqlite3_column_int64(stmt, 0);
    ex.scope = columnText(stmt, 1);
    ex.queryText = columnText(stmt, 2);
    ex.normalizedText = columnText(stmt, 3);
    ex.productId = columnText(stmt, 4);
    ex.productSku = columnText(stmt, 5);
    ex.productName = columnText(stmt, 6);
    ex.scores.trigram = sqlite3_column_double(stmt, 7);
    ex.scores.fuzzy = sqlite3_column_double(stmt, 8);
    ex.scores.alias = sqlite3_column_double(stmt, 9);
    ex.scores.learned = sqlite3_column_double(stmt, 10);
    ex.scores.vector = sqlite3_column_double(stmt, 11);
    ex.finalScore = sqlite3_column_double(stmt, 12);
    ex.quality = matchQualityFromString(columnText(stmt, 13));
    ex.confidence = sqlite3_column_double(stmt, 14);
    ex.weight = sqlite3_column_double(stmt, 15);
    ex.timesReferenced = sqlite3_column_int(stmt, 16);
    ex.approvedAt = sqlite3_column_double(stmt, 17);
    if (sqlite3_column_type(stmt, 18) != SQLITE_NULL) {
        ex.lastReferencedAt = sqlite3_column_double(stmt, 18);
    }
    return ex;
}

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

} // anonymous namespace

CatalogStore::~CatalogStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<CatalogStore> CatalogStore::open(const QString& dbPath)
{
    CatalogStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool CatalogStore::init(const QString& dbPath)
{
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(pmStore, "Failed to open database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    // Busy handler must be active before any SQL runs.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(pmStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='products'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(pmStore, "Failed to set database pragmas");
            return false;
        }

        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
                && sqlite3_step(stmt) == SQLITE_ROW) {
                const QString mode = columnText(stmt, 0);
                if (mode != QLatin1String("wal")) {
                    LOG_WARN(pmStore, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
                }
            }
            sqlite3_finalize(stmt);
        }

        if (!execSql(kSchemaV1)) {
            LOG_ERROR(pmStore, "Failed to create schema");
            return false;
        }

        if (!execSql(kDefaultSettings)) {
            LOG_ERROR(pmStore, "Failed to insert default settings");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(pmStore, "Migration failed");
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    if (dbFile.exists() && !dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner)) {
        LOG_WARN(pmStore, "Failed to restrict permissions on %s", qUtf8Printable(dbPath));
    }

    LOG_INFO(pmStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool CatalogStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(pmStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

int CatalogStore::stepWithRetry(sqlite3_stmt* stmt)
{
    // The busy handler is skipped when SQLite detects a potential WAL
    // deadlock, so SQLITE_BUSY is retried here as well.
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
        }
        rc = sqlite3_step(stmt);
    }
    return rc;
}

// ── Products ────────────────────────────────────────────────

bool CatalogStore::upsertProduct(const Product& product)
{
    if (product.id.isEmpty() || product.scope.isEmpty()) {
        LOG_WARN(pmStore, "upsertProduct: product id and scope are required");
        return false;
    }

    const char* sql = R"(
        INSERT INTO products (scope, id, sku, name, manufacturer, category, description, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        ON CONFLICT(scope, id) DO UPDATE SET
            sku = excluded.sku,
            name = excluded.name,
            manufacturer = excluded.manufacturer,
            category = excluded.category,
            description = excluded.description,
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "upsertProduct prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray scopeUtf8 = product.scope.toUtf8();
    const QByteArray idUtf8 = product.id.toUtf8();
    const QByteArray skuUtf8 = product.sku.toUtf8();
    const QByteArray nameUtf8 = product.name.toUtf8();
    const QByteArray mfrUtf8 = product.manufacturer.toUtf8();
    const QByteArray categoryUtf8 = product.category.toUtf8();
    const QByteArray descUtf8 = product.description.toUtf8();

    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, skuUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, mfrUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, categoryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 7, descUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 8, nowSeconds());

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "upsertProduct step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<std::vector<Product>> CatalogStore::loadProducts(const QString& scope)
{
    const char* sql = R"(
        SELECT scope, id, sku, name, manufacturer, category, description
        FROM products WHERE scope = ?1 ORDER BY id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "loadProducts prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);

    std::vector<Product> products;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        products.push_back(readProduct(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "loadProducts step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return products;
}

std::optional<Product> CatalogStore::getProduct(const QString& scope, const QString& productId)
{
    const char* sql = R"(
        SELECT scope, id, sku, name, manufacturer, category, description
        FROM products WHERE scope = ?1 AND id = ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    const QByteArray idUtf8 = productId.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<Product> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readProduct(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<Product> CatalogStore::findProductBySku(const QString& scope, const QString& sku)
{
    const char* sql = R"(
        SELECT scope, id, sku, name, manufacturer, category, description
        FROM products WHERE scope = ?1 AND sku = ?2 COLLATE NOCASE
        ORDER BY id LIMIT 1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    const QByteArray skuUtf8 = sku.trimmed().toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, skuUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<Product> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readProduct(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

int CatalogStore::productCount(const QString& scope)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM products WHERE scope = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Aliases ─────────────────────────────────────────────────

std::optional<Alias> CatalogStore::upsertAlias(const Alias& alias)
{
    const QString normalizedName = TextNormalizer::normalize(alias.competitorName);
    if (normalizedName.isEmpty() || alias.productId.isEmpty()) {
        LOG_WARN(pmStore, "upsertAlias: empty alias name or product id");
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO aliases (scope, product_id, competitor_name, normalized_name,
                             competitor_sku, confidence, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(scope, normalized_name, product_id) DO UPDATE SET
            competitor_name = excluded.competitor_name,
            competitor_sku = CASE WHEN excluded.competitor_sku <> ''
                                  THEN excluded.competitor_sku ELSE aliases.competitor_sku END,
            confidence = MAX(aliases.confidence, excluded.confidence)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "upsertAlias prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QString scope = alias.scope.isEmpty() ? defaultScope() : alias.scope;
    const QByteArray scopeUtf8 = scope.toUtf8();
    const QByteArray productUtf8 = alias.productId.toUtf8();
    const QByteArray nameUtf8 = alias.competitorName.trimmed().toUtf8();
    const QByteArray normUtf8 = normalizedName.toUtf8();
    const QByteArray skuUtf8 = alias.competitorSku.trimmed().toUtf8();
    const double createdAt = alias.createdAt > 0.0 ? alias.createdAt : nowSeconds();

    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, productUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, normUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, skuUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 6, clampUnit(alias.confidence));
    sqlite3_bind_double(stmt, 7, createdAt);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "upsertAlias step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    // Re-read the row; last_insert_rowid is stale when the conflict branch ran.
    const char* rowSql = R"(
        SELECT id, scope, product_id, competitor_name, competitor_sku, confidence, created_at
        FROM aliases WHERE scope = ?1 AND normalized_name = ?2 AND product_id = ?3
    )";
    if (sqlite3_prepare_v2(m_db, rowSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, normUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, productUtf8.constData(), -1, SQLITE_STATIC);
    std::optional<Alias> stored;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stored = readAlias(stmt);
    }
    sqlite3_finalize(stmt);
    return stored;
}

std::optional<std::vector<Alias>> CatalogStore::loadAliases(const QString& scope)
{
    const char* sql = R"(
        SELECT id, scope, product_id, competitor_name, competitor_sku, confidence, created_at
        FROM aliases WHERE scope = ?1 ORDER BY id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "loadAliases prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);

    std::vector<Alias> aliases;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        aliases.push_back(readAlias(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "loadAliases step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return aliases;
}

// ── Training examples ───────────────────────────────────────

std::optional<TrainingExample> CatalogStore::upsertTrainingExample(const TrainingExample& example)
{
    const QString normalized = example.normalizedText.isEmpty()
        ? TextNormalizer::normalize(example.queryText)
        : example.normalizedText;
    if (normalized.isEmpty() || example.productId.isEmpty()) {
        LOG_WARN(pmStore, "upsertTrainingExample: empty text or product id");
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO training_examples (
            scope, query_text, normalized_text, product_id, product_sku, product_name,
            trigram_score, fuzzy_score, alias_score, learned_score, vector_score, final_score,
            quality, confidence, weight, approved_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16)
        ON CONFLICT(scope, normalized_text, product_id) DO UPDATE SET
            query_text = excluded.query_text,
            product_sku = excluded.product_sku,
            product_name = excluded.product_name,
            trigram_score = excluded.trigram_score,
            fuzzy_score = excluded.fuzzy_score,
            alias_score = excluded.alias_score,
            learned_score = excluded.learned_score,
            vector_score = excluded.vector_score,
            final_score = excluded.final_score,
            quality = excluded.quality,
            confidence = excluded.confidence,
            approved_at = excluded.approved_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "upsertTrainingExample prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QString scope = example.scope.isEmpty() ? defaultScope() : example.scope;
    SignalScores scores = example.scores;
    scores.clamp();

    const QByteArray scopeUtf8 = scope.toUtf8();
    const QByteArray textUtf8 = example.queryText.toUtf8();
    const QByteArray normUtf8 = normalized.toUtf8();
    const QByteArray productUtf8 = example.productId.toUtf8();
    const QByteArray skuUtf8 = example.productSku.toUtf8();
    const QByteArray nameUtf8 = example.productName.toUtf8();
    const QByteArray qualityUtf8 = matchQualityToString(example.quality).toUtf8();
    const double approvedAt = example.approvedAt > 0.0 ? example.approvedAt : nowSeconds();

    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, textUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, normUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, productUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, skuUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 7, scores.trigram);
    sqlite3_bind_double(stmt, 8, scores.fuzzy);
    sqlite3_bind_double(stmt, 9, scores.alias);
    sqlite3_bind_double(stmt, 10, scores.learned);
    sqlite3_bind_double(stmt, 11, scores.vector);
    sqlite3_bind_double(stmt, 12, clampUnit(example.finalScore));
    sqlite3_bind_text(stmt, 13, qualityUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 14, clampUnit(example.confidence));
    sqlite3_bind_double(stmt, 15, example.weight > 0.0 ? example.weight : 1.0);
    sqlite3_bind_double(stmt, 16, approvedAt);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "upsertTrainingExample step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    auto row = findTrainingExample(scope, normalized, example.productId);
    if (!row.has_value()) {
        LOG_ERROR(pmStore, "upsertTrainingExample: row not found after successful upsert");
    }
    return row;
}

std::optional<TrainingExample> CatalogStore::findTrainingExample(const QString& scope,
                                                                 const QString& normalizedText,
                                                                 const QString& productId)
{
    const QByteArray sql = QByteArray("SELECT ") + kTrainingColumns
        + " FROM training_examples WHERE scope = ?1 AND normalized_text = ?2 AND product_id = ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    const QByteArray normUtf8 = normalizedText.toUtf8();
    const QByteArray productUtf8 = productId.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, normUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, productUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<TrainingExample> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readTrainingExample(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<TrainingExample> CatalogStore::getTrainingExample(int64_t id)
{
    const QByteArray sql = QByteArray("SELECT ") + kTrainingColumns
        + " FROM training_examples WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<TrainingExample> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readTrainingExample(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<std::vector<TrainingExample>> CatalogStore::loadTrainingExamples(const QString& scope)
{
    const QByteArray sql = QByteArray("SELECT ") + kTrainingColumns
        + " FROM training_examples WHERE scope = ?1 ORDER BY id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "loadTrainingExamples prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);

    std::vector<TrainingExample> examples;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        examples.push_back(readTrainingExample(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "loadTrainingExamples step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return examples;
}

bool CatalogStore::setTrainingWeight(int64_t id, double weight)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "UPDATE training_examples SET weight = ?1 WHERE id = ?2",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_double(stmt, 1, weight > 0.0 ? weight : 0.0);
    sqlite3_bind_int64(stmt, 2, id);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

bool CatalogStore::touchTrainingExample(int64_t id, double now)
{
    const char* sql = R"(
        UPDATE training_examples
        SET times_referenced = times_referenced + 1, last_referenced_at = ?1
        WHERE id = ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(pmStore, "touchTrainingExample prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_double(stmt, 1, now);
    sqlite3_bind_int64(stmt, 2, id);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(pmStore, "touchTrainingExample step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

// ── Embeddings ──────────────────────────────────────────────

bool CatalogStore::setProductEmbedding(const QString& scope, const QString& productId,
                                       const std::vector<float>& vector)
{
    if (vector.empty()) {
        return false;
    }
    const char* sql = R"(
        INSERT INTO product_embeddings (scope, product_id, dimensions, vector, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(scope, product_id) DO UPDATE SET
            dimensions = excluded.dimensions,
            vector = excluded.vector,
            updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "setProductEmbedding prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    const QByteArray productUtf8 = productId.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, productUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, static_cast<int>(vector.size()));
    sqlite3_bind_blob(stmt, 4, vector.data(),
                      static_cast<int>(vector.size() * sizeof(float)), SQLITE_STATIC);
    sqlite3_bind_double(stmt, 5, nowSeconds());

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "setProductEmbedding step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<QHash<QString, std::vector<float>>> CatalogStore::loadProductEmbeddings(
    const QString& scope)
{
    const char* sql = R"(
        SELECT product_id, dimensions, vector FROM product_embeddings WHERE scope = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(pmStore, "loadProductEmbeddings prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray scopeUtf8 = scope.toUtf8();
    sqlite3_bind_text(stmt, 1, scopeUtf8.constData(), -1, SQLITE_STATIC);

    QHash<QString, std::vector<float>> embeddings;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const int dims = sqlite3_column_int(stmt, 1);
        const void* blob = sqlite3_column_blob(stmt, 2);
        const int bytes = sqlite3_column_bytes(stmt, 2);
        if (!blob || dims <= 0 || bytes != dims * static_cast<int>(sizeof(float))) {
            LOG_WARN(pmStore, "Skipping malformed embedding for product %s",
                     qUtf8Printable(columnText(stmt, 0)));
            continue;
        }
        std::vector<float> vector(static_cast<size_t>(dims));
        std::memcpy(vector.data(), blob, static_cast<size_t>(bytes));
        embeddings.insert(columnText(stmt, 0), std::move(vector));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(pmStore, "loadProductEmbeddings step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return embeddings;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> CatalogStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool CatalogStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valUtf8.constData(), -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool CatalogStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool CatalogStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool CatalogStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

bool CatalogStore::integrityCheck() const
{
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace pm
