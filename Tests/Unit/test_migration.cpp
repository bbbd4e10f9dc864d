#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <sqlite3.h>

#include "core/index/catalog_store.h"
#include "core/index/migration.h"
#include "core/index/schema.h"

namespace {

bool columnExists(sqlite3* db, const char* table, const char* column)
{
    const QByteArray sql = QByteArray("PRAGMA table_info(") + table + ")";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool found = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (name && qstrcmp(name, column) == 0) {
            found = true;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

// Writes a database exactly as the first schema release created it.
bool createVersionOneDatabase(const QString& path)
{
    sqlite3* db = nullptr;
    if (sqlite3_open(path.toUtf8().constData(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }
    const bool ok = sqlite3_exec(db, pm::kSchemaV1, nullptr, nullptr, nullptr) == SQLITE_OK
        && sqlite3_exec(db, pm::kDefaultSettings, nullptr, nullptr, nullptr) == SQLITE_OK
        && sqlite3_exec(db,
               "INSERT INTO products (scope, id, sku, name, updated_at) "
               "VALUES ('default', 'p1', 'SG-100', 'Safety Goggles', 1.0);"
               "INSERT INTO aliases (scope, product_id, competitor_name, normalized_name, created_at) "
               "VALUES ('default', 'p1', 'Goggles Clr', 'goggles clr', 1.0);",
               nullptr, nullptr, nullptr) == SQLITE_OK;
    sqlite3_close(db);
    return ok;
}

} // namespace

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testFreshDatabaseReportsVersionZero();
    void testVersionOneUpgradesOnOpen();
    void testUpgradeIsNoOpAtCurrentVersion();
    void testNewerSchemaRejected();
};

void TestMigration::testFreshDatabaseReportsVersionZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(pm::currentSchemaVersion(db), 0);
    sqlite3_close(db);
}

void TestMigration::testVersionOneUpgradesOnOpen()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/catalog.db";
    QVERIFY(createVersionOneDatabase(path));

    auto store = pm::CatalogStore::open(path);
    QVERIFY(store.has_value());
    QCOMPARE(pm::currentSchemaVersion(store->rawDb()), pm::kCurrentSchemaVersion);
    QVERIFY(columnExists(store->rawDb(), "aliases", "competitor_sku"));

    // Rows written before the upgrade survive it.
    auto aliases = store->loadAliases(QStringLiteral("default"));
    QVERIFY(aliases.has_value());
    QCOMPARE(aliases->size(), size_t(1));
    QCOMPARE(aliases->front().competitorSku, QString());
}

void TestMigration::testUpgradeIsNoOpAtCurrentVersion()
{
    QTemporaryDir dir;
    auto store = pm::CatalogStore::open(dir.path() + "/catalog.db");
    QVERIFY(store.has_value());
    QVERIFY(pm::applyMigrations(store->rawDb(), pm::kCurrentSchemaVersion));
    QCOMPARE(pm::currentSchemaVersion(store->rawDb()), pm::kCurrentSchemaVersion);
}

void TestMigration::testNewerSchemaRejected()
{
    QTemporaryDir dir;
    auto store = pm::CatalogStore::open(dir.path() + "/catalog.db");
    QVERIFY(store.has_value());
    QVERIFY(store->setSetting(QStringLiteral("schema_version"), QStringLiteral("9")));
    QVERIFY(!pm::applyMigrations(store->rawDb(), pm::kCurrentSchemaVersion));
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
