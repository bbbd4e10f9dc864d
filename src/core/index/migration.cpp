#include "core/index/migration.h"
#include "core/shared/logging.h"

#include <QByteArray>

#include <sqlite3.h>

namespace pm {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                bool ok = false;
                version = QByteArray(val).toInt(&ok);
                if (!ok) {
                    version = 0;
                }
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(pmStore, "Schema version %d is newer than supported version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(pmStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(pmStore, "Applying schema migration 1 -> 2");

        if (!exec("BEGIN IMMEDIATE")) {
            return false;
        }

        const bool ok =
            exec("ALTER TABLE aliases ADD COLUMN competitor_sku TEXT NOT NULL DEFAULT '';")
            && exec("CREATE INDEX IF NOT EXISTS idx_aliases_scope_sku ON aliases(scope, competitor_sku);")
            && exec("CREATE INDEX IF NOT EXISTS idx_training_last_referenced "
                    "ON training_examples(last_referenced_at DESC);")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");

        if (!ok) {
            const bool rolledBack = exec("ROLLBACK");
            LOG_WARN(pmStore, "Migration 1 -> 2 aborted (rollback %s)",
                     rolledBack ? "succeeded" : "failed");
            return false;
        }
        if (!exec("COMMIT")) {
            return false;
        }

        current = 2;
    }

    LOG_INFO(pmStore, "Schema is at version %d", current);
    return current == targetVersion;
}

} // namespace pm
