#pragma once

namespace pm {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 10000;
PRAGMA cache_size = -32768;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x504D43;
PRAGMA user_version = 1;
)";

// Schema v1. Later versions are reached through applyMigrations().
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS products (
    scope TEXT NOT NULL,
    id TEXT NOT NULL,
    sku TEXT NOT NULL,
    name TEXT NOT NULL,
    manufacturer TEXT NOT NULL DEFAULT '',
    category TEXT NOT NULL DEFAULT '',
    description TEXT NOT NULL DEFAULT '',
    updated_at REAL NOT NULL,
    PRIMARY KEY (scope, id)
);

CREATE INDEX IF NOT EXISTS idx_products_scope_sku ON products(scope, sku);

CREATE TABLE IF NOT EXISTS aliases (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    scope TEXT NOT NULL,
    product_id TEXT NOT NULL,
    competitor_name TEXT NOT NULL,
    normalized_name TEXT NOT NULL,
    confidence REAL NOT NULL DEFAULT 1.0 CHECK (confidence >= 0.0 AND confidence <= 1.0),
    created_at REAL NOT NULL,
    UNIQUE(scope, normalized_name, product_id),
    FOREIGN KEY (scope, product_id) REFERENCES products(scope, id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_aliases_scope_product ON aliases(scope, product_id);

CREATE TABLE IF NOT EXISTS training_examples (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    scope TEXT NOT NULL,
    query_text TEXT NOT NULL,
    normalized_text TEXT NOT NULL,
    product_id TEXT NOT NULL,
    product_sku TEXT NOT NULL DEFAULT '',
    product_name TEXT NOT NULL DEFAULT '',
    trigram_score REAL NOT NULL DEFAULT 0.0,
    fuzzy_score REAL NOT NULL DEFAULT 0.0,
    alias_score REAL NOT NULL DEFAULT 0.0,
    learned_score REAL NOT NULL DEFAULT 0.0,
    vector_score REAL NOT NULL DEFAULT 0.0,
    final_score REAL NOT NULL DEFAULT 0.0,
    quality TEXT NOT NULL DEFAULT 'good'
        CHECK (quality IN ('excellent', 'good', 'fair', 'poor')),
    confidence REAL NOT NULL DEFAULT 0.8,
    weight REAL NOT NULL DEFAULT 1.0,
    times_referenced INTEGER NOT NULL DEFAULT 0,
    approved_at REAL NOT NULL,
    last_referenced_at REAL,
    UNIQUE(scope, normalized_text, product_id),
    FOREIGN KEY (scope, product_id) REFERENCES products(scope, id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_training_scope_product ON training_examples(scope, product_id);
CREATE INDEX IF NOT EXISTS idx_training_approved_at ON training_examples(approved_at DESC);

CREATE TABLE IF NOT EXISTS product_embeddings (
    scope TEXT NOT NULL,
    product_id TEXT NOT NULL,
    dimensions INTEGER NOT NULL,
    vector BLOB NOT NULL,
    updated_at REAL NOT NULL,
    PRIMARY KEY (scope, product_id),
    FOREIGN KEY (scope, product_id) REFERENCES products(scope, id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

// Default settings rows
constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace pm
