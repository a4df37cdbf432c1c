#include "fcat/catalog/schema.hpp"

#include "fcat/core/clock.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace fcat::catalog {
namespace {

struct Migration {
    const char* name;
    const char* sql;
};

constexpr std::array<Migration, 4> kMigrations = {{
    {"001_cases_and_sources", R"SQL(
        CREATE TABLE IF NOT EXISTS cases (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS case_sources (
            id TEXT PRIMARY KEY,
            case_id TEXT NOT NULL REFERENCES cases(id) ON DELETE CASCADE,
            source_path TEXT NOT NULL,
            source_type TEXT NOT NULL DEFAULT 'folder',
            source_location TEXT NOT NULL DEFAULT 'local'
                CHECK (source_location IN ('local', 'remote')),
            added_at INTEGER NOT NULL,
            UNIQUE (case_id, source_path)
        );
    )SQL"},

    {"002_files", R"SQL(
        CREATE TABLE IF NOT EXISTS files (
            id TEXT PRIMARY KEY,
            case_id TEXT NOT NULL REFERENCES cases(id) ON DELETE CASCADE,
            file_name TEXT NOT NULL,
            folder_path TEXT NOT NULL,
            absolute_path TEXT NOT NULL,
            file_hash TEXT,
            file_type TEXT NOT NULL DEFAULT '',
            file_size INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            modified_at INTEGER NOT NULL,
            added_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            status TEXT NOT NULL DEFAULT 'unreviewed',
            tags TEXT NOT NULL DEFAULT '[]',
            source_directory TEXT NOT NULL,
            deleted_at INTEGER
        );

        CREATE UNIQUE INDEX IF NOT EXISTS idx_files_live_path
            ON files (case_id, absolute_path) WHERE deleted_at IS NULL;
        CREATE INDEX IF NOT EXISTS idx_files_path ON files (case_id, absolute_path);
        CREATE INDEX IF NOT EXISTS idx_files_hash ON files (case_id, file_hash);
        CREATE INDEX IF NOT EXISTS idx_files_source ON files (case_id, source_directory);

        CREATE TABLE IF NOT EXISTS file_metadata (
            file_id TEXT PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
            inventory_data TEXT NOT NULL,
            last_scanned_at INTEGER NOT NULL
        );
    )SQL"},

    {"003_annotations", R"SQL(
        CREATE TABLE IF NOT EXISTS notes (
            id TEXT PRIMARY KEY,
            case_id TEXT NOT NULL REFERENCES cases(id) ON DELETE CASCADE,
            file_id TEXT REFERENCES files(id) ON DELETE SET NULL,
            content TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_notes_file ON notes (file_id);

        CREATE TABLE IF NOT EXISTS findings (
            id TEXT PRIMARY KEY,
            case_id TEXT NOT NULL REFERENCES cases(id) ON DELETE CASCADE,
            title TEXT NOT NULL,
            linked_files TEXT NOT NULL DEFAULT '[]',
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_findings_case ON findings (case_id);
    )SQL"},

    {"004_duplicate_groups", R"SQL(
        CREATE TABLE IF NOT EXISTS duplicate_groups (
            case_id TEXT NOT NULL REFERENCES cases(id) ON DELETE CASCADE,
            group_id TEXT NOT NULL,
            file_id TEXT NOT NULL REFERENCES files(id) ON DELETE CASCADE,
            is_primary INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            PRIMARY KEY (case_id, group_id, file_id)
        );

        CREATE UNIQUE INDEX IF NOT EXISTS idx_duplicate_groups_primary
            ON duplicate_groups (case_id, group_id) WHERE is_primary = 1;
        CREATE INDEX IF NOT EXISTS idx_duplicate_groups_file ON duplicate_groups (file_id);
    )SQL"},
}};

Result<bool> is_applied(Database& db, const char* name) {
    auto stmt = db.prepare("SELECT 1 FROM _migrations WHERE name = ?");
    if (stmt.is_error()) {
        return Err<bool>(stmt.error());
    }
    stmt.value().bind(1, name);
    return stmt.value().step();
}

} // namespace

Result<std::size_t> apply_migrations(Database& db) {
    auto bootstrap = db.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS _migrations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            applied_at INTEGER NOT NULL
        );
    )SQL");
    if (bootstrap.is_error()) {
        return Err<std::size_t>(bootstrap.error());
    }

    std::size_t applied = 0;
    for (const auto& migration : kMigrations) {
        auto done = is_applied(db, migration.name);
        if (done.is_error()) {
            return Err<std::size_t>(done.error());
        }
        if (done.value()) {
            continue;
        }

        auto tx = Transaction::begin(db);
        if (tx.is_error()) {
            return Err<std::size_t>(tx.error());
        }

        auto created = db.execute(migration.sql);
        if (created.is_error()) {
            return Err<std::size_t>(Error::store(std::string("migration ") + migration.name +
                                                 " failed: " + created.error().message));
        }

        auto record = db.prepare("INSERT INTO _migrations (name, applied_at) VALUES (?, ?)");
        if (record.is_error()) {
            return Err<std::size_t>(record.error());
        }
        record.value().bind(1, migration.name).bind(2, core::unix_now());
        auto recorded = record.value().run();
        if (recorded.is_error()) {
            return Err<std::size_t>(recorded.error());
        }

        auto committed = tx.value().commit();
        if (committed.is_error()) {
            return Err<std::size_t>(committed.error());
        }

        spdlog::info("[Catalog] applied migration {}", migration.name);
        ++applied;
    }
    return Ok(applied);
}

} // namespace fcat::catalog
