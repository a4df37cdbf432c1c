#include "fcat/catalog/store.hpp"

#include "fcat/catalog/schema.hpp"
#include "fcat/core/clock.hpp"
#include "fcat/core/ids.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fcat::catalog {
namespace {

using json = nlohmann::json;

std::vector<std::string> parse_tags(const std::string& text) {
    std::vector<std::string> tags;
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return tags;
    }
    for (const auto& tag : document) {
        if (tag.is_string()) {
            tags.push_back(tag.get<std::string>());
        }
    }
    return tags;
}

CaseSource read_source(const Statement& stmt) {
    CaseSource source;
    source.id = stmt.column_text(0);
    source.case_id = stmt.column_text(1);
    source.source_path = stmt.column_text(2);
    source.source_type = stmt.column_text(3);
    source.location = parse_location(stmt.column_text(4)).value_or(SourceLocation::Local);
    source.added_at = stmt.column_int64(5);
    return source;
}

constexpr const char* kSourceColumns =
    "id, case_id, source_path, source_type, source_location, added_at";

Result<void> write_inventory(Database& db, const EntryWrite& write) {
    auto stmt = db.prepare(
        "INSERT INTO file_metadata (file_id, inventory_data, last_scanned_at) VALUES (?, ?, ?) "
        "ON CONFLICT(file_id) DO UPDATE SET inventory_data = excluded.inventory_data, "
        "last_scanned_at = excluded.last_scanned_at");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind(1, write.entry.id).bind(2, write.inventory_json).bind(3, write.scanned_at);
    return stmt.value().run();
}

} // namespace

Result<std::unique_ptr<CatalogStore>> CatalogStore::open(const std::string& path) {
    auto db = Database::open(path);
    if (db.is_error()) {
        return Err<std::unique_ptr<CatalogStore>>(db.error());
    }

    auto migrated = apply_migrations(*db.value());
    if (migrated.is_error()) {
        return Err<std::unique_ptr<CatalogStore>>(migrated.error());
    }
    return Ok(std::make_unique<CatalogStore>(std::move(db.value())));
}

CatalogStore::CatalogStore(std::unique_ptr<Database> db) : db_(std::move(db)) {}

const char* CatalogStore::entry_columns() {
    return "f.id, f.case_id, f.file_name, f.folder_path, f.absolute_path, f.file_hash, "
           "f.file_type, f.file_size, f.created_at, f.modified_at, f.added_at, f.updated_at, "
           "f.status, f.tags, f.source_directory, f.deleted_at";
}

CatalogEntry CatalogStore::read_entry(const Statement& stmt) {
    CatalogEntry entry;
    entry.id = stmt.column_text(0);
    entry.case_id = stmt.column_text(1);
    entry.file_name = stmt.column_text(2);
    entry.folder_path = stmt.column_text(3);
    entry.absolute_path = stmt.column_text(4);
    entry.file_hash = stmt.column_optional_text(5);
    entry.file_type = stmt.column_text(6);
    entry.file_size = stmt.column_int64(7);
    entry.created_at = stmt.column_int64(8);
    entry.modified_at = stmt.column_int64(9);
    entry.added_at = stmt.column_int64(10);
    entry.updated_at = stmt.column_int64(11);

    const auto status_text = stmt.column_text(12);
    if (auto status = parse_status(status_text)) {
        entry.status = *status;
    } else {
        spdlog::warn("[Catalog] entry {} has unknown status '{}'", entry.id, status_text);
    }

    entry.tags = parse_tags(stmt.column_text(13));
    entry.source_directory = stmt.column_text(14);
    entry.deleted_at = stmt.column_optional_int64(15);
    return entry;
}

Result<std::vector<CatalogEntry>> CatalogStore::query_entries(Statement& stmt) {
    std::vector<CatalogEntry> entries;
    while (true) {
        auto row = stmt.step();
        if (row.is_error()) {
            return Err<std::vector<CatalogEntry>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        entries.push_back(read_entry(stmt));
    }
    return Ok(std::move(entries));
}

// ════════════════════════════════════════════════════════
// Cases and sources
// ════════════════════════════════════════════════════════

Result<CaseRecord> CatalogStore::create_case(const std::string& name) {
    if (name.empty()) {
        return Err<CaseRecord>(Error::validation("Case name must not be empty"));
    }

    CaseRecord record{core::generate_id(), name, core::unix_now()};
    auto stmt = db_->prepare("INSERT INTO cases (id, name, created_at) VALUES (?, ?, ?)");
    if (stmt.is_error()) {
        return Err<CaseRecord>(stmt.error());
    }
    stmt.value().bind(1, record.id).bind(2, record.name).bind(3, record.created_at);
    auto done = stmt.value().run();
    if (done.is_error()) {
        return Err<CaseRecord>(done.error());
    }

    spdlog::info("[Catalog] created case {} ({})", record.id, record.name);
    return Ok(std::move(record));
}

Result<std::optional<CaseRecord>> CatalogStore::find_case(const std::string& case_id) {
    auto stmt = db_->prepare("SELECT id, name, created_at FROM cases WHERE id = ?");
    if (stmt.is_error()) {
        return Err<std::optional<CaseRecord>>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, case_id);

    auto row = query.step();
    if (row.is_error()) {
        return Err<std::optional<CaseRecord>>(row.error());
    }
    if (!row.value()) {
        return Ok(std::optional<CaseRecord>{});
    }
    return Ok(std::optional<CaseRecord>(
        CaseRecord{query.column_text(0), query.column_text(1), query.column_int64(2)}));
}

Result<CaseSource> CatalogStore::add_source(const std::string& case_id,
                                            const std::string& source_path,
                                            SourceLocation location,
                                            const std::string& source_type) {
    // Local directories get one row each however they were spelled
    const std::string path = location == SourceLocation::Local ? normalize_local_path(source_path) : source_path;

    auto existing = find_source(case_id, path);
    if (existing.is_error()) {
        return Err<CaseSource>(existing.error());
    }
    if (existing.value()) {
        return Ok(*existing.value());
    }

    CaseSource source;
    source.id = core::generate_id();
    source.case_id = case_id;
    source.source_path = path;
    source.source_type = source_type;
    source.location = location;
    source.added_at = core::unix_now();

    auto stmt = db_->prepare(
        "INSERT INTO case_sources (id, case_id, source_path, source_type, source_location, added_at) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    if (stmt.is_error()) {
        return Err<CaseSource>(stmt.error());
    }
    stmt.value()
        .bind(1, source.id)
        .bind(2, source.case_id)
        .bind(3, source.source_path)
        .bind(4, source.source_type)
        .bind(5, to_string(source.location))
        .bind(6, source.added_at);
    auto done = stmt.value().run();
    if (done.is_error()) {
        return Err<CaseSource>(done.error());
    }

    spdlog::info("[Catalog] registered {} source {} for case {}",
                 to_string(location), path, case_id);
    return Ok(std::move(source));
}

Result<std::optional<CaseSource>> CatalogStore::find_source(const std::string& case_id,
                                                            const std::string& source_path) {
    auto stmt = db_->prepare(std::string("SELECT ") + kSourceColumns +
                             " FROM case_sources WHERE case_id = ? AND source_path = ?");
    if (stmt.is_error()) {
        return Err<std::optional<CaseSource>>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, case_id).bind(2, source_path);

    auto row = query.step();
    if (row.is_error()) {
        return Err<std::optional<CaseSource>>(row.error());
    }
    if (!row.value()) {
        return Ok(std::optional<CaseSource>{});
    }
    return Ok(std::optional<CaseSource>(read_source(query)));
}

Result<std::vector<CaseSource>> CatalogStore::list_sources(const std::string& case_id) {
    auto stmt = db_->prepare(std::string("SELECT ") + kSourceColumns +
                             " FROM case_sources WHERE case_id = ? ORDER BY added_at, source_path");
    if (stmt.is_error()) {
        return Err<std::vector<CaseSource>>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, case_id);

    std::vector<CaseSource> sources;
    while (true) {
        auto row = query.step();
        if (row.is_error()) {
            return Err<std::vector<CaseSource>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        sources.push_back(read_source(query));
    }
    return Ok(std::move(sources));
}

// ════════════════════════════════════════════════════════
// Entries
// ════════════════════════════════════════════════════════

Result<std::optional<CatalogEntry>> CatalogStore::find_by_path(const std::string& case_id,
                                                               const std::string& absolute_path) {
    auto stmt = db_->prepare(std::string("SELECT ") + entry_columns() +
                             " FROM files f WHERE f.case_id = ? AND f.absolute_path = ?"
                             " ORDER BY (f.deleted_at IS NULL) DESC, f.deleted_at DESC LIMIT 1");
    if (stmt.is_error()) {
        return Err<std::optional<CatalogEntry>>(stmt.error());
    }
    stmt.value().bind(1, case_id).bind(2, absolute_path);

    auto entries = query_entries(stmt.value());
    if (entries.is_error()) {
        return Err<std::optional<CatalogEntry>>(entries.error());
    }
    if (entries.value().empty()) {
        return Ok(std::optional<CatalogEntry>{});
    }
    return Ok(std::optional<CatalogEntry>(std::move(entries.value().front())));
}

Result<std::optional<CatalogEntry>> CatalogStore::find_by_id(const std::string& entry_id) {
    auto stmt = db_->prepare(std::string("SELECT ") + entry_columns() + " FROM files f WHERE f.id = ?");
    if (stmt.is_error()) {
        return Err<std::optional<CatalogEntry>>(stmt.error());
    }
    stmt.value().bind(1, entry_id);

    auto entries = query_entries(stmt.value());
    if (entries.is_error()) {
        return Err<std::optional<CatalogEntry>>(entries.error());
    }
    if (entries.value().empty()) {
        return Ok(std::optional<CatalogEntry>{});
    }
    return Ok(std::optional<CatalogEntry>(std::move(entries.value().front())));
}

Result<std::vector<CatalogEntry>> CatalogStore::rename_candidates(const std::string& case_id,
                                                                  const std::string& source_directory,
                                                                  const std::string& file_hash,
                                                                  const std::string& exclude_path) {
    auto stmt = db_->prepare(std::string("SELECT ") + entry_columns() +
                             " FROM files f WHERE f.case_id = ? AND f.source_directory = ?"
                             " AND f.file_hash = ? AND f.absolute_path <> ? AND f.deleted_at IS NULL"
                             " ORDER BY f.added_at, f.absolute_path");
    if (stmt.is_error()) {
        return Err<std::vector<CatalogEntry>>(stmt.error());
    }
    stmt.value().bind(1, case_id).bind(2, source_directory).bind(3, file_hash).bind(4, exclude_path);
    return query_entries(stmt.value());
}

Result<std::vector<CatalogEntry>> CatalogStore::live_entries(const std::string& case_id,
                                                             const std::string& source_directory) {
    auto stmt = db_->prepare(std::string("SELECT ") + entry_columns() +
                             " FROM files f WHERE f.case_id = ? AND f.source_directory = ?"
                             " AND f.deleted_at IS NULL ORDER BY f.absolute_path");
    if (stmt.is_error()) {
        return Err<std::vector<CatalogEntry>>(stmt.error());
    }
    stmt.value().bind(1, case_id).bind(2, source_directory);
    return query_entries(stmt.value());
}

Result<std::vector<CatalogEntry>> CatalogStore::live_entries_by_hash(const std::string& case_id,
                                                                     const std::string& file_hash) {
    auto stmt = db_->prepare(std::string("SELECT ") + entry_columns() +
                             " FROM files f WHERE f.case_id = ? AND f.file_hash = ?"
                             " AND f.deleted_at IS NULL ORDER BY f.added_at, f.absolute_path");
    if (stmt.is_error()) {
        return Err<std::vector<CatalogEntry>>(stmt.error());
    }
    stmt.value().bind(1, case_id).bind(2, file_hash);
    return query_entries(stmt.value());
}

Result<std::int64_t> CatalogStore::count_live(const std::string& case_id) {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM files WHERE case_id = ? AND deleted_at IS NULL");
    if (stmt.is_error()) {
        return Err<std::int64_t>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, case_id);

    auto row = query.step();
    if (row.is_error()) {
        return Err<std::int64_t>(row.error());
    }
    return Ok(row.value() ? query.column_int64(0) : std::int64_t{0});
}

Result<std::optional<std::string>> CatalogStore::inventory(const std::string& entry_id) {
    auto stmt = db_->prepare("SELECT inventory_data FROM file_metadata WHERE file_id = ?");
    if (stmt.is_error()) {
        return Err<std::optional<std::string>>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, entry_id);

    auto row = query.step();
    if (row.is_error()) {
        return Err<std::optional<std::string>>(row.error());
    }
    if (!row.value()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(std::optional<std::string>(query.column_text(0)));
}

Result<void> CatalogStore::insert_batch(const std::vector<EntryWrite>& writes) {
    if (writes.empty()) {
        return Ok();
    }

    auto tx = begin();
    if (tx.is_error()) {
        return Err<void>(tx.error());
    }

    auto stmt = db_->prepare(
        "INSERT INTO files (id, case_id, file_name, folder_path, absolute_path, file_hash, file_type,"
        " file_size, created_at, modified_at, added_at, updated_at, status, tags, source_directory,"
        " deleted_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, NULL)");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    auto& insert = stmt.value();

    for (const auto& write : writes) {
        const auto& entry = write.entry;
        insert.reset();
        insert.bind(1, entry.id)
            .bind(2, entry.case_id)
            .bind(3, entry.file_name)
            .bind(4, entry.folder_path)
            .bind(5, entry.absolute_path)
            .bind(6, entry.file_hash)
            .bind(7, entry.file_type)
            .bind(8, entry.file_size)
            .bind(9, entry.created_at)
            .bind(10, entry.modified_at)
            .bind(11, entry.added_at)
            .bind(12, entry.updated_at)
            .bind(13, to_string(entry.status))
            .bind(14, json(entry.tags).dump())
            .bind(15, entry.source_directory);

        auto inserted = insert.run();
        if (inserted.is_error()) {
            return Err<void>(Error::store("insert " + entry.absolute_path + ": " + inserted.error().message));
        }

        auto enriched = write_inventory(*db_, write);
        if (enriched.is_error()) {
            return enriched;
        }
    }

    return tx.value().commit();
}

Result<void> CatalogStore::update_batch(const std::vector<EntryWrite>& writes) {
    if (writes.empty()) {
        return Ok();
    }

    auto tx = begin();
    if (tx.is_error()) {
        return Err<void>(tx.error());
    }

    auto stmt = db_->prepare(
        "UPDATE files SET file_name = ?, folder_path = ?, absolute_path = ?, file_hash = ?,"
        " file_type = ?, file_size = ?, modified_at = ?, updated_at = ?, status = ?"
        " WHERE id = ? AND deleted_at IS NULL");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    auto& update = stmt.value();

    for (const auto& write : writes) {
        const auto& entry = write.entry;
        update.reset();
        update.bind(1, entry.file_name)
            .bind(2, entry.folder_path)
            .bind(3, entry.absolute_path)
            .bind(4, entry.file_hash)
            .bind(5, entry.file_type)
            .bind(6, entry.file_size)
            .bind(7, entry.modified_at)
            .bind(8, entry.updated_at)
            .bind(9, to_string(entry.status))
            .bind(10, entry.id);

        auto updated = update.run();
        if (updated.is_error()) {
            return Err<void>(Error::store("update " + entry.absolute_path + ": " + updated.error().message));
        }
        if (db_->changes() == 0) {
            return Err<void>(Error::store("update " + entry.absolute_path + ": entry " + entry.id +
                                          " is no longer live"));
        }

        auto enriched = write_inventory(*db_, write);
        if (enriched.is_error()) {
            return enriched;
        }
    }

    return tx.value().commit();
}

Result<std::int64_t> CatalogStore::soft_delete(const std::vector<std::string>& entry_ids,
                                               std::int64_t deleted_at) {
    if (entry_ids.empty()) {
        return Ok(std::int64_t{0});
    }

    auto stmt = db_->prepare("UPDATE files SET deleted_at = ?, updated_at = ? WHERE deleted_at IS NULL"
                             " AND id IN (" + placeholders(entry_ids.size()) + ")");
    if (stmt.is_error()) {
        return Err<std::int64_t>(stmt.error());
    }
    auto& update = stmt.value();
    update.bind(1, deleted_at).bind(2, deleted_at);
    int index = 3;
    for (const auto& id : entry_ids) {
        update.bind(index++, id);
    }

    auto done = update.run();
    if (done.is_error()) {
        return Err<std::int64_t>(done.error());
    }
    return Ok(db_->changes());
}

} // namespace fcat::catalog
