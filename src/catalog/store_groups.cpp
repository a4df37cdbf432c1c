#include "fcat/catalog/store.hpp"

namespace fcat::catalog {

Result<std::vector<CatalogEntry>> CatalogStore::duplicate_candidates(const std::string& case_id,
                                                                     const std::string& file_hash,
                                                                     const std::string& exclude_id,
                                                                     std::size_t limit) {
    auto stmt = db_->prepare(std::string("SELECT ") + entry_columns() +
                             " FROM files f"
                             " JOIN case_sources s ON s.case_id = f.case_id AND s.source_path = f.source_directory"
                             " WHERE f.case_id = ? AND f.file_hash = ? AND f.id <> ?"
                             " AND f.deleted_at IS NULL AND s.source_location = 'local'"
                             " ORDER BY f.added_at, f.absolute_path LIMIT ?");
    if (stmt.is_error()) {
        return Err<std::vector<CatalogEntry>>(stmt.error());
    }
    stmt.value()
        .bind(1, case_id)
        .bind(2, file_hash)
        .bind(3, exclude_id)
        .bind(4, static_cast<std::int64_t>(limit));
    return query_entries(stmt.value());
}

Result<bool> CatalogStore::group_exists(const std::string& case_id, const std::string& group_id) {
    auto stmt = db_->prepare("SELECT 1 FROM duplicate_groups WHERE case_id = ? AND group_id = ? LIMIT 1");
    if (stmt.is_error()) {
        return Err<bool>(stmt.error());
    }
    stmt.value().bind(1, case_id).bind(2, group_id);
    return stmt.value().step();
}

Result<bool> CatalogStore::add_group_member(const std::string& case_id,
                                            const std::string& group_id,
                                            const std::string& entry_id,
                                            bool is_primary,
                                            std::int64_t created_at) {
    auto stmt = db_->prepare(
        "INSERT OR IGNORE INTO duplicate_groups (case_id, group_id, file_id, is_primary, created_at)"
        " VALUES (?, ?, ?, ?, ?)");
    if (stmt.is_error()) {
        return Err<bool>(stmt.error());
    }
    stmt.value()
        .bind(1, case_id)
        .bind(2, group_id)
        .bind(3, entry_id)
        .bind(4, std::int64_t{is_primary ? 1 : 0})
        .bind(5, created_at);

    auto done = stmt.value().run();
    if (done.is_error()) {
        return Err<bool>(done.error());
    }
    return Ok(db_->changes() > 0);
}

Result<std::vector<DuplicateMember>> CatalogStore::group_members(const std::string& case_id,
                                                                 const std::string& group_id) {
    auto stmt = db_->prepare(
        "SELECT g.group_id, g.file_id, f.absolute_path, g.is_primary, g.created_at"
        " FROM duplicate_groups g JOIN files f ON f.id = g.file_id"
        " WHERE g.case_id = ? AND g.group_id = ?"
        " ORDER BY g.is_primary DESC, f.absolute_path");
    if (stmt.is_error()) {
        return Err<std::vector<DuplicateMember>>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, case_id).bind(2, group_id);

    std::vector<DuplicateMember> members;
    while (true) {
        auto row = query.step();
        if (row.is_error()) {
            return Err<std::vector<DuplicateMember>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        DuplicateMember member;
        member.group_id = query.column_text(0);
        member.file_id = query.column_text(1);
        member.absolute_path = query.column_text(2);
        member.is_primary = query.column_int64(3) != 0;
        member.created_at = query.column_int64(4);
        members.push_back(std::move(member));
    }
    return Ok(std::move(members));
}

Result<std::int64_t> CatalogStore::count_groups(const std::string& case_id) {
    auto stmt = db_->prepare("SELECT COUNT(DISTINCT group_id) FROM duplicate_groups WHERE case_id = ?");
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

} // namespace fcat::catalog
