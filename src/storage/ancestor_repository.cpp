#include "storage/ancestor_repository.hpp"

namespace vaultsync::storage {

Result<std::optional<AncestorRecord>, Error> AncestorRepository::get(const Uuid& note_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, R"SQL(
        SELECT note_id, vault_id, content_hash, content, recorded_at
        FROM sync_ancestors WHERE note_id = ?;
    )SQL", note_id);
    if (stmt_result.is_err()) {
        return Result<std::optional<AncestorRecord>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return first_row<AncestorRecord>(stmt, [](Statement& s) {
        return AncestorRecord{
            .note_id = s.column_uuid(0),
            .vault_id = s.column_uuid(1),
            .content_hash = s.column_text(2),
            .content = s.column_text(3),
            .recorded_at = s.column_timestamp(4)
        };
    });
}

Result<void, Error> AncestorRepository::put(const AncestorRecord& record) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, R"SQL(
        INSERT OR REPLACE INTO sync_ancestors (note_id, vault_id, content_hash, content, recorded_at)
        VALUES (?, ?, ?, ?, ?);
    )SQL", record.note_id, record.vault_id, record.content_hash, record.content,
           record.recorded_at);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> AncestorRepository::remove(const Uuid& note_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM sync_ancestors WHERE note_id = ?;", note_id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> AncestorRepository::remove_for_vault(const Uuid& vault_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM sync_ancestors WHERE vault_id = ?;", vault_id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

} // namespace vaultsync::storage
