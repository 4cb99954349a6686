#include "storage/sync_state_repository.hpp"
#include "core/log.hpp"

namespace vaultsync::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT note_id, vault_id, status, local_modified_at, remote_modified_at,
           last_synced_at, remote_path, ancestor_hash, retry_count, last_error
    FROM sync_states )SQL";

Result<int, Error> single_int(Statement& stmt) {
    auto row = first_row<int>(stmt, [](Statement& s) { return s.column_int(0); });
    if (row.is_err()) {
        return Result<int, Error>::err(row.unwrap_err());
    }
    return Result<int, Error>::ok(row.unwrap().value_or(0));
}

} // namespace

SyncState SyncStateRepository::row_to_state(Statement& stmt) {
    const auto status_text = stmt.column_text(2);
    auto status = parse_sync_status(status_text);
    if (!status) {
        qCWarning(vaultsyncStorageLog) << "unknown sync status" << status_text.c_str()
                                       << "for note" << stmt.column_text(0).c_str();
    }

    return SyncState{
        .note_id = stmt.column_uuid(0),
        .vault_id = stmt.column_uuid(1),
        .status = status.value_or(SyncStatus::NeverSynced),
        .local_modified_at = stmt.column_timestamp(3),
        .remote_modified_at = stmt.column_optional_timestamp(4),
        .last_synced_at = stmt.column_optional_timestamp(5),
        .remote_path = stmt.column_optional_text(6),
        .ancestor_hash = stmt.column_optional_text(7),
        .retry_count = stmt.column_int(8),
        .last_error = stmt.column_optional_text(9)
    };
}

template<typename... Args>
Result<std::vector<SyncState>, Error> SyncStateRepository::select(const std::string& tail,
                                                                  const Args&... args) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, std::string(SELECT_COLUMNS) + tail, args...);
    if (stmt_result.is_err()) {
        return Result<std::vector<SyncState>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<SyncState>(stmt, row_to_state);
}

Result<std::optional<SyncState>, Error> SyncStateRepository::get(const Uuid& note_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, std::string(SELECT_COLUMNS) + "WHERE note_id = ?;",
                                     note_id);
    if (stmt_result.is_err()) {
        return Result<std::optional<SyncState>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return first_row<SyncState>(stmt, row_to_state);
}

Result<std::vector<SyncState>, Error> SyncStateRepository::get_by_vault(const Uuid& vault_id) {
    return select("WHERE vault_id = ? ORDER BY local_modified_at;", vault_id);
}

Result<std::vector<SyncState>, Error> SyncStateRepository::get_by_status(SyncStatus status) {
    return select("WHERE status = ? ORDER BY local_modified_at;", to_string(status));
}

Result<std::vector<SyncState>, Error> SyncStateRepository::get_by_status_for_vault(
    const Uuid& vault_id, SyncStatus status
) {
    return select("WHERE vault_id = ? AND status = ? ORDER BY local_modified_at;",
                  vault_id, to_string(status));
}

Result<std::vector<SyncState>, Error> SyncStateRepository::get_pending_uploads(
    const Uuid& vault_id, int max_retries
) {
    return select(R"SQL(
        WHERE vault_id = ?
          AND (status = ? OR (status = ? AND retry_count < ?))
        ORDER BY local_modified_at ASC;
    )SQL", vault_id, to_string(SyncStatus::PendingUpload), to_string(SyncStatus::Error),
           max_retries);
}

Result<std::vector<SyncState>, Error> SyncStateRepository::get_pending_downloads(
    const Uuid& vault_id
) {
    return select("WHERE vault_id = ? AND status = ? ORDER BY remote_modified_at ASC;",
                  vault_id, to_string(SyncStatus::PendingDownload));
}

Result<std::vector<SyncState>, Error> SyncStateRepository::get_conflicts(const Uuid& vault_id) {
    return select("WHERE vault_id = ? AND status = ? ORDER BY local_modified_at DESC;",
                  vault_id, to_string(SyncStatus::Conflict));
}

Result<int, Error> SyncStateRepository::count_by_status(const Uuid& vault_id, SyncStatus status) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_,
        "SELECT COUNT(*) FROM sync_states WHERE vault_id = ? AND status = ?;",
        vault_id, to_string(status));
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return single_int(stmt);
}

Result<int, Error> SyncStateRepository::error_count(const Uuid& vault_id) {
    return count_by_status(vault_id, SyncStatus::Error);
}

Result<std::map<SyncStatus, int>, Error> SyncStateRepository::statistics(const Uuid& vault_id) {
    std::map<SyncStatus, int> counts{
        {SyncStatus::NeverSynced, 0},
        {SyncStatus::PendingUpload, 0},
        {SyncStatus::PendingDownload, 0},
        {SyncStatus::Synced, 0},
        {SyncStatus::Conflict, 0},
        {SyncStatus::Error, 0},
    };

    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_,
        "SELECT status, COUNT(*) FROM sync_states WHERE vault_id = ? GROUP BY status;",
        vault_id);
    if (stmt_result.is_err()) {
        return Result<std::map<SyncStatus, int>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::map<SyncStatus, int>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        if (auto status = parse_sync_status(stmt.column_text(0))) {
            counts[*status] = stmt.column_int(1);
        }
    }

    return Result<std::map<SyncStatus, int>, Error>::ok(std::move(counts));
}

Result<void, Error> SyncStateRepository::upsert_locked(const SyncState& state) {
    auto stmt_result = prepare_bound(db_, R"SQL(
        INSERT INTO sync_states (note_id, vault_id, status, local_modified_at,
                                 remote_modified_at, last_synced_at, remote_path,
                                 ancestor_hash, retry_count, last_error)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(note_id) DO UPDATE SET
            vault_id = excluded.vault_id,
            status = excluded.status,
            local_modified_at = excluded.local_modified_at,
            remote_modified_at = excluded.remote_modified_at,
            last_synced_at = excluded.last_synced_at,
            remote_path = excluded.remote_path,
            ancestor_hash = excluded.ancestor_hash,
            retry_count = excluded.retry_count,
            last_error = excluded.last_error;
    )SQL",
        state.note_id, state.vault_id, to_string(state.status), state.local_modified_at,
        state.remote_modified_at, state.last_synced_at, state.remote_path,
        state.ancestor_hash, state.retry_count, state.last_error);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> SyncStateRepository::upsert(const SyncState& state) {
    auto guard = db_.lock();
    return upsert_locked(state);
}

Result<void, Error> SyncStateRepository::upsert_all(const std::vector<SyncState>& states) {
    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& state : states) {
            auto result = upsert_locked(state);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> SyncStateRepository::remove(const Uuid& note_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM sync_states WHERE note_id = ?;", note_id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> SyncStateRepository::remove_for_vault(const Uuid& vault_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM sync_states WHERE vault_id = ?;", vault_id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<int, Error> SyncStateRepository::remove_synced() {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM sync_states WHERE status = ?;",
                                     to_string(SyncStatus::Synced));
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto result = run(stmt);
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int, Error> SyncStateRepository::reset_retry_counts_for_errors() {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_,
        "UPDATE sync_states SET retry_count = 0 WHERE status = ?;",
        to_string(SyncStatus::Error));
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto result = run(stmt);
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

} // namespace vaultsync::storage
