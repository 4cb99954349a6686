#include "storage/retry_queue_repository.hpp"

namespace vaultsync::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT note_id, vault_id, retry_count, last_attempt_at, next_retry_at,
           last_error_message, created_at
    FROM sync_queue )SQL";

} // namespace

RetryQueueItem RetryQueueRepository::row_to_item(Statement& stmt) {
    return RetryQueueItem{
        .note_id = stmt.column_uuid(0),
        .vault_id = stmt.column_uuid(1),
        .retry_count = stmt.column_int(2),
        .last_attempt_at = stmt.column_timestamp(3),
        .next_retry_at = stmt.column_timestamp(4),
        .last_error_message = stmt.column_optional_text(5),
        .created_at = stmt.column_timestamp(6)
    };
}

template<typename... Args>
Result<std::vector<RetryQueueItem>, Error> RetryQueueRepository::select(const std::string& tail,
                                                                        const Args&... args) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, std::string(SELECT_COLUMNS) + tail, args...);
    if (stmt_result.is_err()) {
        return Result<std::vector<RetryQueueItem>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<RetryQueueItem>(stmt, row_to_item);
}

template<typename... Args>
Result<int, Error> RetryQueueRepository::update(const std::string& sql, const Args&... args) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, sql, args...);
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

Result<void, Error> RetryQueueRepository::upsert_locked(const RetryQueueItem& item) {
    // created_at keeps the first failure time across updates.
    auto stmt_result = prepare_bound(db_, R"SQL(
        INSERT INTO sync_queue (note_id, vault_id, retry_count, last_attempt_at,
                                next_retry_at, last_error_message, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(note_id) DO UPDATE SET
            vault_id = excluded.vault_id,
            retry_count = excluded.retry_count,
            last_attempt_at = excluded.last_attempt_at,
            next_retry_at = excluded.next_retry_at,
            last_error_message = excluded.last_error_message;
    )SQL",
        item.note_id, item.vault_id, item.retry_count, item.last_attempt_at,
        item.next_retry_at, item.last_error_message, item.created_at);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> RetryQueueRepository::upsert(const RetryQueueItem& item) {
    auto guard = db_.lock();
    return upsert_locked(item);
}

Result<void, Error> RetryQueueRepository::upsert_all(const std::vector<RetryQueueItem>& items) {
    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& item : items) {
            auto result = upsert_locked(item);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<std::optional<RetryQueueItem>, Error> RetryQueueRepository::get(const Uuid& note_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, std::string(SELECT_COLUMNS) + "WHERE note_id = ?;",
                                     note_id);
    if (stmt_result.is_err()) {
        return Result<std::optional<RetryQueueItem>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return first_row<RetryQueueItem>(stmt, row_to_item);
}

Result<std::vector<RetryQueueItem>, Error> RetryQueueRepository::get_all() {
    return select("ORDER BY next_retry_at ASC;");
}

Result<std::vector<RetryQueueItem>, Error> RetryQueueRepository::get_for_vault(const Uuid& vault_id) {
    return select("WHERE vault_id = ? ORDER BY next_retry_at ASC;", vault_id);
}

Result<std::vector<RetryQueueItem>, Error> RetryQueueRepository::get_items_ready_for_retry(
    Timestamp now
) {
    return select("WHERE next_retry_at <= ? AND retry_count < ? ORDER BY next_retry_at ASC;",
                  now, max_retries_);
}

Result<std::vector<RetryQueueItem>, Error> RetryQueueRepository::get_failed_items() {
    return select("WHERE retry_count >= ? ORDER BY last_attempt_at DESC;", max_retries_);
}

Result<int, Error> RetryQueueRepository::queue_size() {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM sync_queue;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto row = first_row<int>(stmt, [](Statement& s) { return s.column_int(0); });
    if (row.is_err()) {
        return Result<int, Error>::err(row.unwrap_err());
    }
    return Result<int, Error>::ok(row.unwrap().value_or(0));
}

Result<int, Error> RetryQueueRepository::ready_count(Timestamp now) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_,
        "SELECT COUNT(*) FROM sync_queue WHERE next_retry_at <= ? AND retry_count < ?;",
        now, max_retries_);
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto row = first_row<int>(stmt, [](Statement& s) { return s.column_int(0); });
    if (row.is_err()) {
        return Result<int, Error>::err(row.unwrap_err());
    }
    return Result<int, Error>::ok(row.unwrap().value_or(0));
}

Result<void, Error> RetryQueueRepository::remove(const Uuid& note_id) {
    auto result = update("DELETE FROM sync_queue WHERE note_id = ?;", note_id);
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> RetryQueueRepository::remove_for_vault(const Uuid& vault_id) {
    auto result = update("DELETE FROM sync_queue WHERE vault_id = ?;", vault_id);
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<int, Error> RetryQueueRepository::remove_failed() {
    return update("DELETE FROM sync_queue WHERE retry_count >= ?;", max_retries_);
}

Result<void, Error> RetryQueueRepository::clear() {
    return db_.execute("DELETE FROM sync_queue;");
}

Result<bool, Error> RetryQueueRepository::reset_retry_count(const Uuid& note_id, Timestamp now) {
    auto result = update(
        "UPDATE sync_queue SET retry_count = 0, next_retry_at = ? WHERE note_id = ?;",
        now + reset_delay_, note_id);
    if (result.is_err()) {
        return Result<bool, Error>::err(result.unwrap_err());
    }
    return Result<bool, Error>::ok(result.unwrap() > 0);
}

Result<int, Error> RetryQueueRepository::reset_all_failed_items(Timestamp now) {
    return update(
        "UPDATE sync_queue SET retry_count = 0, next_retry_at = ? WHERE retry_count >= ?;",
        now + reset_delay_, max_retries_);
}

} // namespace vaultsync::storage
