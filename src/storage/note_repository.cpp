#include "storage/note_repository.hpp"

namespace vaultsync::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT id, vault_id, title, content, created_at, updated_at, file_path, is_synced
    FROM notes )SQL";

constexpr const char* UPSERT_SQL = R"SQL(
    INSERT INTO notes (id, vault_id, title, content, created_at, updated_at, file_path, is_synced)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
        vault_id = excluded.vault_id,
        title = excluded.title,
        content = excluded.content,
        updated_at = excluded.updated_at,
        file_path = excluded.file_path,
        is_synced = excluded.is_synced;
)SQL";

// The version guards below compare content as well as updated_at: two
// edits can land in the same millisecond.
constexpr const char* MARK_SYNCED_SQL = R"SQL(
    UPDATE notes SET is_synced = 1, file_path = ?
    WHERE id = ? AND updated_at = ? AND content = ?;
)SQL";

constexpr const char* INSERT_NEW_SQL = R"SQL(
    INSERT INTO notes (id, vault_id, title, content, created_at, updated_at, file_path, is_synced)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO NOTHING;
)SQL";

constexpr const char* REPLACE_SQL = R"SQL(
    UPDATE notes SET
        vault_id = ?, title = ?, content = ?, updated_at = ?, file_path = ?, is_synced = ?
    WHERE id = ? AND updated_at = ? AND content = ?;
)SQL";

} // namespace

Note SqliteNoteRepository::row_to_note(Statement& stmt) {
    return Note{
        .id = stmt.column_uuid(0),
        .vault_id = stmt.column_uuid(1),
        .title = stmt.column_text(2),
        .content = stmt.column_text(3),
        .created_at = stmt.column_timestamp(4),
        .updated_at = stmt.column_timestamp(5),
        .file_path = stmt.column_optional_text(6),
        .is_synced = stmt.column_int(7) != 0
    };
}

Result<std::optional<Note>, Error> SqliteNoteRepository::get_note(const Uuid& id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, std::string(SELECT_COLUMNS) + "WHERE id = ?;", id);
    if (stmt_result.is_err()) {
        return Result<std::optional<Note>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return first_row<Note>(stmt, row_to_note);
}

Result<std::vector<Note>, Error> SqliteNoteRepository::get_unsynced_notes(const Uuid& vault_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_,
        std::string(SELECT_COLUMNS) + "WHERE vault_id = ? AND is_synced = 0 ORDER BY updated_at;",
        vault_id);
    if (stmt_result.is_err()) {
        return Result<std::vector<Note>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<Note>(stmt, row_to_note);
}

Result<std::vector<Note>, Error> SqliteNoteRepository::get_notes_for_vault(const Uuid& vault_id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_,
        std::string(SELECT_COLUMNS) + "WHERE vault_id = ? ORDER BY updated_at;", vault_id);
    if (stmt_result.is_err()) {
        return Result<std::vector<Note>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<Note>(stmt, row_to_note);
}

Result<bool, Error> SqliteNoteRepository::mark_synced(const Note& synced, const std::string& file_path) {
    using R = Result<bool, Error>;
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, MARK_SYNCED_SQL,
        file_path, synced.id, synced.updated_at, synced.content);
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto result = run(stmt);
    if (result.is_err()) {
        return R::err(result.unwrap_err());
    }
    if (db_.changes() > 0) {
        return R::ok(true);
    }

    auto current = get_note(synced.id);
    if (current.is_err()) {
        return R::err(current.unwrap_err());
    }
    if (!current.unwrap()) {
        return R::err(Error{ErrorKind::NotFound, "Note not found: " + synced.id.to_string()});
    }
    return R::ok(false);
}

Result<bool, Error> SqliteNoteRepository::apply_remote(const Note& note, const std::optional<Note>& replaces) {
    using R = Result<bool, Error>;
    auto guard = db_.lock();
    auto stmt_result = replaces
        ? prepare_bound(db_, REPLACE_SQL,
              note.vault_id, note.title, note.content, note.updated_at, note.file_path, note.is_synced,
              note.id, replaces->updated_at, replaces->content)
        : prepare_bound(db_, INSERT_NEW_SQL,
              note.id, note.vault_id, note.title, note.content, note.created_at,
              note.updated_at, note.file_path, note.is_synced);
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto result = run(stmt);
    if (result.is_err()) {
        return R::err(result.unwrap_err());
    }
    return R::ok(db_.changes() > 0);
}

Result<void, Error> SqliteNoteRepository::save(const Note& note) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, UPSERT_SQL,
        note.id, note.vault_id, note.title, note.content, note.created_at,
        note.updated_at, note.file_path, note.is_synced);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> SqliteNoteRepository::remove(const Uuid& id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM notes WHERE id = ?;", id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

} // namespace vaultsync::storage
