#pragma once

#include "storage/database.hpp"
#include "core/repositories.hpp"

namespace vaultsync::storage {

/**
 * SqliteNoteRepository - NoteRepository over the notes table.
 */
class SqliteNoteRepository final : public NoteRepository {
public:
    explicit SqliteNoteRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Note>, Error> get_note(const Uuid& id) override;
    [[nodiscard]] Result<std::vector<Note>, Error> get_unsynced_notes(const Uuid& vault_id) override;
    [[nodiscard]] Result<std::vector<Note>, Error> get_notes_for_vault(const Uuid& vault_id) override;
    [[nodiscard]] Result<bool, Error> mark_synced(const Note& synced, const std::string& file_path) override;
    [[nodiscard]] Result<bool, Error> apply_remote(const Note& note,
                                                   const std::optional<Note>& replaces) override;

    /**
     * Insert or update a locally captured note.
     */
    [[nodiscard]] Result<void, Error> save(const Note& note);

    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

private:
    Database& db_;

    [[nodiscard]] static Note row_to_note(Statement& stmt);
};

} // namespace vaultsync::storage
