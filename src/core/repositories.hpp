#pragma once

#include "core/note.hpp"
#include "core/vault.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vaultsync {

/**
 * NoteRepository - the local notes the engine reconciles.
 */
class NoteRepository {
public:
    virtual ~NoteRepository() = default;

    [[nodiscard]] virtual Result<std::optional<Note>, Error> get_note(const Uuid& id) = 0;

    /**
     * Notes of a vault whose is_synced flag is clear, oldest edit first.
     */
    [[nodiscard]] virtual Result<std::vector<Note>, Error> get_unsynced_notes(const Uuid& vault_id) = 0;

    [[nodiscard]] virtual Result<std::vector<Note>, Error> get_notes_for_vault(const Uuid& vault_id) = 0;

    /**
     * Flag the note as synced, but only while it still holds the version
     * that was written to the vault. False when it was edited since; the
     * edit is left untouched. NotFound when the note is gone.
     */
    [[nodiscard]] virtual Result<bool, Error> mark_synced(const Note& synced, const std::string& file_path) = 0;

    /**
     * Store content that came from the vault over `replaces`, the local
     * version the decision was made against. With no `replaces` the note
     * must not exist yet. False, and nothing written, when the stored note
     * is no longer that version.
     */
    [[nodiscard]] virtual Result<bool, Error> apply_remote(const Note& note,
                                                           const std::optional<Note>& replaces) = 0;
};

/**
 * VaultRepository - configured vaults.
 */
class VaultRepository {
public:
    virtual ~VaultRepository() = default;

    [[nodiscard]] virtual Result<std::vector<Vault>, Error> get_all_vaults() = 0;
    [[nodiscard]] virtual Result<std::optional<Vault>, Error> get_vault(const Uuid& id) = 0;
    [[nodiscard]] virtual Result<void, Error> update_last_synced(const Uuid& id, Timestamp at) = 0;
};

} // namespace vaultsync
