#pragma once

#include "core/types.hpp"
#include "core/content_hash.hpp"
#include <string>
#include <optional>

namespace vaultsync {

/**
 * Note - a captured note as kept in the local database.
 *
 * `file_path` is where the vault provider last wrote the note;
 * `is_synced` is cleared by every local edit and set after a successful push.
 */
struct Note {
    Uuid id;
    Uuid vault_id;
    std::string title;
    std::string content;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<std::string> file_path;
    bool is_synced = false;

    bool operator==(const Note&) const = default;
};

/**
 * NoteVersion - one side of a reconciliation: the body of a note as it
 * exists locally or in the vault, with its modification time and hash.
 */
struct NoteVersion {
    Uuid note_id;
    std::string content;
    Timestamp modified_at;
    std::string content_hash;

    bool operator==(const NoteVersion&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Note create_note(
    Uuid id,
    Uuid vault_id,
    std::string content,
    std::string title = {},
    Timestamp at = Timestamp::now()
) {
    return Note{
        .id = id,
        .vault_id = vault_id,
        .title = std::move(title),
        .content = std::move(content),
        .created_at = at,
        .updated_at = at,
        .file_path = std::nullopt,
        .is_synced = false
    };
}

/**
 * Local edit: new body, new modification time, no longer synced.
 */
[[nodiscard]] inline Note with_content(Note note, std::string content, Timestamp at) {
    note.content = std::move(content);
    note.updated_at = at;
    note.is_synced = false;
    return note;
}

[[nodiscard]] inline NoteVersion make_version(const Uuid& note_id,
                                              std::string content,
                                              Timestamp modified_at) {
    auto hash = content_hash(content);
    return NoteVersion{
        .note_id = note_id,
        .content = std::move(content),
        .modified_at = modified_at,
        .content_hash = std::move(hash)
    };
}

[[nodiscard]] inline NoteVersion local_version(const Note& note) {
    return make_version(note.id, note.content, note.updated_at);
}

} // namespace vaultsync
