#pragma once

#include "core/note.hpp"
#include "core/vault.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace vaultsync::sync {

enum class ConflictOutcome {
    LocalWins,
    RemoteWins,
    Merged,
    Unresolvable
};

[[nodiscard]] std::string_view to_string(ConflictOutcome outcome) noexcept;

/**
 * ConflictDecision - what to write after comparing the two sides.
 * `winning_content` is empty for Unresolvable.
 */
struct ConflictDecision {
    std::string winning_content;
    ConflictOutcome outcome = ConflictOutcome::LocalWins;
    bool both_changed = false;
    std::string reason;

    bool operator==(const ConflictDecision&) const = default;
};

/**
 * Ancestor - the last agreed content. `content` may be unknown even when
 * the hash is known (the merge strategy then falls back to last-write-wins).
 */
struct Ancestor {
    std::optional<std::string> content_hash;
    std::optional<std::string> content;
};

/**
 * Decide the winner between the local note and the vault copy.
 *
 * Pure and deterministic:
 * - identical hashes: LocalWins, nothing to reconcile;
 * - no ancestor hash: later modified_at wins, ties go to local;
 * - one side unchanged since the ancestor: the changed side wins;
 * - both changed: `strategy` decides. Last-write-wins reports
 *   Unresolvable on exactly equal timestamps.
 */
[[nodiscard]] ConflictDecision resolve(const NoteVersion& local,
                                       const NoteVersion& remote,
                                       const Ancestor& ancestor,
                                       ConflictStrategy strategy);

} // namespace vaultsync::sync
