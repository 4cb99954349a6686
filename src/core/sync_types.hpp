#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace vaultsync {

/**
 * SyncStatus - where a note stands relative to its vault copy.
 */
enum class SyncStatus {
    NeverSynced,
    PendingUpload,
    PendingDownload,
    Synced,
    Conflict,
    Error
};

// Stable text form used in the sync_states.status column.
[[nodiscard]] std::string_view to_string(SyncStatus status) noexcept;
[[nodiscard]] std::optional<SyncStatus> parse_sync_status(std::string_view text) noexcept;

/**
 * SyncState - per-note synchronization bookkeeping.
 *
 * Invariants kept by the coordinator:
 * - status == Synced implies retry_count == 0 and no last_error.
 * - status == Conflict implies remote_modified_at is set and the local and
 *   remote versions differ.
 * - ancestor_hash is the content hash both sides last agreed on; it is
 *   absent until the first successful sync.
 */
struct SyncState {
    Uuid note_id;
    Uuid vault_id;
    SyncStatus status = SyncStatus::NeverSynced;
    Timestamp local_modified_at;
    std::optional<Timestamp> remote_modified_at;
    std::optional<Timestamp> last_synced_at;
    std::optional<std::string> remote_path;
    std::optional<std::string> ancestor_hash;
    int retry_count = 0;
    std::optional<std::string> last_error;

    bool operator==(const SyncState&) const = default;

    [[nodiscard]] bool is_synced() const noexcept { return status == SyncStatus::Synced; }
};

[[nodiscard]] inline SyncState never_synced(const Uuid& note_id,
                                            const Uuid& vault_id,
                                            Timestamp local_modified_at) {
    return SyncState{
        .note_id = note_id,
        .vault_id = vault_id,
        .status = SyncStatus::NeverSynced,
        .local_modified_at = local_modified_at
    };
}

// Attempts after which a retry item is parked in the failed set.
constexpr int DEFAULT_MAX_RETRIES = 5;

/**
 * RetryQueueItem - schedule for the next attempt of a note whose last sync
 * failed. At most one per note; removed on the note's next success.
 *
 * retry_count is the queue's own counter and is what drives backoff.
 * SyncState::retry_count counts the same failures but is informational.
 */
struct RetryQueueItem {
    Uuid note_id;
    Uuid vault_id;
    int retry_count = 0;
    Timestamp last_attempt_at;
    Timestamp next_retry_at;
    std::optional<std::string> last_error_message;
    Timestamp created_at;

    bool operator==(const RetryQueueItem&) const = default;

    [[nodiscard]] bool has_exceeded(int max_retries) const noexcept {
        return retry_count >= max_retries;
    }

    [[nodiscard]] bool is_ready(Timestamp now) const noexcept {
        return next_retry_at <= now;
    }
};

/**
 * AncestorRecord - the last content both sides agreed on, kept so the
 * resolver can tell which side changed and the merge strategy has a base.
 */
struct AncestorRecord {
    Uuid note_id;
    Uuid vault_id;
    std::string content_hash;
    std::string content;
    Timestamp recorded_at;

    bool operator==(const AncestorRecord&) const = default;
};

} // namespace vaultsync
