#pragma once

#include "core/clock.hpp"
#include "core/repositories.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include "storage/ancestor_repository.hpp"
#include "storage/retry_queue_repository.hpp"
#include "storage/sync_state_repository.hpp"
#include "sync/backoff.hpp"
#include "sync/conflict_resolver.hpp"
#include "sync/note_lock.hpp"
#include "sync/provider.hpp"
#include <optional>
#include <string>

namespace vaultsync::sync {

/**
 * SyncOutcome - result of one sync attempt that reached a decision.
 *
 * Success: the vault holds what this attempt wrote or adopted. The state is
 *   Synced, or PendingUpload if the note was edited while the attempt ran.
 * Conflict: the resolver could not pick a side; the state is Conflict.
 * Failed: the provider failed or the note is gone; see `error`. A
 *   Cancelled error means a local edit arrived before the vault copy could
 *   be written locally; nothing was overwritten and the note is
 *   PendingUpload, not queued.
 */
struct SyncOutcome {
    enum class Kind {
        Success,
        Conflict,
        Failed
    };

    Kind kind = Kind::Success;
    std::optional<ConflictDecision> decision;
    std::optional<Error> error;

    [[nodiscard]] static SyncOutcome success(std::optional<ConflictDecision> decision = std::nullopt) {
        return SyncOutcome{Kind::Success, std::move(decision), std::nullopt};
    }
    [[nodiscard]] static SyncOutcome conflict(ConflictDecision decision) {
        return SyncOutcome{Kind::Conflict, std::move(decision), std::nullopt};
    }
    [[nodiscard]] static SyncOutcome failed(Error error) {
        return SyncOutcome{Kind::Failed, std::nullopt, std::move(error)};
    }

    [[nodiscard]] bool is_success() const noexcept { return kind == Kind::Success; }
    [[nodiscard]] bool is_conflict() const noexcept { return kind == Kind::Conflict; }
    [[nodiscard]] bool is_failed() const noexcept { return kind == Kind::Failed; }
};

/**
 * SyncCoordinator - runs one note's sync attempt end to end.
 *
 * Reads the note's current state from the stores on every call, asks the
 * provider what the vault holds, lets the resolver pick a side, writes the
 * winner and records the outcome (Synced, Conflict or Error plus a retry
 * item scheduled by the backoff policy).
 *
 * Only storage failures come back as Err. Provider failures, including a
 * provider that throws, and conflicts are outcomes. Attempts on one note
 * are serialized through locks(); attempts on different notes may run in
 * parallel provided the Provider implementations are thread-safe.
 */
class SyncCoordinator {
public:
    SyncCoordinator(storage::SyncStateRepository& states,
                    storage::RetryQueueRepository& queue,
                    storage::AncestorRepository& ancestors,
                    NoteRepository& notes,
                    VaultRepository& vaults,
                    const ProviderRegistry& providers,
                    const Clock& clock,
                    BackoffPolicy backoff = {});

    [[nodiscard]] Result<SyncOutcome, Error> sync_note(const Uuid& note_id);

    /**
     * Ask the vault which files changed since we last saw them and mark
     * those notes PendingDownload. Files whose bytes match the last synced
     * version are skipped. Returns the number of notes marked.
     *
     * Err on storage failures and when the vault cannot be listed.
     */
    [[nodiscard]] Result<int, Error> pull_changes(const Uuid& vault_id);

    /**
     * Re-run every Conflict note of the vault now, ignoring the retry
     * schedule and limit. `strategy` overrides the vault's own, e.g. when
     * the user picks a side. Returns the number that ended Synced.
     */
    [[nodiscard]] Result<int, Error> resolve_conflicts(const Uuid& vault_id,
                                                       std::optional<ConflictStrategy> strategy = std::nullopt);

    /**
     * Start tracking a freshly captured note. No-op if already tracked.
     */
    [[nodiscard]] Result<void, Error> track_new_note(const Note& note);

    /**
     * The note was edited locally. A Conflict row keeps its status.
     */
    [[nodiscard]] Result<void, Error> mark_local_change(const Note& note);

    /**
     * The vault copy was seen to change (e.g. by a file watcher).
     */
    [[nodiscard]] Result<void, Error> mark_remote_change(const Uuid& note_id,
                                                         const Uuid& vault_id,
                                                         Timestamp remote_modified_at);

    /**
     * Forget everything known about the vault and re-upload every note.
     * Returns the number of notes scheduled.
     */
    [[nodiscard]] Result<int, Error> force_resync(const Uuid& vault_id);

    /**
     * Percentage (0..100) of the vault's tracked notes that are Synced.
     * A vault with no tracked notes is 100.
     */
    [[nodiscard]] Result<int, Error> sync_progress(const Uuid& vault_id);

    [[nodiscard]] const BackoffPolicy& backoff() const noexcept { return backoff_; }

    /**
     * Held by every operation that reads and writes one note's state.
     */
    [[nodiscard]] NoteLockTable& locks() noexcept { return locks_; }

private:
    storage::SyncStateRepository& states_;
    storage::RetryQueueRepository& queue_;
    storage::AncestorRepository& ancestors_;
    NoteRepository& notes_;
    VaultRepository& vaults_;
    const ProviderRegistry& providers_;
    const Clock& clock_;
    BackoffPolicy backoff_;
    NoteLockTable locks_;

    struct Attempt;

    [[nodiscard]] Result<SyncOutcome, Error> run(const Uuid& note_id,
                                                 std::optional<ConflictStrategy> strategy);
    [[nodiscard]] Result<SyncOutcome, Error> attempt_sync(const Uuid& note_id,
                                                          std::optional<ConflictStrategy> strategy);
    [[nodiscard]] Result<bool, Error> load(const Uuid& note_id, Attempt& attempt);
    [[nodiscard]] Result<SyncOutcome, Error> reconcile(Attempt& attempt);
    [[nodiscard]] Result<SyncOutcome, Error> push(Attempt& attempt,
                                                  std::optional<ConflictDecision> decision);
    [[nodiscard]] Result<SyncOutcome, Error> pull_new(Attempt& attempt, const RemoteMetadata& meta);
    [[nodiscard]] Result<SyncOutcome, Error> apply(Attempt& attempt, const RemoteMetadata& meta,
                                                   const NoteVersion& remote,
                                                   ConflictDecision decision);

    [[nodiscard]] Result<SyncOutcome, Error> record_success(Attempt& attempt,
                                                            const Note& synced_note,
                                                            const std::string& path,
                                                            Timestamp remote_modified_at,
                                                            std::optional<ConflictDecision> decision);
    [[nodiscard]] Result<SyncOutcome, Error> record_failure(Attempt& attempt, Error error);
    [[nodiscard]] Result<SyncOutcome, Error> record_exception(const Uuid& note_id, const std::string& what);
    [[nodiscard]] Result<SyncOutcome, Error> record_superseded(Attempt& attempt, Timestamp remote_modified_at);
    [[nodiscard]] Result<SyncOutcome, Error> record_conflict(Attempt& attempt,
                                                             const NoteVersion& remote,
                                                             ConflictDecision decision);
    [[nodiscard]] Result<void, Error> schedule_retry(const Attempt& attempt,
                                                     const std::string& message);
    [[nodiscard]] Result<SyncOutcome, Error> forget(const Uuid& note_id, Error error);
};

} // namespace vaultsync::sync
