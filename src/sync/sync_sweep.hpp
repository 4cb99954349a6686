#pragma once

#include "core/clock.hpp"
#include "core/repositories.hpp"
#include "core/result.hpp"
#include "storage/retry_queue_repository.hpp"
#include "storage/sync_state_repository.hpp"
#include "sync/cancellation.hpp"
#include "sync/sync_coordinator.hpp"
#include <vector>

namespace vaultsync::sync {

struct SweepSummary {
    int total_synced = 0;
    int total_failed = 0;
    int total_conflicts = 0;
    int vaults_processed = 0;
    bool cancelled = false;

    bool operator==(const SweepSummary&) const = default;
};

/**
 * SyncSweep - one pass over every sync-enabled vault.
 *
 * Per vault, the vault is first listed for files changed behind our back
 * (SyncCoordinator::pull_changes; a vault that cannot be listed is still
 * swept). Then, in this order and each note at most once:
 *  1. retry items due now (failed items stay parked),
 *  2. unsynced notes that are not in the retry queue,
 *  3. PendingUpload/Error states under the retry limit that are not queued,
 *  4. PendingDownload states that are not queued.
 *
 * Notes run on a QThreadPool of `worker_count` threads. The coordinator's
 * lock table keeps two syncs of one note from overlapping, including syncs
 * started outside the sweep. A failing note is counted and logged, never
 * fatal. Only failing to list the vaults aborts the sweep.
 */
class SyncSweep {
public:
    SyncSweep(SyncCoordinator& coordinator,
              VaultRepository& vaults,
              NoteRepository& notes,
              storage::SyncStateRepository& states,
              storage::RetryQueueRepository& queue,
              const Clock& clock,
              int worker_count = 1);

    [[nodiscard]] Result<SweepSummary, Error> run_sweep(const CancellationToken& cancel);

    /**
     * Notes that would be dispatched for `vault` right now, in dispatch order.
     */
    [[nodiscard]] Result<std::vector<Uuid>, Error> plan(const Vault& vault);

    [[nodiscard]] int worker_count() const noexcept { return worker_count_; }

private:
    SyncCoordinator& coordinator_;
    VaultRepository& vaults_;
    NoteRepository& notes_;
    storage::SyncStateRepository& states_;
    storage::RetryQueueRepository& queue_;
    const Clock& clock_;
    int worker_count_;
};

} // namespace vaultsync::sync
