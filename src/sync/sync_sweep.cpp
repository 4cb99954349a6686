#include "sync/sync_sweep.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QThreadPool>

#include <algorithm>
#include <atomic>
#include <exception>
#include <unordered_set>

namespace vaultsync::sync {

namespace {

struct Tally {
    std::atomic<int> synced{0};
    std::atomic<int> failed{0};
    std::atomic<int> conflicts{0};
    std::atomic<bool> cancelled{false};
};

QString id_text(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

} // namespace

SyncSweep::SyncSweep(SyncCoordinator& coordinator,
                     VaultRepository& vaults,
                     NoteRepository& notes,
                     storage::SyncStateRepository& states,
                     storage::RetryQueueRepository& queue,
                     const Clock& clock,
                     int worker_count)
    : coordinator_(coordinator)
    , vaults_(vaults)
    , notes_(notes)
    , states_(states)
    , queue_(queue)
    , clock_(clock)
    , worker_count_(std::max(1, worker_count)) {}

Result<std::vector<Uuid>, Error> SyncSweep::plan(const Vault& vault) {
    using R = Result<std::vector<Uuid>, Error>;

    std::vector<Uuid> order;
    std::unordered_set<Uuid> seen;
    const auto take = [&](const Uuid& id) {
        if (seen.insert(id).second) {
            order.push_back(id);
        }
    };

    auto ready = queue_.get_items_ready_for_retry(clock_.now());
    if (ready.is_err()) {
        return R::err(ready.unwrap_err());
    }
    for (const auto& item : ready.unwrap()) {
        if (item.vault_id == vault.id) {
            take(item.note_id);
        }
    }

    // Anything still queued waits for its own schedule.
    auto queued = queue_.get_for_vault(vault.id);
    if (queued.is_err()) {
        return R::err(queued.unwrap_err());
    }
    std::unordered_set<Uuid> waiting;
    for (const auto& item : queued.unwrap()) {
        waiting.insert(item.note_id);
    }

    auto unsynced = notes_.get_unsynced_notes(vault.id);
    if (unsynced.is_err()) {
        return R::err(unsynced.unwrap_err());
    }
    for (const auto& note : unsynced.unwrap()) {
        if (!waiting.contains(note.id)) {
            take(note.id);
        }
    }

    auto pending = states_.get_pending_uploads(vault.id, queue_.max_retries());
    if (pending.is_err()) {
        return R::err(pending.unwrap_err());
    }
    for (const auto& state : pending.unwrap()) {
        if (!waiting.contains(state.note_id)) {
            take(state.note_id);
        }
    }

    auto downloads = states_.get_pending_downloads(vault.id);
    if (downloads.is_err()) {
        return R::err(downloads.unwrap_err());
    }
    for (const auto& state : downloads.unwrap()) {
        if (!waiting.contains(state.note_id)) {
            take(state.note_id);
        }
    }

    return R::ok(std::move(order));
}

Result<SweepSummary, Error> SyncSweep::run_sweep(const CancellationToken& cancel) {
    auto vaults_result = vaults_.get_all_vaults();
    if (vaults_result.is_err()) {
        qCWarning(vaultsyncSyncLog) << "sweep aborted, cannot list vaults:"
                                    << vaults_result.unwrap_err().message.c_str();
        return Result<SweepSummary, Error>::err(vaults_result.unwrap_err());
    }

    SweepSummary summary;
    Tally tally;

    QThreadPool pool;
    pool.setMaxThreadCount(worker_count_);

    for (const auto& vault : vaults_result.unwrap()) {
        if (cancel.is_cancelled()) {
            tally.cancelled = true;
            break;
        }
        if (!vault.sync_enabled) {
            qCDebug(vaultsyncSyncLog) << "skipping disabled vault" << vault.name.c_str();
            continue;
        }

        auto pulled = coordinator_.pull_changes(vault.id);
        if (pulled.is_err()) {
            qCWarning(vaultsyncSyncLog) << "could not list vault" << vault.name.c_str() << ":"
                                        << pulled.unwrap_err().message.c_str();
        } else if (pulled.unwrap() > 0) {
            qCInfo(vaultsyncSyncLog) << "vault" << vault.name.c_str() << "has"
                                     << pulled.unwrap() << "changed notes";
        }

        auto plan_result = plan(vault);
        if (plan_result.is_err()) {
            qCWarning(vaultsyncSyncLog) << "skipping vault" << vault.name.c_str() << ":"
                                        << plan_result.unwrap_err().message.c_str();
            continue;
        }
        const auto& order = plan_result.unwrap();
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: sweep vault=" << vault.name.c_str() << "notes=" << order.size();
        }

        for (const auto& note_id : order) {
            if (cancel.is_cancelled()) {
                tally.cancelled = true;
                break;
            }
            pool.start([this, note_id, &cancel, &tally] {
                // Queued but not started before cancellation: leave untouched.
                if (cancel.is_cancelled()) {
                    tally.cancelled = true;
                    return;
                }
                try {
                    auto result = coordinator_.sync_note(note_id);
                    if (result.is_err()) {
                        tally.failed.fetch_add(1);
                        qCWarning(vaultsyncSyncLog) << "sync of note" << id_text(note_id)
                                                    << "hit a storage error:"
                                                    << result.unwrap_err().message.c_str();
                        return;
                    }
                    switch (result.unwrap().kind) {
                        case SyncOutcome::Kind::Success: tally.synced.fetch_add(1); break;
                        case SyncOutcome::Kind::Conflict: tally.conflicts.fetch_add(1); break;
                        case SyncOutcome::Kind::Failed: tally.failed.fetch_add(1); break;
                    }
                } catch (const std::exception& e) {
                    tally.failed.fetch_add(1);
                    qCCritical(vaultsyncSyncLog) << "sync of note" << id_text(note_id)
                                                 << "threw:" << e.what();
                }
            });
        }
        pool.waitForDone();

        if (tally.cancelled) {
            break;
        }

        ++summary.vaults_processed;
        auto stamped = vaults_.update_last_synced(vault.id, clock_.now());
        if (stamped.is_err()) {
            qCWarning(vaultsyncSyncLog) << "could not stamp vault" << vault.name.c_str() << ":"
                                        << stamped.unwrap_err().message.c_str();
        }
    }
    pool.waitForDone();

    summary.total_synced = tally.synced.load();
    summary.total_failed = tally.failed.load();
    summary.total_conflicts = tally.conflicts.load();
    summary.cancelled = tally.cancelled.load();

    qCInfo(vaultsyncSyncLog) << "sweep finished: synced=" << summary.total_synced
                             << "failed=" << summary.total_failed
                             << "conflicts=" << summary.total_conflicts
                             << "vaults=" << summary.vaults_processed
                             << (summary.cancelled ? "(cancelled)" : "");
    return Result<SweepSummary, Error>::ok(summary);
}

} // namespace vaultsync::sync
