#include "sync/sync_coordinator.hpp"
#include "core/log.hpp"

#include <QDebug>

#include <exception>

namespace vaultsync::sync {

namespace {

QString id_text(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

} // namespace

struct SyncCoordinator::Attempt {
    Uuid note_id;
    Vault vault;
    std::optional<SyncState> state;
    std::optional<Note> note;
    std::shared_ptr<Provider> provider;
    Ancestor ancestor;

    [[nodiscard]] SyncState base_state() const {
        if (state) return *state;
        return never_synced(note_id, vault.id, note ? note->updated_at : Timestamp{});
    }

    // The vault copy is wanted even if nothing local exists yet.
    [[nodiscard]] bool pull_requested() const {
        if (!state) return false;
        if (state->status == SyncStatus::PendingDownload) return true;
        return !note && state->status == SyncStatus::Error && state->remote_modified_at.has_value();
    }
};

SyncCoordinator::SyncCoordinator(storage::SyncStateRepository& states,
                                 storage::RetryQueueRepository& queue,
                                 storage::AncestorRepository& ancestors,
                                 NoteRepository& notes,
                                 VaultRepository& vaults,
                                 const ProviderRegistry& providers,
                                 const Clock& clock,
                                 BackoffPolicy backoff)
    : states_(states)
    , queue_(queue)
    , ancestors_(ancestors)
    , notes_(notes)
    , vaults_(vaults)
    , providers_(providers)
    , clock_(clock)
    , backoff_(backoff) {}

Result<SyncOutcome, Error> SyncCoordinator::sync_note(const Uuid& note_id) {
    return run(note_id, std::nullopt);
}

Result<SyncOutcome, Error> SyncCoordinator::run(const Uuid& note_id,
                                                std::optional<ConflictStrategy> strategy) {
    auto guard = locks_.lock(note_id);
    try {
        return attempt_sync(note_id, strategy);
    } catch (const std::exception& e) {
        return record_exception(note_id, e.what());
    }
}

Result<bool, Error> SyncCoordinator::load(const Uuid& note_id, Attempt& attempt) {
    using R = Result<bool, Error>;

    auto state_result = states_.get(note_id);
    if (state_result.is_err()) {
        return R::err(state_result.unwrap_err());
    }
    auto note_result = notes_.get_note(note_id);
    if (note_result.is_err()) {
        return R::err(note_result.unwrap_err());
    }

    attempt.note_id = note_id;
    attempt.state = std::move(state_result).unwrap();
    attempt.note = std::move(note_result).unwrap();

    std::optional<Uuid> vault_id;
    if (attempt.note) {
        vault_id = attempt.note->vault_id;
    } else if (attempt.state) {
        vault_id = attempt.state->vault_id;
    }
    if (!vault_id) {
        return R::ok(false);
    }

    auto vault_result = vaults_.get_vault(*vault_id);
    if (vault_result.is_err()) {
        return R::err(vault_result.unwrap_err());
    }
    auto vault = std::move(vault_result).unwrap();
    if (!vault) {
        return R::ok(false);
    }
    attempt.vault = std::move(*vault);
    return R::ok(true);
}

Result<SyncOutcome, Error> SyncCoordinator::attempt_sync(const Uuid& note_id,
                                                         std::optional<ConflictStrategy> strategy) {
    using R = Result<SyncOutcome, Error>;

    Attempt attempt;
    auto loaded = load(note_id, attempt);
    if (loaded.is_err()) {
        return R::err(loaded.unwrap_err());
    }
    if (!loaded.unwrap()) {
        const bool known = attempt.note || attempt.state;
        return forget(note_id, Error{ErrorKind::NotFound,
            (known ? "Vault not found for note: " : "Note not found: ") + note_id.to_string()});
    }
    if (strategy) {
        attempt.vault.conflict_strategy = *strategy;
    }

    if (!attempt.note && !attempt.pull_requested()) {
        return forget(note_id, Error{ErrorKind::NotFound, "Note not found: " + note_id.to_string()});
    }

    if (attempt.state && attempt.state->ancestor_hash) {
        attempt.ancestor.content_hash = attempt.state->ancestor_hash;
        auto ancestor_result = ancestors_.get(note_id);
        if (ancestor_result.is_err()) {
            return R::err(ancestor_result.unwrap_err());
        }
        const auto& record = ancestor_result.unwrap();
        if (record && record->content_hash == *attempt.state->ancestor_hash) {
            attempt.ancestor.content = record->content;
        }
    }

    attempt.provider = providers_.provider_for(attempt.vault);
    if (!attempt.provider) {
        return record_failure(attempt, Error{ErrorKind::ProviderUnavailable,
            "No provider for " + std::string(to_string(attempt.vault.provider_type)) + " vaults"});
    }
    if (!attempt.provider->is_available(attempt.vault)) {
        return record_failure(attempt, Error{ErrorKind::ProviderUnavailable,
            "Vault unavailable: " + attempt.vault.name});
    }

    return reconcile(attempt);
}

Result<SyncOutcome, Error> SyncCoordinator::reconcile(Attempt& attempt) {
    auto meta_result = attempt.provider->get_metadata(attempt.note_id, attempt.vault);
    if (meta_result.is_err()) {
        return record_failure(attempt, meta_result.unwrap_err());
    }
    const auto& meta = meta_result.unwrap();

    if (!attempt.note) {
        if (!meta) {
            return forget(attempt.note_id, Error{ErrorKind::NotFound,
                "Note missing locally and in vault: " + attempt.note_id.to_string()});
        }
        return pull_new(attempt, *meta);
    }

    const bool remote_moved = meta && (!attempt.ancestor.content_hash ||
                                       meta->content_hash != *attempt.ancestor.content_hash);
    if (meta && (remote_moved || attempt.pull_requested())) {
        auto remote_result = attempt.provider->load_note(attempt.note_id, attempt.vault);
        if (remote_result.is_err()) {
            return record_failure(attempt, remote_result.unwrap_err());
        }
        const auto& remote = remote_result.unwrap();
        auto decision = resolve(local_version(*attempt.note), remote, attempt.ancestor,
                                attempt.vault.conflict_strategy);

        if (sync_debug_enabled()) {
            qInfo() << "SYNC: resolve note=" << id_text(attempt.note_id)
                    << "outcome=" << to_string(decision.outcome).data()
                    << "reason=" << decision.reason.c_str();
        }
        return apply(attempt, *meta, remote, std::move(decision));
    }

    const auto local_hash = content_hash(attempt.note->content);
    const bool local_moved = !attempt.ancestor.content_hash ||
                             local_hash != *attempt.ancestor.content_hash;
    const bool settled = attempt.state && attempt.state->status == SyncStatus::Synced;
    if (local_moved || !settled) {
        return push(attempt, std::nullopt);
    }

    qCDebug(vaultsyncSyncLog) << "note" << id_text(attempt.note_id) << "already in sync";
    return Result<SyncOutcome, Error>::ok(SyncOutcome::success());
}

Result<SyncOutcome, Error> SyncCoordinator::push(Attempt& attempt,
                                                 std::optional<ConflictDecision> decision) {
    const Note& note = *attempt.note;
    auto save_result = attempt.provider->save_note(note, attempt.vault);
    if (save_result.is_err()) {
        return record_failure(attempt, save_result.unwrap_err());
    }
    const auto path = save_result.unwrap();

    // Prefer the vault's own mtime; fall back to our clock if it cannot say.
    Timestamp remote_modified_at = clock_.now();
    auto meta_result = attempt.provider->get_metadata(note.id, attempt.vault);
    if (meta_result.is_ok() && meta_result.unwrap()) {
        remote_modified_at = meta_result.unwrap()->modified_at;
    } else if (meta_result.is_err()) {
        qCDebug(vaultsyncSyncLog) << "metadata after save failed for" << id_text(note.id)
                                  << meta_result.unwrap_err().message.c_str();
    }

    if (sync_debug_enabled()) {
        qInfo() << "SYNC: pushed note=" << id_text(note.id) << "path=" << path.c_str();
    }
    return record_success(attempt, note, path, remote_modified_at, std::move(decision));
}

Result<SyncOutcome, Error> SyncCoordinator::pull_new(Attempt& attempt, const RemoteMetadata& meta) {
    auto remote_result = attempt.provider->load_note(attempt.note_id, attempt.vault);
    if (remote_result.is_err()) {
        return record_failure(attempt, remote_result.unwrap_err());
    }
    const auto& remote = remote_result.unwrap();

    auto note = create_note(attempt.note_id, attempt.vault.id, remote.content, {}, remote.modified_at);
    note.file_path = meta.path;
    note.is_synced = true;

    auto applied = notes_.apply_remote(note, std::nullopt);
    if (applied.is_err()) {
        return Result<SyncOutcome, Error>::err(applied.unwrap_err());
    }
    if (!applied.unwrap()) {
        return record_superseded(attempt, remote.modified_at);
    }

    if (sync_debug_enabled()) {
        qInfo() << "SYNC: pulled new note=" << id_text(note.id) << "path=" << meta.path.c_str();
    }
    ConflictDecision decision{remote.content, ConflictOutcome::RemoteWins, false, "note only in vault"};
    return record_success(attempt, note, meta.path, remote.modified_at, std::move(decision));
}

Result<SyncOutcome, Error> SyncCoordinator::apply(Attempt& attempt,
                                                  const RemoteMetadata& meta,
                                                  const NoteVersion& remote,
                                                  ConflictDecision decision) {
    switch (decision.outcome) {
        case ConflictOutcome::LocalWins:
            if (content_hash(attempt.note->content) == remote.content_hash) {
                // Both sides already hold these bytes; adopt the vault's file.
                return record_success(attempt, *attempt.note, meta.path, remote.modified_at,
                                      std::move(decision));
            }
            return push(attempt, std::move(decision));

        case ConflictOutcome::RemoteWins: {
            Note updated = *attempt.note;
            updated.content = remote.content;
            updated.updated_at = remote.modified_at;
            updated.file_path = meta.path;
            updated.is_synced = true;
            auto applied = notes_.apply_remote(updated, attempt.note);
            if (applied.is_err()) {
                return Result<SyncOutcome, Error>::err(applied.unwrap_err());
            }
            if (!applied.unwrap()) {
                return record_superseded(attempt, remote.modified_at);
            }
            attempt.note = updated;
            return record_success(attempt, updated, meta.path, remote.modified_at,
                                  std::move(decision));
        }

        case ConflictOutcome::Merged: {
            auto merged = with_content(*attempt.note, decision.winning_content, clock_.now());
            auto applied = notes_.apply_remote(merged, attempt.note);
            if (applied.is_err()) {
                return Result<SyncOutcome, Error>::err(applied.unwrap_err());
            }
            if (!applied.unwrap()) {
                return record_superseded(attempt, remote.modified_at);
            }
            attempt.note = merged;
            return push(attempt, std::move(decision));
        }

        case ConflictOutcome::Unresolvable:
            break;
    }
    return record_conflict(attempt, remote, std::move(decision));
}

Result<SyncOutcome, Error> SyncCoordinator::record_success(Attempt& attempt,
                                                           const Note& synced_note,
                                                           const std::string& path,
                                                           Timestamp remote_modified_at,
                                                           std::optional<ConflictDecision> decision) {
    using R = Result<SyncOutcome, Error>;
    const auto now = clock_.now();
    auto hash = content_hash(synced_note.content);

    // False when the note was edited after `synced_note` was read.
    auto marked = notes_.mark_synced(synced_note, path);
    if (marked.is_err()) {
        return R::err(marked.unwrap_err());
    }
    const bool current = marked.unwrap();

    auto stored = ancestors_.put(AncestorRecord{
        .note_id = synced_note.id,
        .vault_id = attempt.vault.id,
        .content_hash = hash,
        .content = synced_note.content,
        .recorded_at = now
    });
    if (stored.is_err()) {
        return R::err(stored.unwrap_err());
    }

    auto state = attempt.base_state();
    state.vault_id = attempt.vault.id;
    state.status = SyncStatus::Synced;
    state.local_modified_at = synced_note.updated_at;
    state.remote_modified_at = remote_modified_at;
    state.last_synced_at = now;
    state.remote_path = path;
    state.ancestor_hash = std::move(hash);
    state.retry_count = 0;
    state.last_error.reset();

    if (!current) {
        auto fresh = notes_.get_note(synced_note.id);
        if (fresh.is_err()) {
            return R::err(fresh.unwrap_err());
        }
        state.status = SyncStatus::PendingUpload;
        if (fresh.unwrap()) {
            state.local_modified_at = fresh.unwrap()->updated_at;
        }
    }

    auto upserted = states_.upsert(state);
    if (upserted.is_err()) {
        return R::err(upserted.unwrap_err());
    }
    auto dequeued = queue_.remove(synced_note.id);
    if (dequeued.is_err()) {
        return R::err(dequeued.unwrap_err());
    }

    attempt.state = std::move(state);
    if (current) {
        qCDebug(vaultsyncSyncLog) << "note" << id_text(synced_note.id) << "synced to" << path.c_str();
    } else {
        qCInfo(vaultsyncSyncLog) << "note" << id_text(synced_note.id)
                                 << "was edited during sync, newer version left pending upload";
    }
    return R::ok(SyncOutcome::success(std::move(decision)));
}

Result<void, Error> SyncCoordinator::schedule_retry(const Attempt& attempt,
                                                    const std::string& message) {
    const auto now = clock_.now();
    auto existing_result = queue_.get(attempt.note_id);
    if (existing_result.is_err()) {
        return Result<void, Error>::err(existing_result.unwrap_err());
    }
    const auto& existing = existing_result.unwrap();

    const int failures = existing ? existing->retry_count + 1 : 1;
    return queue_.upsert(RetryQueueItem{
        .note_id = attempt.note_id,
        .vault_id = attempt.vault.id,
        .retry_count = failures,
        .last_attempt_at = now,
        .next_retry_at = now + backoff_.delay(failures),
        .last_error_message = message,
        .created_at = existing ? existing->created_at : now
    });
}

Result<SyncOutcome, Error> SyncCoordinator::record_failure(Attempt& attempt, Error error) {
    using R = Result<SyncOutcome, Error>;

    auto state = attempt.base_state();
    state.vault_id = attempt.vault.id;
    state.status = SyncStatus::Error;
    if (attempt.note) {
        state.local_modified_at = attempt.note->updated_at;
    }
    state.retry_count += 1;
    state.last_error = error.message;

    auto upserted = states_.upsert(state);
    if (upserted.is_err()) {
        return R::err(upserted.unwrap_err());
    }
    auto scheduled = schedule_retry(attempt, error.message);
    if (scheduled.is_err()) {
        return R::err(scheduled.unwrap_err());
    }

    qCWarning(vaultsyncSyncLog) << "sync of note" << id_text(attempt.note_id) << "failed ("
                                << to_string(error.kind).data() << "):" << error.message.c_str();
    attempt.state = std::move(state);
    return R::ok(SyncOutcome::failed(std::move(error)));
}

Result<SyncOutcome, Error> SyncCoordinator::record_exception(const Uuid& note_id,
                                                            const std::string& what) {
    using R = Result<SyncOutcome, Error>;
    qCCritical(vaultsyncSyncLog) << "sync of note" << id_text(note_id) << "threw:" << what.c_str();

    Error error{ErrorKind::Generic, "provider threw: " + what};
    Attempt attempt;
    auto loaded = load(note_id, attempt);
    if (loaded.is_err()) {
        return R::err(loaded.unwrap_err());
    }
    if (!loaded.unwrap()) {
        return R::ok(SyncOutcome::failed(std::move(error)));
    }
    return record_failure(attempt, std::move(error));
}

// A local edit landed while the vault copy was being applied. The edit
// stays; the next attempt resolves it against the vault again.
Result<SyncOutcome, Error> SyncCoordinator::record_superseded(Attempt& attempt,
                                                              Timestamp remote_modified_at) {
    using R = Result<SyncOutcome, Error>;

    auto fresh = notes_.get_note(attempt.note_id);
    if (fresh.is_err()) {
        return R::err(fresh.unwrap_err());
    }

    auto state = attempt.base_state();
    state.vault_id = attempt.vault.id;
    state.status = SyncStatus::PendingUpload;
    if (fresh.unwrap()) {
        state.local_modified_at = fresh.unwrap()->updated_at;
    }
    state.remote_modified_at = remote_modified_at;
    state.retry_count = 0;
    state.last_error.reset();

    auto upserted = states_.upsert(state);
    if (upserted.is_err()) {
        return R::err(upserted.unwrap_err());
    }
    auto dequeued = queue_.remove(attempt.note_id);
    if (dequeued.is_err()) {
        return R::err(dequeued.unwrap_err());
    }

    qCInfo(vaultsyncSyncLog) << "note" << id_text(attempt.note_id)
                             << "was edited during sync, vault copy not applied";
    attempt.state = std::move(state);
    return R::ok(SyncOutcome::failed(Error{ErrorKind::Cancelled, "note edited during sync"}));
}

Result<SyncOutcome, Error> SyncCoordinator::record_conflict(Attempt& attempt,
                                                            const NoteVersion& remote,
                                                            ConflictDecision decision) {
    using R = Result<SyncOutcome, Error>;

    auto state = attempt.base_state();
    state.vault_id = attempt.vault.id;
    state.status = SyncStatus::Conflict;
    state.local_modified_at = attempt.note->updated_at;
    state.remote_modified_at = remote.modified_at;
    state.retry_count += 1;
    state.last_error = decision.reason;

    auto upserted = states_.upsert(state);
    if (upserted.is_err()) {
        return R::err(upserted.unwrap_err());
    }
    auto scheduled = schedule_retry(attempt, "conflict: " + decision.reason);
    if (scheduled.is_err()) {
        return R::err(scheduled.unwrap_err());
    }

    qCWarning(vaultsyncSyncLog) << "note" << id_text(attempt.note_id)
                                << "left in conflict:" << decision.reason.c_str();
    attempt.state = std::move(state);
    return R::ok(SyncOutcome::conflict(std::move(decision)));
}

Result<SyncOutcome, Error> SyncCoordinator::forget(const Uuid& note_id, Error error) {
    using R = Result<SyncOutcome, Error>;

    auto removed = states_.remove(note_id);
    if (removed.is_err()) {
        return R::err(removed.unwrap_err());
    }
    auto dequeued = queue_.remove(note_id);
    if (dequeued.is_err()) {
        return R::err(dequeued.unwrap_err());
    }
    auto dropped = ancestors_.remove(note_id);
    if (dropped.is_err()) {
        return R::err(dropped.unwrap_err());
    }

    qCInfo(vaultsyncSyncLog) << "stopped tracking note" << id_text(note_id) << ":"
                             << error.message.c_str();
    return R::ok(SyncOutcome::failed(std::move(error)));
}

Result<void, Error> SyncCoordinator::track_new_note(const Note& note) {
    auto existing = states_.get(note.id);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }
    if (existing.unwrap()) {
        return Result<void, Error>::ok();
    }
    return states_.upsert(never_synced(note.id, note.vault_id, note.updated_at));
}

Result<void, Error> SyncCoordinator::mark_local_change(const Note& note) {
    auto existing_result = states_.get(note.id);
    if (existing_result.is_err()) {
        return Result<void, Error>::err(existing_result.unwrap_err());
    }
    auto state = existing_result.unwrap().value_or(
        never_synced(note.id, note.vault_id, note.updated_at));

    if (state.status != SyncStatus::Conflict) {
        state.status = SyncStatus::PendingUpload;
    }
    state.vault_id = note.vault_id;
    state.local_modified_at = note.updated_at;
    return states_.upsert(state);
}

Result<void, Error> SyncCoordinator::mark_remote_change(const Uuid& note_id,
                                                        const Uuid& vault_id,
                                                        Timestamp remote_modified_at) {
    auto existing_result = states_.get(note_id);
    if (existing_result.is_err()) {
        return Result<void, Error>::err(existing_result.unwrap_err());
    }
    auto state = existing_result.unwrap().value_or(
        never_synced(note_id, vault_id, remote_modified_at));

    if (state.status != SyncStatus::Conflict) {
        state.status = SyncStatus::PendingDownload;
    }
    state.remote_modified_at = remote_modified_at;
    return states_.upsert(state);
}

Result<int, Error> SyncCoordinator::pull_changes(const Uuid& vault_id) {
    using R = Result<int, Error>;

    auto vault_result = vaults_.get_vault(vault_id);
    if (vault_result.is_err()) {
        return R::err(vault_result.unwrap_err());
    }
    const auto& vault = vault_result.unwrap();
    if (!vault) {
        return R::err(Error{ErrorKind::NotFound, "Vault not found: " + vault_id.to_string()});
    }

    auto provider = providers_.provider_for(*vault);
    if (!provider) {
        return R::err(Error{ErrorKind::ProviderUnavailable,
            "No provider for " + std::string(to_string(vault->provider_type)) + " vaults"});
    }
    if (!provider->is_available(*vault)) {
        return R::err(Error{ErrorKind::ProviderUnavailable, "Vault unavailable: " + vault->name});
    }
    auto listed = provider->list_notes(*vault);
    if (listed.is_err()) {
        return R::err(listed.unwrap_err());
    }

    int discovered = 0;
    for (const auto& file : listed.unwrap()) {
        auto guard = locks_.lock(file.note_id);
        auto state_result = states_.get(file.note_id);
        if (state_result.is_err()) {
            return R::err(state_result.unwrap_err());
        }
        const auto& state = state_result.unwrap();
        if (state) {
            if (state->vault_id != vault_id) continue;
            if (state->remote_modified_at && file.modified_at <= *state->remote_modified_at) continue;
            if (state->ancestor_hash && *state->ancestor_hash == file.content_hash) continue;
        }

        auto marked = mark_remote_change(file.note_id, vault_id, file.modified_at);
        if (marked.is_err()) {
            return R::err(marked.unwrap_err());
        }
        ++discovered;
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: vault changed note=" << id_text(file.note_id) << "path=" << file.path.c_str();
        }
    }

    qCDebug(vaultsyncSyncLog) << "vault" << vault->name.c_str() << "listed" << listed.unwrap().size()
                              << "files, changed=" << discovered;
    return R::ok(discovered);
}

Result<int, Error> SyncCoordinator::resolve_conflicts(const Uuid& vault_id,
                                                      std::optional<ConflictStrategy> strategy) {
    using R = Result<int, Error>;

    auto conflicts = states_.get_conflicts(vault_id);
    if (conflicts.is_err()) {
        return R::err(conflicts.unwrap_err());
    }

    int resolved = 0;
    for (const auto& state : conflicts.unwrap()) {
        auto outcome = run(state.note_id, strategy);
        if (outcome.is_err()) {
            return R::err(outcome.unwrap_err());
        }
        if (outcome.unwrap().is_success()) {
            ++resolved;
        }
    }

    qCInfo(vaultsyncSyncLog) << "resolved" << resolved << "of" << conflicts.unwrap().size()
                             << "conflicts in vault" << id_text(vault_id);
    return R::ok(resolved);
}

Result<int, Error> SyncCoordinator::force_resync(const Uuid& vault_id) {
    using R = Result<int, Error>;

    auto notes_result = notes_.get_notes_for_vault(vault_id);
    if (notes_result.is_err()) {
        return R::err(notes_result.unwrap_err());
    }
    const auto& notes = notes_result.unwrap();

    auto cleared = states_.remove_for_vault(vault_id)
        .and_then([&] { return queue_.remove_for_vault(vault_id); })
        .and_then([&] { return ancestors_.remove_for_vault(vault_id); });
    if (cleared.is_err()) {
        return R::err(cleared.unwrap_err());
    }

    std::vector<SyncState> fresh;
    fresh.reserve(notes.size());
    for (const auto& note : notes) {
        auto state = never_synced(note.id, vault_id, note.updated_at);
        state.status = SyncStatus::PendingUpload;
        fresh.push_back(std::move(state));
    }

    auto upserted = states_.upsert_all(fresh);
    if (upserted.is_err()) {
        return R::err(upserted.unwrap_err());
    }

    qCInfo(vaultsyncSyncLog) << "forced resync of vault" << id_text(vault_id)
                             << "notes=" << fresh.size();
    return R::ok(static_cast<int>(fresh.size()));
}

Result<int, Error> SyncCoordinator::sync_progress(const Uuid& vault_id) {
    auto stats_result = states_.statistics(vault_id);
    if (stats_result.is_err()) {
        return Result<int, Error>::err(stats_result.unwrap_err());
    }

    int total = 0;
    for (const auto& [status, count] : stats_result.unwrap()) {
        total += count;
    }
    if (total == 0) {
        return Result<int, Error>::ok(100);
    }
    const int synced = stats_result.unwrap().at(SyncStatus::Synced);
    return Result<int, Error>::ok(synced * 100 / total);
}

} // namespace vaultsync::sync
