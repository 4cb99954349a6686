#pragma once

#include "storage/database.hpp"
#include "core/sync_types.hpp"
#include "core/result.hpp"
#include <map>
#include <vector>
#include <optional>

namespace vaultsync::storage {

/**
 * SyncStateRepository - per-note sync bookkeeping (sync_states table).
 *
 * Every call re-reads from the database; nothing is cached.
 */
class SyncStateRepository {
public:
    explicit SyncStateRepository(Database& db) : db_(db) {}

    /**
     * Absent is not an error: a note that was never tracked has no row.
     */
    [[nodiscard]] Result<std::optional<SyncState>, Error> get(const Uuid& note_id);

    [[nodiscard]] Result<std::vector<SyncState>, Error> get_by_vault(const Uuid& vault_id);
    [[nodiscard]] Result<std::vector<SyncState>, Error> get_by_status(SyncStatus status);
    [[nodiscard]] Result<std::vector<SyncState>, Error> get_by_status_for_vault(
        const Uuid& vault_id, SyncStatus status);

    /**
     * PendingUpload, plus Error rows still under the retry limit, oldest
     * local edit first.
     */
    [[nodiscard]] Result<std::vector<SyncState>, Error> get_pending_uploads(
        const Uuid& vault_id, int max_retries = DEFAULT_MAX_RETRIES);

    [[nodiscard]] Result<std::vector<SyncState>, Error> get_pending_downloads(const Uuid& vault_id);

    /**
     * Conflict rows, most recent local edit first.
     */
    [[nodiscard]] Result<std::vector<SyncState>, Error> get_conflicts(const Uuid& vault_id);

    [[nodiscard]] Result<int, Error> count_by_status(const Uuid& vault_id, SyncStatus status);
    [[nodiscard]] Result<int, Error> error_count(const Uuid& vault_id);

    /**
     * Row count per status for a vault. Every status is present, zero or not.
     */
    [[nodiscard]] Result<std::map<SyncStatus, int>, Error> statistics(const Uuid& vault_id);

    [[nodiscard]] Result<void, Error> upsert(const SyncState& state);

    /**
     * All rows or none.
     */
    [[nodiscard]] Result<void, Error> upsert_all(const std::vector<SyncState>& states);

    [[nodiscard]] Result<void, Error> remove(const Uuid& note_id);
    [[nodiscard]] Result<void, Error> remove_for_vault(const Uuid& vault_id);

    /**
     * Cleanup: drop Synced rows. Returns the number removed.
     */
    [[nodiscard]] Result<int, Error> remove_synced();

    /**
     * Zero the counter on Error rows so that get_pending_uploads picks them
     * up again. Returns the number of rows touched.
     */
    [[nodiscard]] Result<int, Error> reset_retry_counts_for_errors();

private:
    Database& db_;

    [[nodiscard]] static SyncState row_to_state(Statement& stmt);
    [[nodiscard]] Result<void, Error> upsert_locked(const SyncState& state);

    template<typename... Args>
    [[nodiscard]] Result<std::vector<SyncState>, Error> select(const std::string& tail,
                                                               const Args&... args);
};

} // namespace vaultsync::storage
