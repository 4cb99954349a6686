#pragma once

#include "core/repositories.hpp"
#include "core/sync_types.hpp"
#include "storage/retry_queue_repository.hpp"
#include "storage/sync_state_repository.hpp"

#include <QString>

#include <map>
#include <vector>

namespace vaultsync::app {

struct VaultStatus {
    Vault vault;
    std::map<SyncStatus, int> counts;
    int progress = 100;  // Percent of tracked notes that are Synced.
    int queued = 0;      // Retry items, failed ones included.
    int failed = 0;      // Retry items at or over the retry limit.
};

[[nodiscard]] Result<std::vector<VaultStatus>, Error> collect_status(
    VaultRepository& vaults,
    storage::SyncStateRepository& states,
    storage::RetryQueueRepository& queue);

// Text output: one block per vault, status counts in enum order.
[[nodiscard]] QString format_status(const std::vector<VaultStatus>& rows);

// JSON output:
// { "vaults": [{ "vaultId", "name", "provider", "syncEnabled", "lastSyncedAt"?,
//                "progress", "queued", "failed", "counts": { "<status>": n } }] }
[[nodiscard]] QString format_status_json(const std::vector<VaultStatus>& rows);

[[nodiscard]] QString format_failed_items(const std::vector<RetryQueueItem>& items);

// JSON output:
// { "failed": [{ "noteId", "vaultId", "retryCount", "lastAttemptAt",
//                "nextRetryAt", "lastError"? }] }
[[nodiscard]] QString format_failed_items_json(const std::vector<RetryQueueItem>& items);

} // namespace vaultsync::app
