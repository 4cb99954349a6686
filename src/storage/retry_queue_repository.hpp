#pragma once

#include "storage/database.hpp"
#include "core/sync_types.hpp"
#include "core/result.hpp"
#include <chrono>
#include <vector>
#include <optional>

namespace vaultsync::storage {

/**
 * RetryQueueRepository - durable schedule of failed notes (sync_queue table).
 *
 * The repository stores whatever schedule it is handed; backoff is computed
 * by the coordinator. An item whose retry_count reached max_retries is
 * "failed": it is never returned as ready and waits for an operator reset.
 */
class RetryQueueRepository {
public:
    static constexpr std::chrono::seconds DEFAULT_RESET_DELAY{60};

    explicit RetryQueueRepository(Database& db,
                                  int max_retries = DEFAULT_MAX_RETRIES,
                                  std::chrono::seconds reset_delay = DEFAULT_RESET_DELAY)
        : db_(db), max_retries_(max_retries), reset_delay_(reset_delay) {}

    [[nodiscard]] int max_retries() const noexcept { return max_retries_; }

    [[nodiscard]] Result<void, Error> upsert(const RetryQueueItem& item);
    [[nodiscard]] Result<void, Error> upsert_all(const std::vector<RetryQueueItem>& items);

    [[nodiscard]] Result<std::optional<RetryQueueItem>, Error> get(const Uuid& note_id);
    [[nodiscard]] Result<std::vector<RetryQueueItem>, Error> get_all();
    [[nodiscard]] Result<std::vector<RetryQueueItem>, Error> get_for_vault(const Uuid& vault_id);

    /**
     * Items due at `now` and not failed, earliest next_retry_at first.
     */
    [[nodiscard]] Result<std::vector<RetryQueueItem>, Error> get_items_ready_for_retry(Timestamp now);

    /**
     * Items at or over the retry limit, most recently attempted first.
     */
    [[nodiscard]] Result<std::vector<RetryQueueItem>, Error> get_failed_items();

    [[nodiscard]] Result<int, Error> queue_size();
    [[nodiscard]] Result<int, Error> ready_count(Timestamp now);

    [[nodiscard]] Result<void, Error> remove(const Uuid& note_id);
    [[nodiscard]] Result<void, Error> remove_for_vault(const Uuid& vault_id);

    /**
     * Drop every failed item. Returns the number removed.
     */
    [[nodiscard]] Result<int, Error> remove_failed();

    [[nodiscard]] Result<void, Error> clear();

    /**
     * Operator retry: zero the counter and schedule at now + reset delay.
     * Returns false when the note has no queue item.
     */
    [[nodiscard]] Result<bool, Error> reset_retry_count(const Uuid& note_id, Timestamp now);

    /**
     * reset_retry_count for every failed item. Returns the number reset.
     */
    [[nodiscard]] Result<int, Error> reset_all_failed_items(Timestamp now);

private:
    Database& db_;
    int max_retries_;
    std::chrono::seconds reset_delay_;

    [[nodiscard]] static RetryQueueItem row_to_item(Statement& stmt);
    [[nodiscard]] Result<void, Error> upsert_locked(const RetryQueueItem& item);

    template<typename... Args>
    [[nodiscard]] Result<std::vector<RetryQueueItem>, Error> select(const std::string& tail,
                                                                    const Args&... args);
    template<typename... Args>
    [[nodiscard]] Result<int, Error> update(const std::string& sql, const Args&... args);
};

} // namespace vaultsync::storage
