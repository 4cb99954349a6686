#pragma once

#include "core/types.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace vaultsync::sync {

/**
 * NoteLockTable - one mutex per note ID so that at most one sync of a
 * given note runs at a time. Entries are dropped when the last holder
 * releases them.
 */
class NoteLockTable {
public:
    class Guard {
    public:
        Guard(NoteLockTable& table, const Uuid& note_id);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        NoteLockTable& table_;
        Uuid note_id_;
        std::shared_ptr<std::mutex> mutex_;
    };

    [[nodiscard]] Guard lock(const Uuid& note_id) { return Guard(*this, note_id); }

    /**
     * Notes currently locked or waited on.
     */
    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::shared_ptr<std::mutex> mutex;
        int users = 0;
    };

    std::shared_ptr<std::mutex> acquire(const Uuid& note_id);
    void release(const Uuid& note_id);

    mutable std::mutex table_mutex_;
    std::unordered_map<Uuid, Entry> entries_;
};

} // namespace vaultsync::sync
