#include "sync/note_lock.hpp"

namespace vaultsync::sync {

NoteLockTable::Guard::Guard(NoteLockTable& table, const Uuid& note_id)
    : table_(table), note_id_(note_id), mutex_(table.acquire(note_id)) {
    mutex_->lock();
}

NoteLockTable::Guard::~Guard() {
    mutex_->unlock();
    table_.release(note_id_);
}

std::shared_ptr<std::mutex> NoteLockTable::acquire(const Uuid& note_id) {
    std::lock_guard<std::mutex> guard(table_mutex_);
    auto& entry = entries_[note_id];
    if (!entry.mutex) {
        entry.mutex = std::make_shared<std::mutex>();
    }
    ++entry.users;
    return entry.mutex;
}

void NoteLockTable::release(const Uuid& note_id) {
    std::lock_guard<std::mutex> guard(table_mutex_);
    auto it = entries_.find(note_id);
    if (it != entries_.end() && --it->second.users == 0) {
        entries_.erase(it);
    }
}

size_t NoteLockTable::size() const {
    std::lock_guard<std::mutex> guard(table_mutex_);
    return entries_.size();
}

} // namespace vaultsync::sync
