#include "tablekit/table_locks.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"

namespace tablekit {

table_lock_registry::lock_ptr table_lock_registry::lock_for(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = locks_[table];
    if (!entry) {
        entry = std::make_shared<std::shared_timed_mutex>();
    }
    return entry;
}

table_lock_registry::shared_guard table_lock_registry::lock_shared(const std::string& table,
                                                                   std::chrono::milliseconds timeout) {
    auto lock = lock_for(table);
    if (!lock->try_lock_shared_for(timeout)) {
        LOG_WARN("locks", "Timed out after %lld ms waiting for table %s",
                 static_cast<long long>(timeout.count()), table.c_str());
        lock.reset();
        prune(table);
        throw transient_error("Timed out waiting for table " + table + " (schema change in progress)");
    }
    return shared_guard(this, table, std::move(lock));
}

table_lock_registry::exclusive_guard table_lock_registry::lock_exclusive(const std::string& table,
                                                                         std::chrono::milliseconds timeout) {
    auto lock = lock_for(table);
    if (!lock->try_lock_for(timeout)) {
        LOG_WARN("locks", "Timed out after %lld ms waiting for exclusive access to table %s",
                 static_cast<long long>(timeout.count()), table.c_str());
        lock.reset();
        prune(table);
        throw transient_error("Timed out waiting for exclusive access to table " + table);
    }
    LOG_DEBUG("locks", "Exclusive lock on %s", table.c_str());
    return exclusive_guard(this, table, std::move(lock));
}

void table_lock_registry::prune(const std::string& table) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(table);
    // Every holder and waiter owns a copy taken under mutex_.
    if (it != locks_.end() && it->second.use_count() == 1) {
        locks_.erase(it);
    }
}

size_t table_lock_registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

} // namespace tablekit
