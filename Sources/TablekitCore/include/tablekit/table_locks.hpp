#pragma once

#ifdef __cplusplus

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tablekit {

// ============================================================================
// table_lock_registry - one reader/writer lock per physical table name
// ============================================================================
//
// CRUD holds a table shared; a schema mutation holds it exclusively for the
// whole of its transaction. Both wait at most their timeout and then throw
// transient_error. Guards release on every exit path.

class table_lock_registry {
public:
    using lock_ptr = std::shared_ptr<std::shared_timed_mutex>;

    class shared_guard {
    public:
        shared_guard() = default;
        shared_guard(table_lock_registry* owner, std::string table, lock_ptr lock)
            : owner_(owner), table_(std::move(table)), lock_(std::move(lock)) {}
        ~shared_guard() { release(); }

        shared_guard(shared_guard&& other) noexcept
            : owner_(other.owner_), table_(std::move(other.table_)), lock_(std::move(other.lock_)) {}
        shared_guard& operator=(shared_guard&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                table_ = std::move(other.table_);
                lock_ = std::move(other.lock_);
            }
            return *this;
        }
        shared_guard(const shared_guard&) = delete;
        shared_guard& operator=(const shared_guard&) = delete;

        void release() noexcept {
            if (lock_) {
                lock_->unlock_shared();
                lock_.reset();
                if (owner_) owner_->prune(table_);
            }
        }

    private:
        table_lock_registry* owner_ = nullptr;
        std::string table_;
        lock_ptr lock_;
    };

    class exclusive_guard {
    public:
        exclusive_guard() = default;
        exclusive_guard(table_lock_registry* owner, std::string table, lock_ptr lock)
            : owner_(owner), table_(std::move(table)), lock_(std::move(lock)) {}
        ~exclusive_guard() { release(); }

        exclusive_guard(exclusive_guard&& other) noexcept
            : owner_(other.owner_), table_(std::move(other.table_)), lock_(std::move(other.lock_)) {}
        exclusive_guard& operator=(exclusive_guard&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                table_ = std::move(other.table_);
                lock_ = std::move(other.lock_);
            }
            return *this;
        }
        exclusive_guard(const exclusive_guard&) = delete;
        exclusive_guard& operator=(const exclusive_guard&) = delete;

        void release() noexcept {
            if (lock_) {
                lock_->unlock();
                lock_.reset();
                if (owner_) owner_->prune(table_);
            }
        }

    private:
        table_lock_registry* owner_ = nullptr;
        std::string table_;
        lock_ptr lock_;
    };

    shared_guard lock_shared(const std::string& table, std::chrono::milliseconds timeout);
    exclusive_guard lock_exclusive(const std::string& table, std::chrono::milliseconds timeout);

    /// Tables with a holder or a waiter. Entries go away with their last guard.
    size_t size() const;

private:
    lock_ptr lock_for(const std::string& table);
    void prune(const std::string& table) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, lock_ptr> locks_;
};

} // namespace tablekit

#endif // __cplusplus
