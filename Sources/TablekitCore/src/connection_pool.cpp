#include "tablekit/connection_pool.hpp"
#include "tablekit/log.hpp"

namespace tablekit {

void connection_pool::lease::release() noexcept {
    if (pool_ && conn_) {
        pool_->give_back(std::move(conn_));
    }
    pool_ = nullptr;
}

connection_pool::connection_pool(factory_t factory, size_t size, std::chrono::milliseconds acquire_timeout)
    : factory_(std::move(factory))
    , capacity_(size == 0 ? 1 : size)
    , acquire_timeout_(acquire_timeout) {}

connection_pool::lease connection_pool::acquire() {
    return acquire(acquire_timeout_);
}

connection_pool::lease connection_pool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = available_.wait_for(lock, timeout, [this] {
        return !idle_.empty() || open_ < capacity_;
    });
    if (!ready) {
        LOG_WARN("pool", "No connection available after %lld ms (%zu open)",
                 static_cast<long long>(timeout.count()), open_);
        throw transient_error("Timed out waiting for a database connection");
    }

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return lease(this, std::move(conn));
    }

    // Reserve the slot, then open outside the lock.
    ++open_;
    lock.unlock();
    try {
        auto conn = factory_();
        LOG_DEBUG("pool", "Opened pooled connection");
        return lease(this, std::move(conn));
    } catch (...) {
        lock.lock();
        --open_;
        lock.unlock();
        available_.notify_one();
        throw;
    }
}

void connection_pool::give_back(std::unique_ptr<connection> conn) noexcept {
    bool keep = true;
    if (conn->is_in_transaction()) {
        LOG_WARN("pool", "Connection returned with an open transaction, rolling back");
        try {
            conn->rollback();
        } catch (const std::exception& e) {
            LOG_ERROR("pool", "Rollback on return failed, closing connection: %s", e.what());
            keep = false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (keep) {
            idle_.push_back(std::move(conn));
        } else {
            --open_;
        }
    }
    available_.notify_one();
    // A discarded connection closes here, outside the lock.
}

size_t connection_pool::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t connection_pool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

} // namespace tablekit
