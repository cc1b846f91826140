#pragma once

#ifdef __cplusplus

#include "connection.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace tablekit {

// ============================================================================
// connection_pool - bounded set of connections handed out as exclusive leases
// ============================================================================
//
// Connections are opened lazily up to the configured size. A caller that
// finds none idle waits on a condition variable until one comes back or the
// acquire timeout passes (transient_error). A lease returned with an open
// transaction is rolled back first; if that fails the connection is closed
// rather than handed to the next caller.

class connection_pool {
public:
    using factory_t = std::function<std::unique_ptr<connection>()>;

    class lease {
    public:
        lease() = default;
        lease(connection_pool* pool, std::unique_ptr<connection> conn)
            : pool_(pool), conn_(std::move(conn)) {}
        ~lease() { release(); }

        lease(lease&& other) noexcept
            : pool_(other.pool_), conn_(std::move(other.conn_)) {
            other.pool_ = nullptr;
        }
        lease& operator=(lease&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                conn_ = std::move(other.conn_);
                other.pool_ = nullptr;
            }
            return *this;
        }

        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;

        connection& operator*() const { return *conn_; }
        connection* operator->() const { return conn_.get(); }
        connection* get() const { return conn_.get(); }
        explicit operator bool() const { return conn_ != nullptr; }

    private:
        void release() noexcept;

        connection_pool* pool_ = nullptr;
        std::unique_ptr<connection> conn_;
    };

    connection_pool(factory_t factory, size_t size, std::chrono::milliseconds acquire_timeout);
    ~connection_pool() = default;

    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    lease acquire();
    lease acquire(std::chrono::milliseconds timeout);

    size_t capacity() const { return capacity_; }
    size_t open_count() const;
    size_t idle_count() const;

private:
    void give_back(std::unique_ptr<connection> conn) noexcept;

    factory_t factory_;
    size_t capacity_;
    std::chrono::milliseconds acquire_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<connection>> idle_;
    size_t open_ = 0;
};

} // namespace tablekit

#endif // __cplusplus
