#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "spindle/core/error.hpp"
#include "spindle/core/telemetry.hpp"
#include "spindle/core/transport/telemetry/engine.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::transport {

/*
===============================================================================
 transport::MultiPool
===============================================================================

Reuse pool for multiplexing handles.

  - checkout() hands out an idle handle, or creates one when none is idle
  - a handle is returned when its Lease goes out of scope
  - at most max_idle handles are kept idle; extra ones are closed on return
  - a discarded lease closes its handle, it never goes back to the idle set

Thread-safe: engines on different threads may share one pool
(std::shared_ptr injection). A checked-out handle is used by exactly one
batch at a time.
===============================================================================
*/
template<class Multi>
class MultiPool {
public:
    static constexpr std::size_t DEFAULT_MAX_IDLE = 3;

    using Factory = std::function<std::unique_ptr<Multi>()>;

    // Move-only ownership of one checked-out handle
    class Lease {
    public:
        Lease(Lease&& other) noexcept
            : pool_(other.pool_)
            , handle_(std::move(other.handle_))
        {}

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                reset();
                pool_ = other.pool_;
                handle_ = std::move(other.handle_);
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { reset(); }

        [[nodiscard]] Multi& operator*() const noexcept { return *handle_; }
        [[nodiscard]] Multi* operator->() const noexcept { return handle_.get(); }
        [[nodiscard]] Multi* get() const noexcept { return handle_.get(); }

        // Returns the handle to the pool early
        void reset() noexcept {
            if (handle_) {
                pool_->release_(std::move(handle_));
            }
        }

        // Closes the handle instead of returning it (the handle failed)
        void discard() noexcept {
            if (handle_) {
                pool_->discard_(std::move(handle_));
            }
        }

    private:
        friend class MultiPool;

        Lease(MultiPool* pool, std::unique_ptr<Multi> handle) noexcept
            : pool_(pool)
            , handle_(std::move(handle))
        {}

        MultiPool* pool_;
        std::unique_ptr<Multi> handle_;
    };

    explicit MultiPool(Factory create, std::size_t max_idle = DEFAULT_MAX_IDLE)
        : create_(std::move(create))
        , max_idle_(max_idle)
    {
        if (!create_) {
            throw ConfigError("MultiPool requires a handle factory");
        }
        idle_.reserve(max_idle_); // release_() never allocates
    }

    MultiPool(const MultiPool&) = delete;
    MultiPool& operator=(const MultiPool&) = delete;

    [[nodiscard]] Lease checkout() {
        {
            std::lock_guard lock(mutex_);
            SP_TL1( telemetry_.checkouts_total.inc() );
            if (!idle_.empty()) {
                auto handle = std::move(idle_.back());
                idle_.pop_back();
                SP_TL1( telemetry_.reused_total.inc() );
                return Lease{this, std::move(handle)};
            }
            SP_TL1( telemetry_.created_total.inc() );
        }
        // Created outside the lock
        SP_TRACE("[POOL] Creating multiplexing handle");
        return Lease{this, create_()};
    }

    [[nodiscard]] std::size_t idle_count() const {
        std::lock_guard lock(mutex_);
        return idle_.size();
    }

    [[nodiscard]] std::size_t max_idle() const noexcept { return max_idle_; }

    void copy_telemetry_to(telemetry::Pool& out) const {
        std::lock_guard lock(mutex_);
        telemetry_.copy_to(out);
    }

private:
    void discard_(std::unique_ptr<Multi> handle) noexcept {
        {
            std::lock_guard lock(mutex_);
            SP_TL1( telemetry_.discarded_total.inc() );
        }
        SP_WARN("[POOL] Closing failed multiplexing handle");
        handle.reset();
    }

    void release_(std::unique_ptr<Multi> handle) noexcept {
        {
            std::lock_guard lock(mutex_);
            if (idle_.size() < max_idle_) {
                idle_.push_back(std::move(handle));
                return;
            }
            SP_TL1( telemetry_.discarded_total.inc() );
        }
        // Idle set full: close it outside the lock
        SP_TRACE("[POOL] Idle set full (" << max_idle_ << "), closing multiplexing handle");
        handle.reset();
    }

private:
    Factory create_;
    std::size_t max_idle_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Multi>> idle_;
    telemetry::Pool telemetry_;
};

} // namespace spindle::core::transport
