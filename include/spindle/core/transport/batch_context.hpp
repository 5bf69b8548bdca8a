#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "spindle/core/error.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transfer_stats.hpp"
#include "spindle/core/transport/concepts.hpp"
#include "spindle/core/transport/pending.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::transport {

/*
===============================================================================
 transport::BatchContext
===============================================================================

Bookkeeping of one send / send_all call.

Tracks the bidirectional association Transaction <-> transport handle for
every exchange currently registered with the multiplexing handle, the
pending sequence still waiting for admission, the propagation mode of
the batch and which transactions already used their rewind retry.

Invariants:
  - a transaction maps to at most one handle and vice versa
  - every tracked handle is registered with the multiplexing handle
  - on destruction, every still-tracked handle is removed (RAII)
  - a transaction is rewound and retried at most once per batch

Single-threaded: driven by the thread running the batch.
===============================================================================
*/
template<MultiConcept Multi>
class BatchContext {
public:
    using handle_type = typename Multi::handle_type;

    // What remove_transaction() hands back
    struct Detached {
        TransferStats stats;
        std::unique_ptr<handle_type> handle;
    };

    BatchContext(Multi& multi, bool throws_exceptions, std::size_t parallelism = 1, Pending pending = {})
        : multi_(multi)
        , throws_exceptions_(throws_exceptions)
        , parallelism_(parallelism)
        , pending_(std::move(pending))
    {}

    BatchContext(const BatchContext&) = delete;
    BatchContext& operator=(const BatchContext&) = delete;

    ~BatchContext() {
        remove_all();
    }

    // Registers handle with the multiplexing handle and tracks it for txn.
    // Throws InternalError if txn is already active, MultiError if the
    // multiplexing handle rejects the registration.
    void add_transaction(Transaction& txn, std::unique_ptr<handle_type> handle) {
        if (!handle) {
            throw InternalError("add_transaction() without a transport handle [url] " + txn.request().url());
        }
        if (by_transaction_.contains(&txn)) {
            throw InternalError("transaction already active [url] " + txn.request().url());
        }
        const MultiCode rc = multi_.add(*handle);
        if (rc != MultiCode::Ok) {
            throw MultiError(static_cast<int>(rc), to_string(rc));
        }
        by_handle_.emplace(handle->id(), &txn);
        by_transaction_.emplace(&txn, std::move(handle));
        SP_TRACE("[BATCH] Added transfer (" << by_transaction_.size() << " active) [url] " << txn.request().url());
    }

    // Unregisters the handle of txn and returns it with its final stats.
    // Throws InternalError when txn is not active.
    [[nodiscard]] Detached remove_transaction(Transaction& txn) {
        auto it = by_transaction_.find(&txn);
        if (it == by_transaction_.end()) {
            throw InternalError("transaction is not active [url] " + txn.request().url());
        }
        std::unique_ptr<handle_type> handle = std::move(it->second);
        by_transaction_.erase(it);
        by_handle_.erase(handle->id());

        const MultiCode rc = multi_.remove(*handle);
        if (rc != MultiCode::Ok) {
            SP_WARN("[BATCH] Removing handle from multiplexing handle failed: " << to_string(rc));
        }
        TransferStats stats = handle->stats();
        return Detached{std::move(stats), std::move(handle)};
    }

    // Throws InternalError for an untracked handle
    [[nodiscard]] Transaction& find_transaction(HandleId id) const {
        auto it = by_handle_.find(id);
        if (it == by_handle_.end()) {
            throw InternalError("completion reported for an unknown transport handle");
        }
        return *it->second;
    }

    // Next transaction to admit, or nullptr once the pending sequence is exhausted
    [[nodiscard]] Transaction* next_pending() {
        return pending_.next();
    }

    // Something is still pending or in flight
    [[nodiscard]] bool is_active() {
        return !by_transaction_.empty() || !pending_.exhausted();
    }

    // Unregisters every tracked handle. Used on batch abort and destruction.
    void remove_all() noexcept {
        if (by_transaction_.empty()) {
            return;
        }
        SP_DEBUG("[BATCH] Removing " << by_transaction_.size() << " active transfer(s)");
        for (auto& [txn, handle] : by_transaction_) {
            const MultiCode rc = multi_.remove(*handle);
            if (rc != MultiCode::Ok) {
                SP_WARN("[BATCH] Removing handle from multiplexing handle failed: " << to_string(rc));
            }
        }
        by_transaction_.clear();
        by_handle_.clear();
    }

    // Records the rewind retry of txn. False when it was already retried.
    bool mark_retried(Transaction& txn) {
        return retried_.insert(&txn).second;
    }

    [[nodiscard]] bool was_retried(Transaction& txn) const {
        return retried_.contains(&txn);
    }

    [[nodiscard]] bool throws_exceptions() const noexcept { return throws_exceptions_; }
    [[nodiscard]] std::size_t active_count() const noexcept { return by_transaction_.size(); }
    [[nodiscard]] std::size_t parallelism() const noexcept { return parallelism_; }
    [[nodiscard]] bool has_capacity() const noexcept { return by_transaction_.size() < parallelism_; }

    [[nodiscard]] Multi& multi() noexcept { return multi_; }

private:
    Multi& multi_;
    bool throws_exceptions_;
    std::size_t parallelism_;
    Pending pending_;
    std::unordered_map<HandleId, Transaction*> by_handle_;
    std::unordered_map<Transaction*, std::unique_ptr<handle_type>> by_transaction_;
    std::unordered_set<Transaction*> retried_;
};

} // namespace spindle::core::transport
