#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <format>
#include <memory>
#include <span>
#include <thread>
#include <utility>

#include "spindle/core/error.hpp"
#include "spindle/core/lifecycle.hpp"
#include "spindle/core/message/factory.hpp"
#include "spindle/core/telemetry.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transport/batch_context.hpp"
#include "spindle/core/transport/concepts.hpp"
#include "spindle/core/transport/engine/config.hpp"
#include "spindle/core/transport/multi_pool.hpp"
#include "spindle/core/transport/outcome.hpp"
#include "spindle/core/transport/pending.hpp"
#include "spindle/core/transport/telemetry/engine.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::transport {

/*
===============================================================================
 transport::Engine
===============================================================================

Concurrent transfer engine. Drives any number of transactions through one
multiplexing handle with bounded parallelism, routing every exchange through
the lifecycle events of its request.

Batch flow:
  1) check out a multiplexing handle (RAII lease, returned on exit)
  2) admit up to `parallelism` transactions
       before -> intercepted (no transport) | handle created and registered
  3) drain: perform until no "call again", process every completion, and
     refill the window by one admission per completion
  4) block in wait() for activity; back off briefly when nothing was waited on
  5) repeat until nothing is pending or active

Outcome of a finished attempt:
  - captured callback failure          -> error event (application)
  - non-OK transport code              -> error event (transport)
  - response present                   -> complete event
  - no response, no body               -> error event (diagnostic)
  - no response, already retried       -> error event (diagnostic)
  - no response, body cannot rewind    -> error event (diagnostic)
  - no response, body rewound          -> silent retry (no events), once
                                          per transaction and batch

Failure escalation:
  A RequestError that reaches the engine aborts the batch (all handles
  removed, error rethrown) when the batch propagates (send) or when the
  error is flagged throw-immediately. Otherwise it has already been reported
  through the `error` event and the batch continues.
  Listener failures of any std::exception type reach the engine as
  RequestError (wrapped by the lifecycle coordinator). InternalError,
  MultiError and exceptions outside the std::exception hierarchy abort the
  batch in every mode; a multiplexing handle that failed is discarded
  instead of being returned to the pool.

Thread model:
  One batch runs entirely on the calling thread. Distinct engines may share
  one MultiPool across threads.
===============================================================================
*/
template<BackendConcept Backend>
class Engine {
public:
    using multi_type   = typename Backend::multi_type;
    using handle_type  = typename Backend::handle_type;
    using pool_type    = MultiPool<multi_type>;
    using config_type  = engine::Config<handle_type>;
    using context_type = BatchContext<multi_type>;

    explicit Engine(config_type config = {}, Backend backend = {}, std::shared_ptr<pool_type> pool = nullptr)
        : backend_(std::move(backend))
        , factory_(config.handle_factory ? std::move(config.handle_factory) : backend_.handle_factory())
        , select_timeout_(engine::resolve_select_timeout(config.select_timeout))
        , no_progress_backoff_(config.no_progress_backoff)
        , pool_(pool ? std::move(pool) : make_pool_(config.max_idle_multi_handles))
    {
        SP_DEBUG("[ENGINE] Created (" << Backend::name << " backend, select timeout "
                 << select_timeout_.count() << " ms, max idle multi handles " << pool_->max_idle() << ")");
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Sends one transaction and returns its response.
    // Failures propagate as RequestError unless an `error` listener
    // intercepts them with a substitute response.
    message::Response& send(Transaction& txn) {
        SP_TL1( telemetry_.batches_total.inc() );
        auto lease = pool_->checkout();
        context_type ctx{*lease, true, 1};

        try {
            add_handle_(txn, ctx);
            drain_(ctx);
        } catch (const MultiError&) {
            discard_(lease, ctx);
            throw;
        }

        if (auto* response = txn.response()) {
            return *response;
        }
        // An `error` listener stopped propagation without attaching a response
        throw RequestError(ErrorKind::Application,
                           "No response was attached after the error was intercepted [url] " + txn.request().url());
    }

    // Sends every transaction of the pending sequence, at most `parallelism`
    // at a time. Per-transaction failures are reported through `error`
    // events only, unless flagged throw-immediately.
    void send_all(Pending pending, std::size_t parallelism) {
        if (parallelism == 0) {
            throw ConfigError("send_all() requires a parallelism of at least 1");
        }
        SP_TL1( telemetry_.batches_total.inc() );
        auto lease = pool_->checkout();
        context_type ctx{*lease, false, parallelism, std::move(pending)};

        try {
            fill_window_(ctx);
            drain_(ctx);
        } catch (const MultiError&) {
            discard_(lease, ctx);
            throw;
        }
    }

    void send_all(std::span<Transaction> txns, std::size_t parallelism) {
        send_all(Pending::from(txns), parallelism);
    }

    [[nodiscard]] std::chrono::milliseconds select_timeout() const noexcept { return select_timeout_; }
    [[nodiscard]] const std::shared_ptr<pool_type>& pool() const noexcept { return pool_; }
    [[nodiscard]] const telemetry::Engine& telemetry() const noexcept { return telemetry_; }
    [[nodiscard]] Backend& backend() noexcept { return backend_; }
    [[nodiscard]] message::Factory& message_factory() noexcept { return messages_; }

private:
    std::shared_ptr<pool_type> make_pool_(std::size_t max_idle) {
        // The pool may outlive this engine: it owns its own backend copy
        return std::make_shared<pool_type>(
            [backend = backend_]() mutable { return backend.create_multi(); }, max_idle);
    }

    // Must the batch abort on this failure?
    [[nodiscard]] static bool must_propagate_(const RequestError& e, const context_type& ctx) noexcept {
        return ctx.throws_exceptions() || e.throws_immediately();
    }

    // The multiplexing handle failed: unregister everything, then close it
    // rather than returning it to the pool
    static void discard_(typename pool_type::Lease& lease, context_type& ctx) noexcept {
        ctx.remove_all();
        lease.discard();
    }

    void escalate_(const RequestError& e, context_type& ctx) noexcept {
        SP_TL1( telemetry_.escalations_total.inc() );
        SP_DEBUG("[ENGINE] Aborting batch: " << e.what());
        ctx.remove_all();
    }

    // -------------------------------------------------------------------------
    // Admission
    // -------------------------------------------------------------------------

    void fill_window_(context_type& ctx) {
        while (ctx.has_capacity()) {
            Transaction* next = ctx.next_pending();
            if (next == nullptr) {
                break;
            }
            add_handle_(*next, ctx);
        }
    }

    void add_handle_(Transaction& txn, context_type& ctx) {
        txn.clear_response();
        try {
            lifecycle::emit_before(txn);
            if (txn.has_response()) {
                SP_TL1( telemetry_.intercepted_total.inc() );
                SP_DEBUG("[ENGINE] Intercepted before transport [url] " << txn.request().url());
                return;
            }
            register_(txn, ctx, nullptr);
        } catch (const RequestError& e) {
            if (must_propagate_(e, ctx)) {
                escalate_(e, ctx);
                throw;
            }
            SP_DEBUG("[ENGINE] Admission failed, reported through error event: " << e.what());
        }
    }

    // Creates (or recycles) the transport handle and registers it.
    // Factory failures go through the `error` event.
    void register_(Transaction& txn, context_type& ctx, std::unique_ptr<handle_type> recycled) {
        std::unique_ptr<handle_type> handle;
        try {
            handle = factory_(txn, messages_, std::move(recycled));
        } catch (const std::exception&) {
            lifecycle::emit_error(txn, std::current_exception());
            return; // intercepted by a listener
        }
        ctx.add_transaction(txn, std::move(handle));
        SP_TL1( telemetry_.admitted_total.inc() );
        SP_TL1( telemetry_.active_peak.observe(static_cast<std::uint32_t>(ctx.active_count())) );
    }

    // -------------------------------------------------------------------------
    // Drain loop
    // -------------------------------------------------------------------------

    void drain_(context_type& ctx) {
        multi_type& multi = ctx.multi();
        int running = 0;

        do {
            MultiCode rc;
            do {
                rc = multi.perform(running);
            } while (rc == MultiCode::CallMultiPerform);

            if (rc != MultiCode::Ok) {
                SP_ERROR("[ENGINE] Multiplexing handle failed: " << to_string(rc));
                SP_TL1( telemetry_.escalations_total.inc() );
                ctx.remove_all();
                throw MultiError(static_cast<int>(rc), to_string(rc));
            }

            process_messages_(ctx);

            if (running > 0 && multi.wait(select_timeout_) == -1) {
                // Nothing to wait on yet: avoid a busy spin
                std::this_thread::sleep_for(no_progress_backoff_);
            }
        } while (ctx.is_active() || running > 0);
    }

    void process_messages_(context_type& ctx) {
        Completion done;
        while (ctx.multi().info_read(done)) {
            Transaction& txn = ctx.find_transaction(done.handle);
            process_response_(txn, done, ctx);
            fill_window_(ctx);
        }
    }

    void process_response_(Transaction& txn, const Completion& done, context_type& ctx) {
        auto detached = ctx.remove_transaction(txn);
        detached.stats.transport_result = done.result;
        txn.set_stats(detached.stats);

        const Outcome outcome = classify_(txn, done, *detached.handle, detached.stats, ctx);
        SP_TRACE("[ENGINE] Transfer finished: " << to_string(outcome.kind) << " [url] " << txn.request().url());

        try {
            switch (outcome.kind) {
            case OutcomeKind::Success:
                SP_TL1( telemetry_.completed_total.inc() );
                lifecycle::emit_complete(txn, detached.stats);
                break;
            case OutcomeKind::RetryableGap:
                ctx.mark_retried(txn);
                SP_TL1( telemetry_.rewind_retries_total.inc() );
                SP_WARN("[ENGINE] Connection closed without a response, retrying with rewound body [url] "
                        << txn.request().url());
                register_(txn, ctx, std::move(detached.handle));
                break;
            case OutcomeKind::TransportFailure:
            case OutcomeKind::ApplicationFailure:
                SP_TL1( telemetry_.failed_total.inc() );
                lifecycle::emit_error(txn, outcome.failure, detached.stats);
                break;
            }
        } catch (const RequestError& e) {
            if (must_propagate_(e, ctx)) {
                escalate_(e, ctx);
                throw;
            }
            SP_DEBUG("[ENGINE] Failure reported through error event, batch continues: " << e.what());
        }
    }

    [[nodiscard]] Outcome classify_(Transaction& txn, const Completion& done, handle_type& handle,
                                    const TransferStats& stats, const context_type& ctx) const {
        if (auto failure = handle.take_failure()) {
            return Outcome{OutcomeKind::ApplicationFailure, std::move(failure)};
        }

        if (done.result != 0) {
            RequestError error{ErrorKind::Transport,
                               std::format("[{}] (#{}) {} [url] {}", Backend::name, done.result,
                                           backend_.describe(done.result), txn.request().url()),
                               nullptr, done.result};
            error.set_stats(stats);
            return Outcome{OutcomeKind::TransportFailure, std::make_exception_ptr(std::move(error))};
        }

        if (txn.has_response()) {
            return Outcome{OutcomeKind::Success, nullptr};
        }

        message::Body* body = txn.request().body();
        if (body == nullptr) {
            return diagnostic_(stats,
                "No response was received for a request with no body. This could mean that you are "
                "saturating your network.");
        }
        if (ctx.was_retried(txn)) {
            return diagnostic_(stats,
                "The connection was unexpectedly closed again after the request was retried with a "
                "rewound body.");
        }
        if (!body->seekable() || !body->seek(0)) {
            return diagnostic_(stats,
                "The connection was unexpectedly closed. The request would have been retried, but "
                "attempting to rewind the request body failed. Consider buffering the request body "
                "in memory to work around this issue if necessary.");
        }
        return Outcome{OutcomeKind::RetryableGap, nullptr};
    }

    [[nodiscard]] static Outcome diagnostic_(const TransferStats& stats, const char* message) {
        RequestError error{ErrorKind::Application, message};
        error.set_stats(stats);
        return Outcome{OutcomeKind::ApplicationFailure, std::make_exception_ptr(std::move(error))};
    }

private:
    Backend backend_;
    HandleFactory<handle_type> factory_;
    std::chrono::milliseconds select_timeout_;
    std::chrono::microseconds no_progress_backoff_;
    std::shared_ptr<pool_type> pool_;
    message::Factory messages_;
    telemetry::Engine telemetry_;
};

} // namespace spindle::core::transport
