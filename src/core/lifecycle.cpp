#include "spindle/core/lifecycle.hpp"
#include "spindle/core/event/event.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::lifecycle {

void emit_before(Transaction& txn) {
    try {
        event::Event ev{txn, event::Before{}};
        txn.request().emitter().emit(event::names::BEFORE, ev);
    } catch (const RequestError& e) {
        if (e.emitted()) {
            throw;
        }
        emit_error(txn, e);
    } catch (const InternalError&) {
        throw;
    } catch (const std::exception&) {
        emit_error(txn, std::current_exception());
    }
}

void emit_headers(Transaction& txn) {
    event::Event ev{txn, event::Headers{}};
    txn.request().emitter().emit(event::names::HEADERS, ev);
}

void emit_complete(Transaction& txn, const TransferStats& stats) {
    auto* response = txn.response();
    if (response == nullptr) {
        throw InternalError("complete emitted without a response [url] " + txn.request().url());
    }
    response->set_effective_url(txn.request().url());

    try {
        event::Event ev{txn, event::Complete{stats}};
        txn.request().emitter().emit(event::names::COMPLETE, ev);
    } catch (const RequestError& e) {
        if (e.emitted()) {
            throw;
        }
        emit_error(txn, e, stats);
    } catch (const InternalError&) {
        throw;
    } catch (const std::exception&) {
        emit_error(txn, std::current_exception(), stats);
    }
}

void emit_error(Transaction& txn, const RequestError& failure, const TransferStats& stats) {
    event::Event ev{txn, event::Error{failure.marked_emitted(), stats}};
    txn.request().emitter().emit(event::names::ERROR, ev);

    if (ev.is_propagation_stopped()) {
        SP_DEBUG("[EVENTS] Error intercepted by listener: " << failure.what());
        return;
    }
    // Listeners may have flagged the failure (e.g. throw immediately)
    throw std::get<event::Error>(ev.payload()).error;
}

void emit_error(Transaction& txn, std::exception_ptr failure, const TransferStats& stats) {
    try {
        std::rethrow_exception(failure);
    } catch (const RequestError& e) {
        emit_error(txn, e, stats);
    } catch (const std::exception& e) {
        RequestError wrapped{ErrorKind::Application, e.what(), failure};
        wrapped.set_stats(stats);
        emit_error(txn, wrapped, stats);
    }
}

} // namespace spindle::core::lifecycle
