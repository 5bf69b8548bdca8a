#include "spindle/core/event/event.hpp"
#include "spindle/core/lifecycle.hpp"

namespace spindle::core::event {

void Event::intercept(message::Response response) {
    const Kind k = kind();
    if (k != Kind::Before && k != Kind::Error) {
        throw InternalError("intercept() is only valid on before and error events, got " +
                            std::string(to_string(k)));
    }

    auto* err = get_if<Error>();
    if (err == nullptr) {
        stop_propagation();
        txn_->set_response(std::move(response));
        lifecycle::emit_complete(*txn_);
        return;
    }

    if (txn_->intercepting_error_) {
        throw InternalError("intercept() re-entered while a previous substitute response was failing [url] " +
                            txn_->request().url());
    }

    stop_propagation();
    txn_->set_response(std::move(response));
    err->error.set_throw_immediately(false);

    txn_->intercepting_error_ = true;
    try {
        lifecycle::emit_complete(*txn_, err->stats);
    } catch (...) {
        txn_->intercepting_error_ = false;
        throw;
    }
    txn_->intercepting_error_ = false;
}

} // namespace spindle::core::event
