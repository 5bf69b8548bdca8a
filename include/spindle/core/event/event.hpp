#pragma once

#include <variant>

#include "spindle/core/error.hpp"
#include "spindle/core/event/kind.hpp"
#include "spindle/core/message/response.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transfer_stats.hpp"

namespace spindle::core::event {

// Payloads, one per lifecycle event kind (same order as event::Kind)
struct Before {};

struct Headers {};

struct Complete {
    TransferStats stats;
};

struct Error {
    RequestError error;
    TransferStats stats;
};

using Payload = std::variant<Before, Headers, Complete, Error>;

/*
===============================================================================
 event::Event
===============================================================================

A lifecycle event in flight: the transaction it concerns, a kind-specific
payload and the propagation flag listeners use to cut dispatch short.
===============================================================================
*/
class Event {
public:
    Event(Transaction& txn, Payload payload)
        : txn_(&txn)
        , payload_(std::move(payload))
    {}

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(payload_.index()); }

    [[nodiscard]] Transaction& transaction() noexcept { return *txn_; }
    [[nodiscard]] message::Request& request() noexcept { return txn_->request(); }

    [[nodiscard]] Payload& payload() noexcept { return payload_; }
    [[nodiscard]] const Payload& payload() const noexcept { return payload_; }

    template<class T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&payload_); }

    template<class T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&payload_); }

    void stop_propagation() noexcept { stopped_ = true; }
    [[nodiscard]] bool is_propagation_stopped() const noexcept { return stopped_; }

    // Attaches a substitute response, stops propagation and emits `complete`
    // for it. On an `error` event the failure's throw-immediately flag is
    // cleared. Only valid on `before` and `error` events.
    //
    // If `complete` fails again, the new `error` event must not intercept:
    // a nested intercept() on an `error` event of the same transaction
    // throws InternalError, which aborts the batch.
    void intercept(message::Response response);

private:
    Transaction* txn_;
    Payload payload_;
    bool stopped_{false};
};

} // namespace spindle::core::event
