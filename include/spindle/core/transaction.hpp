#pragma once

#include <optional>

#include "spindle/core/message/request.hpp"
#include "spindle/core/message/response.hpp"
#include "spindle/core/transfer_stats.hpp"

namespace spindle::core {

namespace event { class Event; }

/*
===============================================================================
 core::Transaction
===============================================================================

One request/response exchange as seen by the caller. Owned by the caller;
the engine only borrows it while the exchange is in flight.

The response slot is filled by the transport once the final header block
arrives, or by a listener that intercepts the exchange.
===============================================================================
*/
class Transaction {
public:
    explicit Transaction(message::Request request)
        : request_(std::move(request))
    {}

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept = default;
    Transaction& operator=(Transaction&&) noexcept = default;

    [[nodiscard]] message::Request& request() noexcept { return request_; }
    [[nodiscard]] const message::Request& request() const noexcept { return request_; }

    [[nodiscard]] bool has_response() const noexcept { return response_.has_value(); }

    [[nodiscard]] message::Response* response() noexcept {
        return response_ ? &*response_ : nullptr;
    }
    [[nodiscard]] const message::Response* response() const noexcept {
        return response_ ? &*response_ : nullptr;
    }

    message::Response& set_response(message::Response response) {
        return response_.emplace(std::move(response));
    }

    void clear_response() noexcept { response_.reset(); }

    // Statistics of the last transport attempt
    [[nodiscard]] const TransferStats& stats() const noexcept { return stats_; }
    void set_stats(const TransferStats& stats) { stats_ = stats; }

private:
    // Set while an `error` listener's intercept() is emitting `complete`
    friend class event::Event;
    bool intercepting_error_{false};

    message::Request request_;
    std::optional<message::Response> response_;
    TransferStats stats_{};
};

} // namespace spindle::core
