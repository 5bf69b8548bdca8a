#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include "spindle/core/transfer_stats.hpp"

namespace spindle::core {

/*
===============================================================================
 core::ErrorKind
===============================================================================

Classification of failures surfaced by the transfer engine.

- Transport   : the transport reported a non-OK completion code
- Application : a listener, body or message step failed (or a gap could not
                be retried)
- Internal    : engine bookkeeping invariant violated
- Config      : invalid option at construction or call time
===============================================================================
*/
enum class ErrorKind : std::uint8_t {
    Transport,
    Application,
    Internal,
    Config
};

inline constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Transport:   return "Transport";
    case ErrorKind::Application: return "Application";
    case ErrorKind::Internal:    return "Internal";
    case ErrorKind::Config:      return "Config";
    }
    return "Unknown";
}


/*
===============================================================================
 core::RequestError
===============================================================================

The recoverable failure kind. Reported through the `error` lifecycle event,
where a listener may intercept it; otherwise it propagates to the caller
(single send, or a batch in must-propagate mode).

The emitted marker records that the failure has already been dispatched as
an `error` event. It is value state: marked_emitted() returns a marked copy
and never mutates the original.
===============================================================================
*/
class RequestError : public std::runtime_error {
public:
    RequestError(ErrorKind kind, const std::string& message,
                 std::exception_ptr cause = nullptr, int transport_code = 0)
        : std::runtime_error(message)
        , kind_(kind)
        , transport_code_(transport_code)
        , cause_(std::move(cause))
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Low-level transport completion code (0 when not a transport failure)
    [[nodiscard]] int transport_code() const noexcept { return transport_code_; }

    // Original failure this error wraps, if any
    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

    [[nodiscard]] const TransferStats& stats() const noexcept { return stats_; }
    void set_stats(const TransferStats& stats) { stats_ = stats; }

    // Forces propagation out of a batch even when the batch does not propagate
    [[nodiscard]] bool throws_immediately() const noexcept { return throw_immediately_; }
    void set_throw_immediately(bool on) noexcept { throw_immediately_ = on; }

    [[nodiscard]] bool emitted() const noexcept { return emitted_; }

    [[nodiscard]] RequestError marked_emitted() const {
        RequestError copy{*this};
        copy.emitted_ = true;
        return copy;
    }

private:
    ErrorKind kind_;
    int transport_code_;
    std::exception_ptr cause_;
    TransferStats stats_{};
    bool throw_immediately_{false};
    bool emitted_{false};
};


// Engine bookkeeping violated (e.g. completion for an unknown handle).
// Always aborts the batch.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& message)
        : std::logic_error(message)
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return ErrorKind::Internal; }
};


// The multiplexing handle itself failed. Always aborts the batch.
class MultiError : public std::runtime_error {
public:
    MultiError(int code, std::string_view text)
        : std::runtime_error("multi error " + std::to_string(code) + ": " + std::string(text))
        , code_(code)
    {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};


// Invalid configuration, raised at construction or call time.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message)
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return ErrorKind::Config; }
};

} // namespace spindle::core
