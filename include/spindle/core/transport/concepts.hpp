#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "spindle/core/message/factory.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transfer_stats.hpp"

namespace spindle::core::transport {

/*
===============================================================================
 transport::MultiCode
===============================================================================

Result of an operation on the multiplexing handle. Values mirror the codes
of the libcurl multi interface so the curl backend converts them 1:1.
===============================================================================
*/
enum class MultiCode : int {
    CallMultiPerform = -1, // progress pending, call perform() again
    Ok               = 0,
    BadHandle        = 1,
    BadEasyHandle    = 2,
    OutOfMemory      = 3,
    InternalError    = 4,
    BadSocket        = 5,
    UnknownOption    = 6,
    AddedAlready     = 7,
    Unknown          = 1000
};

inline constexpr std::string_view to_string(MultiCode code) noexcept {
    switch (code) {
    case MultiCode::CallMultiPerform: return "CallMultiPerform";
    case MultiCode::Ok:               return "Ok";
    case MultiCode::BadHandle:        return "BadHandle";
    case MultiCode::BadEasyHandle:    return "BadEasyHandle";
    case MultiCode::OutOfMemory:      return "OutOfMemory";
    case MultiCode::InternalError:    return "InternalError";
    case MultiCode::BadSocket:        return "BadSocket";
    case MultiCode::UnknownOption:    return "UnknownOption";
    case MultiCode::AddedAlready:     return "AddedAlready";
    case MultiCode::Unknown:          return "Unknown";
    }
    return "Unknown";
}

// Opaque identity of a transport handle, as reported in completions
using HandleId = const void*;

// A finished exchange reported by the multiplexing handle
struct Completion {
    HandleId handle{nullptr};
    int result{0};          // transport completion code (0 == OK)
};


// -----------------------------------------------------------------------------
// HandleConcept
// -----------------------------------------------------------------------------
//
// One in-flight exchange bound to a Transaction.
//
//   • id() identifies the handle in completions
//   • stats() snapshots the transfer statistics of the current attempt
//   • take_failure() returns (and clears) a failure captured inside a
//     transport callback, e.g. a `headers` listener that threw
//
// -----------------------------------------------------------------------------
template<class H>
concept HandleConcept =
    requires(H& h, const H& ch)
{
    { ch.id() } noexcept -> std::same_as<HandleId>;
    { ch.stats() } -> std::same_as<TransferStats>;
    { h.take_failure() } noexcept -> std::same_as<std::exception_ptr>;
};


// -----------------------------------------------------------------------------
// MultiConcept
// -----------------------------------------------------------------------------
//
// The multiplexing handle driving many exchanges at once.
//
//   • add()/remove() register transport handles
//   • perform() advances every registered transfer and reports how many
//     are still running
//   • info_read() pops one completion (false when none is queued)
//   • wait() blocks up to the timeout for activity; returns the number of
//     ready descriptors, or -1 when nothing could be waited on
//
// -----------------------------------------------------------------------------
template<class M>
concept MultiConcept =
    HandleConcept<typename M::handle_type> &&
    requires(M& m, typename M::handle_type& h, int& running, Completion& done,
             std::chrono::milliseconds timeout)
{
    { m.add(h) } noexcept -> std::same_as<MultiCode>;
    { m.remove(h) } noexcept -> std::same_as<MultiCode>;
    { m.perform(running) } noexcept -> std::same_as<MultiCode>;
    { m.info_read(done) } noexcept -> std::same_as<bool>;
    { m.wait(timeout) } noexcept -> std::same_as<int>;
};


// Creates (or resets and reuses `existing`) the transport handle for txn
template<class H>
using HandleFactory =
    std::function<std::unique_ptr<H>(Transaction& txn, message::Factory& messages, std::unique_ptr<H> existing)>;


// -----------------------------------------------------------------------------
// BackendConcept
// -----------------------------------------------------------------------------
//
// Bundles one transport implementation for the engine:
// multiplexing handle type, transport handle type, default handle factory
// and human-readable transport codes.
//
// -----------------------------------------------------------------------------
template<class B>
concept BackendConcept =
    MultiConcept<typename B::multi_type> &&
    std::same_as<typename B::multi_type::handle_type, typename B::handle_type> &&
    requires(B& b, const B& cb, int code)
{
    { B::name } -> std::convertible_to<std::string_view>;
    { b.create_multi() } -> std::same_as<std::unique_ptr<typename B::multi_type>>;
    { cb.handle_factory() } -> std::same_as<HandleFactory<typename B::handle_type>>;
    { cb.describe(code) } -> std::same_as<std::string>;
};

} // namespace spindle::core::transport
