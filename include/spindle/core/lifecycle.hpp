#pragma once

#include <exception>

#include "spindle/core/error.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transfer_stats.hpp"

namespace spindle::core::lifecycle {

/*
===============================================================================
 Lifecycle coordinator
===============================================================================

Emits the four lifecycle events of an exchange on the request's emitter and
keeps every failure going through exactly one `error` dispatch.

  before -> (intercepted | transport) -> headers? -> complete | error

Error marker:
  emit_error() throws a copy of the failure flagged as emitted. Callers up
  the stack recognise the flag and rethrow instead of reporting it again.
===============================================================================
*/

// Failures raised by `before` listeners are reported through emit_error();
// an already-emitted RequestError or an InternalError is rethrown untouched.
void emit_before(Transaction& txn);

void emit_headers(Transaction& txn);

// Requires a response on txn. Sets its effective URL to the request URL.
// A failure raised by listeners (other than InternalError) is reported
// through emit_error() with the same stats.
void emit_complete(Transaction& txn, const TransferStats& stats = {});

// Dispatches `error`. Throws the marked failure unless a listener stopped
// propagation.
void emit_error(Transaction& txn, const RequestError& failure, const TransferStats& stats = {});

// Same, for an arbitrary failure. Anything that is not a RequestError is
// wrapped (kind Application) with the original kept as cause.
void emit_error(Transaction& txn, std::exception_ptr failure, const TransferStats& stats = {});

} // namespace spindle::core::lifecycle
