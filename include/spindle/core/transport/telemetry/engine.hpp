#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/counter.hpp"
#include "lcr/format.hpp"

namespace spindle::core::transport::telemetry {

// ============================================================================
// Engine Telemetry
//
// Observes batch scheduling decisions of the transfer engine.
// Mechanical facts only. Updated by the thread driving the batch.
// ============================================================================

struct alignas(64) Engine final {
    // ---------------------------------------------------------------------
    // Batches
    // ---------------------------------------------------------------------

    // send() / send_all() invoked
    lcr::metrics::counter32 batches_total;

    // Batch aborted by a propagated failure
    lcr::metrics::counter32 escalations_total;

    // ---------------------------------------------------------------------
    // Transfers
    // ---------------------------------------------------------------------

    // Transport handle registered with the multiplexing handle
    lcr::metrics::counter64 admitted_total;

    // Response attached by a `before` listener (no transport used)
    lcr::metrics::counter64 intercepted_total;

    // Finished with a response
    lcr::metrics::counter64 completed_total;

    // Finished with a transport or application failure
    lcr::metrics::counter64 failed_total;

    // Silent retries after a connection gap with a rewindable body
    lcr::metrics::counter64 rewind_retries_total;

    // Peak number of simultaneously registered handles
    lcr::metrics::high_watermark<std::uint32_t> active_peak;

    inline void copy_to(Engine& other) const noexcept {
        batches_total.copy_to(other.batches_total);
        escalations_total.copy_to(other.escalations_total);
        admitted_total.copy_to(other.admitted_total);
        intercepted_total.copy_to(other.intercepted_total);
        completed_total.copy_to(other.completed_total);
        failed_total.copy_to(other.failed_total);
        rewind_retries_total.copy_to(other.rewind_retries_total);
        active_peak.copy_to(other.active_peak);
    }

    inline void debug_dump(std::ostream& os) const noexcept {
        os << "\n=== Engine Telemetry ===\n";
        os << "Batches\n";
        os << "  Batches               : " << lcr::format_number_exact(batches_total.load()) << '\n';
        os << "  Escalations           : " << lcr::format_number_exact(escalations_total.load()) << '\n';
        os << "\nTransfers\n";
        os << "  Admitted              : " << lcr::format_number_exact(admitted_total.load()) << '\n';
        os << "  Intercepted           : " << lcr::format_number_exact(intercepted_total.load()) << '\n';
        os << "  Completed             : " << lcr::format_number_exact(completed_total.load()) << '\n';
        os << "  Failed                : " << lcr::format_number_exact(failed_total.load()) << '\n';
        os << "  Rewind retries        : " << lcr::format_number_exact(rewind_retries_total.load()) << '\n';
        os << "  Active peak           : " << lcr::format_number_exact(active_peak.load()) << '\n';
    }
};

// ============================================================================
// Pool Telemetry
//
// Multiplexing handle reuse. Updated under the pool lock.
// ============================================================================

struct alignas(64) Pool final {
    // checkout() calls
    lcr::metrics::counter64 checkouts_total;

    // checkout() served from the idle set
    lcr::metrics::counter64 reused_total;

    // New multiplexing handles created
    lcr::metrics::counter64 created_total;

    // Handles closed instead of pooled (idle set full, or discarded after a failure)
    lcr::metrics::counter64 discarded_total;

    inline void copy_to(Pool& other) const noexcept {
        checkouts_total.copy_to(other.checkouts_total);
        reused_total.copy_to(other.reused_total);
        created_total.copy_to(other.created_total);
        discarded_total.copy_to(other.discarded_total);
    }

    inline void debug_dump(std::ostream& os) const noexcept {
        os << "\n=== Pool Telemetry ===\n";
        os << "  Checkouts             : " << lcr::format_number_exact(checkouts_total.load()) << '\n';
        os << "  Reused                : " << lcr::format_number_exact(reused_total.load()) << '\n';
        os << "  Created               : " << lcr::format_number_exact(created_total.load()) << '\n';
        os << "  Discarded             : " << lcr::format_number_exact(discarded_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Engine>, "telemetry::Engine must be standard layout");
static_assert(std::is_trivially_destructible_v<Engine>, "telemetry::Engine must be trivially destructible");
static_assert(alignof(Engine) == 64, "telemetry::Engine must be cache-line aligned");
static_assert(std::is_standard_layout_v<Pool>, "telemetry::Pool must be standard layout");
static_assert(alignof(Pool) == 64, "telemetry::Pool must be cache-line aligned");

} // namespace spindle::core::transport::telemetry
