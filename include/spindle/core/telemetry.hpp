#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1 counters are cheap mechanical facts (admissions, completions, pool hits).
// They compile to nothing unless SPINDLE_ENABLE_TELEMETRY_L1 is defined.
// -----------------------------------------------------------------------------

#if defined(SPINDLE_ENABLE_TELEMETRY_L1)
    #define SP_TL1(expr) expr
#else
    #define SP_TL1(expr) ((void)0)
#endif
