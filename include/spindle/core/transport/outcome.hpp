#pragma once

#include <cstdint>
#include <exception>
#include <string_view>

namespace spindle::core::transport {

// Classification of a finished transport attempt
enum class OutcomeKind : std::uint8_t {
    Success,            // response present, transport reported OK
    RetryableGap,       // no response, rewindable body: retry silently
    TransportFailure,   // transport reported a non-OK code
    ApplicationFailure  // callback failure, or a gap that cannot be retried
};

inline constexpr std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
    case OutcomeKind::Success:            return "Success";
    case OutcomeKind::RetryableGap:       return "RetryableGap";
    case OutcomeKind::TransportFailure:   return "TransportFailure";
    case OutcomeKind::ApplicationFailure: return "ApplicationFailure";
    }
    return "Unknown";
}

struct Outcome {
    OutcomeKind kind{OutcomeKind::Success};
    std::exception_ptr failure{};   // set for the two failure kinds
};

} // namespace spindle::core::transport
