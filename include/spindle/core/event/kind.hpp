#pragma once

#include <cstdint>
#include <string_view>

namespace spindle::core::event {

// Lifecycle events emitted on a request's emitter, in dispatch order
enum class Kind : std::uint8_t {
    Before,
    Headers,
    Complete,
    Error
};

// Event names as registered with Emitter::on()
namespace names {
    inline constexpr std::string_view BEFORE   = "before";
    inline constexpr std::string_view HEADERS  = "headers";
    inline constexpr std::string_view COMPLETE = "complete";
    inline constexpr std::string_view ERROR    = "error";
} // namespace names

inline constexpr std::string_view to_string(Kind kind) noexcept {
    switch (kind) {
    case Kind::Before:   return names::BEFORE;
    case Kind::Headers:  return names::HEADERS;
    case Kind::Complete: return names::COMPLETE;
    case Kind::Error:    return names::ERROR;
    }
    return "unknown";
}

} // namespace spindle::core::event
