#pragma once

#include <cstdint>

namespace spindle::core::event {

/*
===============================================================================
 event::Priority
===============================================================================

Listener ordering key. Higher runs first; equal priorities run in
registration order.

Besides plain integers, two relative positions resolve against the
listeners currently registered for the event name:
- first(): highest existing priority + 1, or 1 when there is none
- last() : lowest existing priority - 1, or -1 when there is none
===============================================================================
*/
class Priority {
public:
    enum class Mode : std::uint8_t { Value, First, Last };

    constexpr Priority(int value = 0) noexcept // NOLINT(google-explicit-constructor)
        : mode_(Mode::Value)
        , value_(value)
    {}

    [[nodiscard]] static constexpr Priority first() noexcept { return Priority{Mode::First}; }
    [[nodiscard]] static constexpr Priority last() noexcept { return Priority{Mode::Last}; }

    [[nodiscard]] constexpr Mode mode() const noexcept { return mode_; }
    [[nodiscard]] constexpr int value() const noexcept { return value_; }

private:
    constexpr explicit Priority(Mode mode) noexcept
        : mode_(mode)
        , value_(0)
    {}

    Mode mode_;
    int value_;
};

// Well-known priorities used by request plugins
namespace priority {
    inline constexpr int early             = 10000;
    inline constexpr int late              = -10000;
    inline constexpr int prepare_request   = -100;
    inline constexpr int sign_request      = -10000;
    inline constexpr int verify_response   = 100;
    inline constexpr int redirect_response = 200;
} // namespace priority

} // namespace spindle::core::event
