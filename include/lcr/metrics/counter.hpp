#pragma once

#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - Monotonically increasing cumulative metric
// ---------------------------------------------------------------------------
//
// Plain value, no atomics. Owners that share a counter across threads must
// update it under their own lock (see transport::MultiPool).
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
public:
    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;
    counter(counter&&) noexcept = delete;
    counter& operator=(counter&&) noexcept = delete;

    // Snapshot support
    inline void copy_to(counter& dst) const noexcept {
        dst.value_ = value_;
    }

    inline constexpr T load() const noexcept { return value_; }
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

// ---------------------------------------------------------------------------
// high_watermark - Largest value ever observed (peak concurrency, peak depth)
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) high_watermark {
public:
    constexpr high_watermark() noexcept = default;

    high_watermark(const high_watermark&) = delete;
    high_watermark& operator=(const high_watermark&) = delete;

    inline void copy_to(high_watermark& dst) const noexcept {
        dst.value_ = value_;
    }

    inline constexpr T load() const noexcept { return value_; }

    inline constexpr void observe(T v) noexcept {
        if (v > value_) {
            value_ = v;
        }
    }

    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

} // namespace metrics
} // namespace lcr
