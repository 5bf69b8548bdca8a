/*
================================================================================
Spindle Transfer Engine Configuration
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "spindle/core/transport/concepts.hpp"


namespace spindle::core::transport::engine {

// Environment variable consulted when no explicit select timeout is given
inline constexpr const char* SELECT_TIMEOUT_ENV = "SPINDLE_SELECT_TIMEOUT";

// Seconds the engine blocks waiting for transport activity
inline constexpr double DEFAULT_SELECT_TIMEOUT = 1.0;

// Multiplexing handles kept idle for reuse
inline constexpr std::size_t DEFAULT_MAX_IDLE_MULTI_HANDLES = 3;

// Sleep after a wait that had nothing to wait on
inline constexpr std::chrono::microseconds DEFAULT_NO_PROGRESS_BACKOFF{250};

template<class Handle>
struct Config {
    // Overrides the backend's handle factory when set
    HandleFactory<Handle> handle_factory{};

    // Seconds; explicit value > SPINDLE_SELECT_TIMEOUT > DEFAULT_SELECT_TIMEOUT
    std::optional<double> select_timeout{};

    std::size_t max_idle_multi_handles{DEFAULT_MAX_IDLE_MULTI_HANDLES};

    std::chrono::microseconds no_progress_backoff{DEFAULT_NO_PROGRESS_BACKOFF};
};

// Resolves the select timeout (explicit > environment > default).
// Throws ConfigError for negative, NaN, infinite or unparsable values.
[[nodiscard]] std::chrono::milliseconds resolve_select_timeout(std::optional<double> explicit_seconds);

} // namespace spindle::core::transport::engine
