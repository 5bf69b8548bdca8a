#include "spindle/core/transport/engine/config.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

#include "spindle/core/error.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::transport::engine {

namespace {

double parse_seconds(const char* raw) {
    const std::string text{raw};
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range
        throw ConfigError(std::string(SELECT_TIMEOUT_ENV) + " is not a number: '" + text + "'");
    }
    if (used != text.size()) {
        throw ConfigError(std::string(SELECT_TIMEOUT_ENV) + " is not a number: '" + text + "'");
    }
    return value;
}

void validate(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw ConfigError("select timeout must be a finite, non-negative number of seconds (got " +
                          std::to_string(seconds) + ")");
    }
}

} // namespace

std::chrono::milliseconds resolve_select_timeout(std::optional<double> explicit_seconds) {
    double seconds = DEFAULT_SELECT_TIMEOUT;
    if (explicit_seconds) {
        seconds = *explicit_seconds;
    } else if (const char* raw = std::getenv(SELECT_TIMEOUT_ENV); raw != nullptr && *raw != '\0') {
        seconds = parse_seconds(raw);
        SP_DEBUG("[ENGINE] Select timeout taken from " << SELECT_TIMEOUT_ENV << ": " << seconds << "s");
    }
    validate(seconds);
    return std::chrono::milliseconds{static_cast<long long>(std::llround(seconds * 1000.0))};
}

} // namespace spindle::core::transport::engine
