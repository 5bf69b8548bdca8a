#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <cstddef>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    const std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return out;
}


// Format a duration given in seconds (as reported by transfer statistics)
// Examples:
//   0.000042 -> "42.0 us"
//   0.0123   -> "12.3 ms"
//   3.456    -> "3.46 s"
inline std::string format_seconds(double seconds) {
    double value = seconds;
    const char* unit = "s";

    if (value < 1.0) {
        value *= 1'000.0;
        unit = "ms";
    }
    if (value < 1.0) {
        value *= 1'000.0;
        unit = "us";
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, unit);
}


// Format bytes as a scaled human-readable value (binary units)
// Example: 1234567 -> "1.18 MB"
inline std::string format_bytes_scaled(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }

    int precision =
        (unit_index == 0) ? 0 :
        (value < 10.0)    ? 2 :
        (value < 100.0)   ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}

} // namespace lcr
