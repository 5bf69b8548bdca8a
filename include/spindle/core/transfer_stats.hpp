#pragma once

#include <cstdint>
#include <string>
#include <ostream>


namespace spindle::core {

// -----------------------------------------------------------------------------
// TransferStats
// -----------------------------------------------------------------------------
//
// Per-attempt statistics reported by the transport once an exchange leaves
// the multiplexing handle. Times are in seconds, as reported by the transport.
// Fields the transport could not provide stay at their defaults.
// -----------------------------------------------------------------------------
struct TransferStats {
    int transport_result{0};        // low-level completion code (0 == OK)
    long http_status{0};            // status of the last received response
    double total_time{0.0};
    double name_lookup_time{0.0};
    double connect_time{0.0};
    double start_transfer_time{0.0};
    std::uint64_t bytes_uploaded{0};
    std::uint64_t bytes_downloaded{0};
    std::string primary_ip;
    std::string effective_url;      // last URL used by the transport
};

inline std::ostream& operator<<(std::ostream& os, const TransferStats& s) {
    os << "{result=" << s.transport_result
       << ", status=" << s.http_status
       << ", total=" << s.total_time << "s"
       << ", up=" << s.bytes_uploaded
       << ", down=" << s.bytes_downloaded;
    if (!s.primary_ip.empty()) {
        os << ", ip=" << s.primary_ip;
    }
    return os << "}";
}

} // namespace spindle::core
