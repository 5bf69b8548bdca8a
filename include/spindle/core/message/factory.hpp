#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "spindle/core/message/headers.hpp"
#include "spindle/core/message/response.hpp"

namespace spindle::core::message {

// Parsed "HTTP/<version> <status> [reason]" line
struct StatusLine {
    std::string protocol_version;
    int status{0};
    std::string reason;
};

/*
===============================================================================
 message::Factory
===============================================================================

Builds response messages out of the raw header stream delivered by the
transport. Stateless; one instance is shared by every handle of an engine.
===============================================================================
*/
class Factory {
public:
    [[nodiscard]] Response create_response(StatusLine status, Headers headers) const;

    // nullopt when the line is not an HTTP status line
    [[nodiscard]] static std::optional<StatusLine> parse_status_line(std::string_view line);

    // nullopt when the line has no ':' separator or an empty name
    [[nodiscard]] static std::optional<Headers::Field> parse_header_line(std::string_view line);

    // Drops a trailing CRLF / LF
    [[nodiscard]] static std::string_view trim_line_end(std::string_view line) noexcept;
};

} // namespace spindle::core::message
