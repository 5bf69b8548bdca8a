#include "spindle/core/message/factory.hpp"

#include <charconv>

namespace spindle::core::message {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

Response Factory::create_response(StatusLine status, Headers headers) const {
    return Response{std::move(status.protocol_version), status.status,
                    std::move(status.reason), std::move(headers)};
}

std::optional<StatusLine> Factory::parse_status_line(std::string_view line) {
    line = trim_line_end(line);
    constexpr std::string_view prefix = "HTTP/";
    if (line.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    line.remove_prefix(prefix.size());

    const auto sp = line.find(' ');
    if (sp == std::string_view::npos || sp == 0) {
        return std::nullopt;
    }
    StatusLine out;
    out.protocol_version = std::string(line.substr(0, sp));
    line.remove_prefix(sp + 1);

    // HTTP/2 status lines may carry no reason phrase
    const auto code_end = line.find(' ');
    const std::string_view code = line.substr(0, code_end);
    if (code.size() != 3) {
        return std::nullopt;
    }
    const auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), out.status);
    if (ec != std::errc{} || ptr != code.data() + code.size()) {
        return std::nullopt;
    }
    if (code_end != std::string_view::npos) {
        out.reason = std::string(trim(line.substr(code_end + 1)));
    }
    return out;
}

std::optional<Headers::Field> Factory::parse_header_line(std::string_view line) {
    line = trim_line_end(line);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    const auto name = trim(line.substr(0, colon));
    if (name.empty()) {
        return std::nullopt;
    }
    return Headers::Field{std::string(name), std::string(trim(line.substr(colon + 1)))};
}

std::string_view Factory::trim_line_end(std::string_view line) noexcept {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace spindle::core::message
