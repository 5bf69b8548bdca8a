#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace spindle::examples::cli {

// -------------------------------------------------------------
// HTTP URL validator
// -------------------------------------------------------------
inline auto http_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0) {
            return {};
        }
        return "URL must start with http:// or https://";
    },
    "HTTP URL validator"
);

// -------------------------------------------------------------
// JSON pointer validator (RFC 6901: empty or starting with '/')
// -------------------------------------------------------------
inline auto json_pointer_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.front() == '/') {
            return {};
        }
        return "JSON pointer must be empty or start with '/'";
    },
    "JSON pointer validator"
);

} // namespace spindle::examples::cli
