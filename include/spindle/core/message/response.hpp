#pragma once

#include <string>

#include "spindle/core/message/headers.hpp"

namespace spindle::core::message {

class Response {
public:
    Response() = default;

    Response(std::string protocol_version, int status, std::string reason, Headers headers = {})
        : protocol_version_(std::move(protocol_version))
        , status_(status)
        , reason_(std::move(reason))
        , headers_(std::move(headers))
    {}

    [[nodiscard]] const std::string& protocol_version() const noexcept { return protocol_version_; }
    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

    [[nodiscard]] Headers& headers() noexcept { return headers_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }

    [[nodiscard]] std::string& body() noexcept { return body_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    void set_body(std::string body) { body_ = std::move(body); }

    [[nodiscard]] const std::string& effective_url() const noexcept { return effective_url_; }
    void set_effective_url(std::string url) { effective_url_ = std::move(url); }

private:
    std::string protocol_version_{"1.1"};
    int status_{0};
    std::string reason_;
    Headers headers_;
    std::string body_;
    std::string effective_url_;
};

} // namespace spindle::core::message
