#pragma once

#include <memory>
#include <string>

#include "spindle/core/event/emitter.hpp"
#include "spindle/core/message/body.hpp"
#include "spindle/core/message/headers.hpp"

namespace spindle::core::message {

// Outgoing request. The URL is opaque to the engine (already resolved and
// absolute). Each request owns the emitter its lifecycle events go through.
class Request {
public:
    Request(std::string method, std::string url, Headers headers = {},
            std::shared_ptr<Body> body = nullptr)
        : method_(std::move(method))
        , url_(std::move(url))
        , headers_(std::move(headers))
        , body_(std::move(body))
    {}

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    void set_method(std::string method) { method_ = std::move(method); }

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    void set_url(std::string url) { url_ = std::move(url); }

    [[nodiscard]] Headers& headers() noexcept { return headers_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }

    [[nodiscard]] Body* body() const noexcept { return body_.get(); }
    void set_body(std::shared_ptr<Body> body) { body_ = std::move(body); }

    [[nodiscard]] event::Emitter& emitter() noexcept { return emitter_; }
    [[nodiscard]] const event::Emitter& emitter() const noexcept { return emitter_; }

private:
    std::string method_;
    std::string url_;
    Headers headers_;
    std::shared_ptr<Body> body_;
    event::Emitter emitter_;
};

} // namespace spindle::core::message
