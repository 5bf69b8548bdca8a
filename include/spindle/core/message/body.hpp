#pragma once

#include <cstdint>
#include <algorithm>
#include <cstring>
#include <functional>
#include <optional>
#include <string>

namespace spindle::core::message {

/*
===============================================================================
 message::Body
===============================================================================

Readable request body streamed to the transport.

A body that is seekable can be rewound to offset 0, which is what allows the
engine to silently retry a transfer whose connection dropped before any
response arrived. Non-seekable bodies make such a gap fatal for the request.
===============================================================================
*/
class Body {
public:
    virtual ~Body() = default;

    // Total size in bytes, if known up front
    [[nodiscard]] virtual std::optional<std::uint64_t> size() const noexcept = 0;

    // Copies up to n bytes into dst. Returns 0 at end of body.
    [[nodiscard]] virtual std::size_t read(char* dst, std::size_t n) = 0;

    [[nodiscard]] virtual bool seekable() const noexcept = 0;

    // Returns false when the body cannot be positioned at offset
    [[nodiscard]] virtual bool seek(std::uint64_t offset) noexcept = 0;
};


// In-memory body. Always seekable.
class StringBody final : public Body {
public:
    explicit StringBody(std::string data)
        : data_(std::move(data))
    {}

    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override {
        return data_.size();
    }

    [[nodiscard]] std::size_t read(char* dst, std::size_t n) override {
        const std::size_t len = std::min(n, data_.size() - pos_);
        std::memcpy(dst, data_.data() + pos_, len);
        pos_ += len;
        return len;
    }

    [[nodiscard]] bool seekable() const noexcept override { return true; }

    [[nodiscard]] bool seek(std::uint64_t offset) noexcept override {
        if (offset > data_.size()) {
            return false;
        }
        pos_ = static_cast<std::size_t>(offset);
        return true;
    }

    [[nodiscard]] const std::string& data() const noexcept { return data_; }

private:
    std::string data_;
    std::size_t pos_{0};
};


// Callback-fed body (chunks produced on demand). Not seekable.
class GeneratorBody final : public Body {
public:
    using Generator = std::function<std::size_t(char* dst, std::size_t n)>;

    explicit GeneratorBody(Generator gen, std::optional<std::uint64_t> size = std::nullopt)
        : gen_(std::move(gen))
        , size_(size)
    {}

    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override { return size_; }

    [[nodiscard]] std::size_t read(char* dst, std::size_t n) override {
        return gen_ ? gen_(dst, n) : 0;
    }

    [[nodiscard]] bool seekable() const noexcept override { return false; }

    [[nodiscard]] bool seek(std::uint64_t) noexcept override { return false; }

private:
    Generator gen_;
    std::optional<std::uint64_t> size_;
};

} // namespace spindle::core::message
