#pragma once

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spindle::core::message {

// Ordered, case-insensitive header list. Duplicate names are kept in order.
class Headers {
public:
    using Field = std::pair<std::string, std::string>;

    Headers() = default;
    Headers(std::initializer_list<Field> fields) : fields_(fields) {}

    void add(std::string name, std::string value) {
        fields_.emplace_back(std::move(name), std::move(value));
    }

    // Replaces every field with the same name
    void set(std::string name, std::string value) {
        remove(name);
        add(std::move(name), std::move(value));
    }

    void remove(std::string_view name) {
        std::erase_if(fields_, [&](const Field& f) { return iequals(f.first, name); });
    }

    [[nodiscard]] bool has(std::string_view name) const noexcept {
        return std::any_of(fields_.begin(), fields_.end(),
                           [&](const Field& f) { return iequals(f.first, name); });
    }

    // First value for name
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const {
        for (const auto& f : fields_) {
            if (iequals(f.first, name)) {
                return f.second;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    auto begin() const noexcept { return fields_.begin(); }
    auto end() const noexcept { return fields_.end(); }

    void clear() noexcept { fields_.clear(); }

    [[nodiscard]] static bool iequals(std::string_view a, std::string_view b) noexcept {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }

private:
    std::vector<Field> fields_;
};

} // namespace spindle::core::message
