#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <curl/curl.h>

#include "spindle/core/transport/concepts.hpp"
#include "spindle/core/transport/curl/easy_handle.hpp"
#include "spindle/core/transport/curl/global_init.hpp"
#include "spindle/core/transport/curl/handle_factory.hpp"
#include "spindle/core/transport/curl/multi.hpp"

namespace spindle::core::transport::curl {

// libcurl transport for transport::Engine. Copies share the global init.
class Backend {
public:
    using multi_type  = Multi;
    using handle_type = EasyHandle;

    static constexpr std::string_view name = "curl";

    Backend()
        : global_(std::make_shared<GlobalInit>())
    {}

    explicit Backend(HandleOptions options)
        : global_(std::make_shared<GlobalInit>())
        , options_(std::move(options))
    {}

    [[nodiscard]] std::unique_ptr<Multi> create_multi() {
        return std::make_unique<Multi>();
    }

    [[nodiscard]] transport::HandleFactory<EasyHandle> handle_factory() const {
        return HandleFactory{options_};
    }

    [[nodiscard]] std::string describe(int code) const {
        return curl_easy_strerror(static_cast<CURLcode>(code));
    }

private:
    std::shared_ptr<GlobalInit> global_;
    HandleOptions options_;
};

static_assert(BackendConcept<Backend>, "curl::Backend must satisfy BackendConcept");

} // namespace spindle::core::transport::curl
