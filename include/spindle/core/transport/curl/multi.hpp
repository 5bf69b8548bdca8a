#pragma once

#include <chrono>

#include <curl/curl.h>

#include "spindle/core/error.hpp"
#include "spindle/core/transport/concepts.hpp"
#include "spindle/core/transport/curl/easy_handle.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::transport::curl {

[[nodiscard]] inline MultiCode to_multi_code(CURLMcode rc) noexcept {
    if (rc >= CURLM_CALL_MULTI_PERFORM && rc <= CURLM_ADDED_ALREADY) {
        return static_cast<MultiCode>(static_cast<int>(rc));
    }
    return MultiCode::Unknown;
}

// -----------------------------------------------------------------------------
// curl::Multi
// -----------------------------------------------------------------------------
//
// RAII owner of a CURLM* multiplexing handle. Closed (curl_multi_cleanup) on
// destruction, which is how MultiPool discards surplus handles.
//
// -----------------------------------------------------------------------------
class Multi {
public:
    using handle_type = EasyHandle;

    Multi()
        : multi_(curl_multi_init())
    {
        if (multi_ == nullptr) {
            throw MultiError(static_cast<int>(MultiCode::OutOfMemory), "curl_multi_init failed");
        }
    }

    ~Multi() {
        curl_multi_cleanup(multi_);
    }

    Multi(const Multi&) = delete;
    Multi& operator=(const Multi&) = delete;

    [[nodiscard]] MultiCode add(EasyHandle& h) noexcept {
        return to_multi_code(curl_multi_add_handle(multi_, h.get()));
    }

    [[nodiscard]] MultiCode remove(EasyHandle& h) noexcept {
        return to_multi_code(curl_multi_remove_handle(multi_, h.get()));
    }

    [[nodiscard]] MultiCode perform(int& running) noexcept {
        return to_multi_code(curl_multi_perform(multi_, &running));
    }

    // Pops the next finished transfer, skipping non-DONE messages
    [[nodiscard]] bool info_read(Completion& done) noexcept {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }
            done.handle = msg->easy_handle;
            done.result = static_cast<int>(msg->data.result);
            return true;
        }
        return false;
    }

    // -1 when curl had no descriptor ready (or nothing to wait on)
    [[nodiscard]] int wait(std::chrono::milliseconds timeout) noexcept {
        int numfds = 0;
        const CURLMcode rc = curl_multi_wait(multi_, nullptr, 0, static_cast<int>(timeout.count()), &numfds);
        if (rc != CURLM_OK) {
            SP_WARN("[CURL] curl_multi_wait failed: " << curl_multi_strerror(rc));
            return -1;
        }
        return numfds == 0 ? -1 : numfds;
    }

    [[nodiscard]] CURLM* get() const noexcept { return multi_; }

private:
    CURLM* multi_;
};

} // namespace spindle::core::transport::curl
