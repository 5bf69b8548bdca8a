#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>

#include <curl/curl.h>

#include "spindle/core/message/factory.hpp"
#include "spindle/core/message/headers.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transfer_stats.hpp"
#include "spindle/core/transport/concepts.hpp"

namespace spindle::core::transport::curl {

/*
===============================================================================
 curl::EasyHandle
===============================================================================

RAII owner of a CURL* easy handle bound to one Transaction.

Callbacks:
  - header: collects the status line and header fields. When the final
    (non-1xx) header block ends, builds the response through the message
    factory, attaches it to the transaction and emits `headers`
  - write : appends received bytes to the response body
  - read  : streams the request body
  - seek  : rewinds the request body when libcurl needs to resend it

Exceptions raised inside a callback (including by `headers` listeners) are
captured, abort the transfer, and are handed to the engine through
take_failure().

The handle registers `this` as callback data, so it is neither copyable nor
movable. It may be rebound to another attempt after reset().
===============================================================================
*/
class EasyHandle {
public:
    EasyHandle();
    ~EasyHandle();

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
    EasyHandle(EasyHandle&&) = delete;
    EasyHandle& operator=(EasyHandle&&) = delete;

    // Clears every option and all per-attempt state (handle reuse)
    void reset() noexcept;

    // Associates the handle with txn and installs the callbacks
    void bind(Transaction& txn, message::Factory& messages);

    // Takes ownership of the request header list
    void set_header_list(curl_slist* list) noexcept;

    [[nodiscard]] HandleId id() const noexcept { return easy_; }
    [[nodiscard]] TransferStats stats() const;
    [[nodiscard]] std::exception_ptr take_failure() noexcept { return std::exchange(failure_, nullptr); }

    [[nodiscard]] CURL* get() const noexcept { return easy_; }
    [[nodiscard]] Transaction* transaction() const noexcept { return txn_; }

private:
    static std::size_t on_header_(char* data, std::size_t size, std::size_t nitems, void* self);
    static std::size_t on_write_(char* data, std::size_t size, std::size_t nmemb, void* self);
    static std::size_t on_read_(char* buffer, std::size_t size, std::size_t nitems, void* self);
    static int on_seek_(void* self, curl_off_t offset, int origin);

    void header_line_(std::string_view line);
    void finish_header_block_();

private:
    CURL* easy_;
    curl_slist* header_list_{nullptr};
    Transaction* txn_{nullptr};
    message::Factory* messages_{nullptr};

    // Header block being received
    std::optional<message::StatusLine> status_;
    message::Headers headers_;

    std::exception_ptr failure_;
};

} // namespace spindle::core::transport::curl
