#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "spindle/core/message/factory.hpp"
#include "spindle/core/transaction.hpp"
#include "spindle/core/transport/curl/easy_handle.hpp"

namespace spindle::core::transport::curl {

// Transport options applied to every easy handle
struct HandleOptions {
    std::string user_agent{"spindle/1.0"};      // used when the request has no User-Agent
    std::chrono::milliseconds connect_timeout{0}; // 0 == libcurl default
    bool verbose{false};
};

/*
===============================================================================
 curl::HandleFactory
===============================================================================

Builds the easy handle for one transport attempt: method, URL, headers,
request body streaming and transport-level options.

A handle passed as `existing` (the previous attempt of a rewind retry) is
reset and reused instead of allocating a new one.

Failures are thrown as RequestError; the engine reports them through the
`error` event of the transaction.
===============================================================================
*/
class HandleFactory {
public:
    HandleFactory() = default;
    explicit HandleFactory(HandleOptions options)
        : options_(std::move(options))
    {}

    std::unique_ptr<EasyHandle> operator()(Transaction& txn, message::Factory& messages,
                                           std::unique_ptr<EasyHandle> existing) const;

    [[nodiscard]] const HandleOptions& options() const noexcept { return options_; }

private:
    HandleOptions options_;
};

} // namespace spindle::core::transport::curl
