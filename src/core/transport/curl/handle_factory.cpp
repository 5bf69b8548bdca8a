#include "spindle/core/transport/curl/handle_factory.hpp"

#include <string>

#include "spindle/core/error.hpp"

#include "lcr/log/logger.hpp"

namespace spindle::core::transport::curl {

namespace {

template<class T>
void setopt(CURL* easy, CURLoption option, T value) {
    const CURLcode rc = curl_easy_setopt(easy, option, value);
    if (rc != CURLE_OK) {
        throw RequestError(ErrorKind::Application,
                           std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
    }
}

curl_slist* append(curl_slist* list, const std::string& line) {
    curl_slist* next = curl_slist_append(list, line.c_str());
    if (next == nullptr) {
        curl_slist_free_all(list);
        throw RequestError(ErrorKind::Application, "curl_slist_append failed");
    }
    return next;
}

curl_off_t body_size(const message::Body& body) noexcept {
    const auto size = body.size();
    return size ? static_cast<curl_off_t>(*size) : -1;
}

void apply_method(CURL* easy, const message::Request& request) {
    const std::string& method = request.method();
    const message::Body* body = request.body();

    if (body != nullptr) {
        if (method == "POST") {
            setopt(easy, CURLOPT_POST, 1L);
            setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, body_size(*body));
        } else {
            setopt(easy, CURLOPT_UPLOAD, 1L);
            setopt(easy, CURLOPT_INFILESIZE_LARGE, body_size(*body));
            if (method != "PUT") {
                setopt(easy, CURLOPT_CUSTOMREQUEST, method.c_str());
            }
        }
        return;
    }

    if (method == "GET") {
        setopt(easy, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
        setopt(easy, CURLOPT_NOBODY, 1L);
    } else {
        setopt(easy, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
}

curl_slist* build_headers(const message::Request& request, const HandleOptions& options) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : request.headers()) {
        // "Name;" sends a header with an empty value, "Name:" would drop it
        list = append(list, value.empty() ? name + ";" : name + ": " + value);
    }
    if (!options.user_agent.empty() && !request.headers().has("User-Agent")) {
        list = append(list, "User-Agent: " + options.user_agent);
    }
    // Avoid the 100-continue round trip for request bodies
    if (request.body() != nullptr && !request.headers().has("Expect")) {
        list = append(list, "Expect:");
    }
    return list;
}

} // namespace

std::unique_ptr<EasyHandle> HandleFactory::operator()(Transaction& txn, message::Factory& messages,
                                                      std::unique_ptr<EasyHandle> existing) const {
    std::unique_ptr<EasyHandle> handle;
    if (existing) {
        existing->reset();
        handle = std::move(existing);
        SP_TRACE("[CURL] Reusing easy handle [url] " << txn.request().url());
    } else {
        handle = std::make_unique<EasyHandle>();
    }

    const message::Request& request = txn.request();
    CURL* easy = handle->get();

    handle->bind(txn, messages);

    setopt(easy, CURLOPT_URL, request.url().c_str());
    setopt(easy, CURLOPT_NOSIGNAL, 1L);
    setopt(easy, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
    if (options_.connect_timeout.count() > 0) {
        setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    }
    if (options_.verbose) {
        setopt(easy, CURLOPT_VERBOSE, 1L);
    }

    apply_method(easy, request);

    // Owned by the handle: must outlive the transfer
    curl_slist* list = build_headers(request, options_);
    handle->set_header_list(list);
    if (list != nullptr) {
        setopt(easy, CURLOPT_HTTPHEADER, list);
    }
    return handle;
}

} // namespace spindle::core::transport::curl
