#include "spindle/core/transport/curl/easy_handle.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

#include "spindle/core/error.hpp"
#include "spindle/core/lifecycle.hpp"

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

} // namespace

EasyHandle::EasyHandle()
    : easy_(curl_easy_init())
{
    if (easy_ == nullptr) {
        throw RequestError(ErrorKind::Application, "curl_easy_init failed");
    }
}

EasyHandle::~EasyHandle() {
    curl_easy_cleanup(easy_);
    curl_slist_free_all(header_list_);
}

void EasyHandle::reset() noexcept {
    curl_easy_reset(easy_);
    curl_slist_free_all(header_list_);
    header_list_ = nullptr;
    txn_ = nullptr;
    messages_ = nullptr;
    status_.reset();
    headers_.clear();
    failure_ = nullptr;
}

void EasyHandle::bind(Transaction& txn, message::Factory& messages) {
    txn_ = &txn;
    messages_ = &messages;
    status_.reset();
    headers_.clear();
    failure_ = nullptr;

    setopt(easy_, CURLOPT_PRIVATE, static_cast<void*>(this));
    setopt(easy_, CURLOPT_HEADERFUNCTION, &EasyHandle::on_header_);
    setopt(easy_, CURLOPT_HEADERDATA, static_cast<void*>(this));
    setopt(easy_, CURLOPT_WRITEFUNCTION, &EasyHandle::on_write_);
    setopt(easy_, CURLOPT_WRITEDATA, static_cast<void*>(this));

    if (txn.request().body() != nullptr) {
        setopt(easy_, CURLOPT_READFUNCTION, &EasyHandle::on_read_);
        setopt(easy_, CURLOPT_READDATA, static_cast<void*>(this));
        setopt(easy_, CURLOPT_SEEKFUNCTION, &EasyHandle::on_seek_);
        setopt(easy_, CURLOPT_SEEKDATA, static_cast<void*>(this));
    }
}

void EasyHandle::set_header_list(curl_slist* list) noexcept {
    curl_slist_free_all(header_list_);
    header_list_ = list;
}

TransferStats EasyHandle::stats() const {
    TransferStats s;
    long status = 0;
    if (curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status) == CURLE_OK) {
        s.http_status = status;
    }
    curl_easy_getinfo(easy_, CURLINFO_TOTAL_TIME, &s.total_time);
    curl_easy_getinfo(easy_, CURLINFO_NAMELOOKUP_TIME, &s.name_lookup_time);
    curl_easy_getinfo(easy_, CURLINFO_CONNECT_TIME, &s.connect_time);
    curl_easy_getinfo(easy_, CURLINFO_STARTTRANSFER_TIME, &s.start_transfer_time);

    curl_off_t up = 0;
    if (curl_easy_getinfo(easy_, CURLINFO_SIZE_UPLOAD_T, &up) == CURLE_OK && up > 0) {
        s.bytes_uploaded = static_cast<std::uint64_t>(up);
    }
    curl_off_t down = 0;
    if (curl_easy_getinfo(easy_, CURLINFO_SIZE_DOWNLOAD_T, &down) == CURLE_OK && down > 0) {
        s.bytes_downloaded = static_cast<std::uint64_t>(down);
    }

    char* ip = nullptr;
    if (curl_easy_getinfo(easy_, CURLINFO_PRIMARY_IP, &ip) == CURLE_OK && ip != nullptr) {
        s.primary_ip = ip;
    }
    char* url = nullptr;
    if (curl_easy_getinfo(easy_, CURLINFO_EFFECTIVE_URL, &url) == CURLE_OK && url != nullptr) {
        s.effective_url = url;
    }
    return s;
}

// -----------------------------------------------------------------------------
// Callbacks
// -----------------------------------------------------------------------------

std::size_t EasyHandle::on_header_(char* data, std::size_t size, std::size_t nitems, void* self) {
    auto* h = static_cast<EasyHandle*>(self);
    const std::size_t len = size * nitems;
    try {
        h->header_line_(std::string_view{data, len});
    } catch (...) {
        // Returning a short count makes libcurl abort the transfer
        h->failure_ = std::current_exception();
        return 0;
    }
    return len;
}

std::size_t EasyHandle::on_write_(char* data, std::size_t size, std::size_t nmemb, void* self) {
    auto* h = static_cast<EasyHandle*>(self);
    const std::size_t len = size * nmemb;
    try {
        if (auto* response = h->txn_->response()) {
            response->body().append(data, len);
        } else {
            SP_TRACE("[CURL] Dropping " << len << " body byte(s) received before the response headers");
        }
    } catch (...) {
        h->failure_ = std::current_exception();
        return 0;
    }
    return len;
}

std::size_t EasyHandle::on_read_(char* buffer, std::size_t size, std::size_t nitems, void* self) {
    auto* h = static_cast<EasyHandle*>(self);
    message::Body* body = h->txn_->request().body();
    if (body == nullptr) {
        return 0;
    }
    try {
        return body->read(buffer, size * nitems);
    } catch (...) {
        h->failure_ = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

int EasyHandle::on_seek_(void* self, curl_off_t offset, int origin) {
    auto* h = static_cast<EasyHandle*>(self);
    message::Body* body = h->txn_->request().body();
    if (body == nullptr || origin != SEEK_SET || offset < 0 || !body->seekable()) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    return body->seek(static_cast<std::uint64_t>(offset)) ? CURL_SEEKFUNC_OK : CURL_SEEKFUNC_FAIL;
}

// -----------------------------------------------------------------------------
// Header stream
// -----------------------------------------------------------------------------

void EasyHandle::header_line_(std::string_view raw) {
    const std::string_view line = message::Factory::trim_line_end(raw);

    if (line.empty()) {
        finish_header_block_();
        return;
    }
    if (!status_) {
        status_ = message::Factory::parse_status_line(line);
        if (!status_) {
            SP_TRACE("[CURL] Ignoring non-status line before headers: " << line);
        }
        return;
    }
    if (auto field = message::Factory::parse_header_line(line)) {
        headers_.add(std::move(field->first), std::move(field->second));
    }
}

void EasyHandle::finish_header_block_() {
    if (!status_) {
        return;
    }
    // Informational (1xx) blocks precede the real response
    if (status_->status >= 100 && status_->status < 200) {
        SP_TRACE("[CURL] Skipping informational response " << status_->status);
        status_.reset();
        headers_.clear();
        return;
    }

    message::StatusLine status = std::move(*status_);
    status_.reset();
    message::Headers headers = std::move(headers_);
    headers_.clear();

    txn_->set_response(messages_->create_response(std::move(status), std::move(headers)));
    lifecycle::emit_headers(*txn_);
}

} // namespace spindle::core::transport::curl
