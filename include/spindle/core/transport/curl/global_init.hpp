#pragma once

#include <string>

#include <curl/curl.h>

#include "spindle/core/error.hpp"

namespace spindle::core::transport::curl {

// RAII libcurl global state. libcurl reference-counts init/cleanup pairs,
// so any number of instances may coexist.
class GlobalInit {
public:
    GlobalInit() {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw ConfigError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    }

    ~GlobalInit() {
        curl_global_cleanup();
    }

    GlobalInit(const GlobalInit&) = delete;
    GlobalInit& operator=(const GlobalInit&) = delete;
};

} // namespace spindle::core::transport::curl
