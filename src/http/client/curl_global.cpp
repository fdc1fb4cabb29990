//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_global.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>

#include "../../utils/logging.hpp"

namespace http::client {

    namespace {
        std::mutex global_mutex;
        size_t global_users = 0;
    }  // namespace

    CurlGlobal::CurlGlobal() {
        std::lock_guard<std::mutex> lock(global_mutex);
        if (global_users == 0) {
            const auto rc = curl_global_init(CURL_GLOBAL_ALL);
            if (rc != CURLE_OK) {
                throw std::runtime_error("Failed to initialize libcurl");
            }
            logging::logger()->debug("libcurl initialized: {}", curl_version());
        }
        ++global_users;
    }

    CurlGlobal::~CurlGlobal() {
        std::lock_guard<std::mutex> lock(global_mutex);
        if (--global_users == 0) {
            curl_global_cleanup();
        }
    }

}  // namespace http::client
