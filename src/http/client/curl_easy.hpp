//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef CLUMP_CURL_EASY_HPP
#define CLUMP_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <atomic>
#include <chrono>
#include <string>

#include "../model/model.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    const long DEFAULT_CONNECT_TIMEOUT_MS = 10'000L;
    const long DEFAULT_TIMEOUT_MS = 30'000L;
    const long DEFAULT_MAX_REDIRECTS = 10L;
    const size_t DEFAULT_MAX_CONNECTIONS = 100;

    struct TransportOptions {
        std::chrono::milliseconds connect_timeout_{DEFAULT_CONNECT_TIMEOUT_MS};
        std::chrono::milliseconds timeout_{DEFAULT_TIMEOUT_MS};
        bool follow_redirects_ = true;
        long max_redirects_ = DEFAULT_MAX_REDIRECTS;
        bool keepalive_ = true;
        bool compression_ = true;
        bool prefer_http2_ = true;
        std::string user_agent_ = "clump/1.0";
        size_t max_connections_ = DEFAULT_MAX_CONNECTIONS;  // concurrent transfers per transport
    };

    // Reusable transfer handle. Keeps its own connection cache between perform() calls; DNS and TLS
    // sessions come from the share handle.
    class CurlEasy {
       public:
        CurlEasy(CURLSH* share, const TransportOptions& options, const std::atomic<bool>* cancel_flag = nullptr);

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response perform(const http::model::Request& req);

        // Appends url-escaped query parameters, keeping any query string already present.
        [[nodiscard]] std::string build_url(const std::string& url, const http::model::StringMap& params) const;

        // Adds one raw header line to the map; a status line starts a new header block (redirects, 100-continue).
        static void collect_header_line(http::model::StringMap& headers, std::string_view line);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_defaults();
        void set_headers(const http::model::StringMap& hs);
        void set_method(const http::model::Request& req);
        void set_timeout(const http::model::Request& req);
        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int xferinfo_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

        http::model::StringMap last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
        CURLSH* share_{};
        TransportOptions options_;
        const std::atomic<bool>* cancel_flag_;
    };
}  // namespace http::client

#endif
