#ifndef CLUMP_CURL_SHARE_HPP
#define CLUMP_CURL_SHARE_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>

namespace http::client {

    // DNS and TLS session caches shared by every handle of a transport, with one mutex per shared data kind.
    class CurlShare {
       public:
        CurlShare();

        ~CurlShare();
        CurlShare(const CurlShare&) = delete;
        CurlShare& operator=(const CurlShare&) = delete;
        CurlShare(CurlShare&&) = delete;
        CurlShare& operator=(CurlShare&&) = delete;

        [[nodiscard]] CURLSH* get() const { return handle_; }

       private:
        template <typename T>
        void setopt(int option, T value);

        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
        CURLSH* handle_{};
    };

}  // namespace http::client

#endif
