#include "curl_share.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace http::client {

    CurlShare::CurlShare() : handle_(curl_share_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL share handle");
        }

        try {
            setopt(CURLSHOPT_USERDATA, static_cast<void*>(this));
            setopt(CURLSHOPT_LOCKFUNC, &CurlShare::lock_cb);
            setopt(CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock_cb);
            setopt(CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
            setopt(CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        } catch (...) {
            curl_share_cleanup(handle_);
            throw;
        }
    }

    CurlShare::~CurlShare() {
        if (handle_ != nullptr) {
            curl_share_cleanup(handle_);
        }
    }

    void CurlShare::lock_cb(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).lock();
    }

    void CurlShare::unlock_cb(CURL* /*handle*/, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).unlock();
    }

    template <typename T>
    void CurlShare::setopt(int option, T value) {
        const auto rc = curl_share_setopt(handle_, static_cast<CURLSHoption>(option), value);

        if (rc != CURLSHE_OK) {
            throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(rc));
        }
    }

}  // namespace http::client
