//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long ON = 1L;
        static constexpr long OFF = 0L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr const char* POST = "POST";
        static constexpr const char* GET = "GET";
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type";
        static constexpr const char* STATUS_LINE_PREFIX = "HTTP/";
        static constexpr const char* SEPARATOR = ", ";
    };

    CurlEasy::CurlEasy(CURLSH* share, const TransportOptions& options, const std::atomic<bool>* cancel_flag)
        : handle_(curl_easy_init()), share_(share), options_(options), cancel_flag_(cancel_flag) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        try {
            set_defaults();
        } catch (...) {
            curl_easy_cleanup(handle_);
            throw;
        }
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_defaults() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, options_.follow_redirects_ ? CurlDefaults::ON : CurlDefaults::OFF);
        setopt(CURLOPT_MAXREDIRS, options_.max_redirects_);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_.count()));
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::ON);  // safe in multithreaded apps

        if (share_ != nullptr) {
            setopt(CURLOPT_SHARE, share_);
        }

        if (options_.keepalive_) {
            setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::ON);
            setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
            setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
        }

        if (options_.compression_) {
            // Empty string => accept all supported encodings (gzip/deflate/br)
            setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        }

        if (options_.prefer_http2_) {
            setopt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS));
        }

        if (cancel_flag_ != nullptr) {
            setopt(CURLOPT_NOPROGRESS, CurlDefaults::OFF);
            setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::xferinfo_cb);
            setopt(CURLOPT_XFERINFODATA, static_cast<void*>(this));
        } else {
            setopt(CURLOPT_NOPROGRESS, CurlDefaults::ON);
        }
    }

    std::string CurlEasy::build_url(const std::string& url, const http::model::StringMap& params) const {
        if (params.empty()) {
            return url;
        }

        std::string out = url;
        char separator = url.find('?') == std::string::npos ? '?' : '&';
        if (!out.empty() && (out.back() == '?' || out.back() == '&')) {
            separator = '\0';
        }

        for (const auto& [key, value] : params) {
            char* k = curl_easy_escape(handle_, key.c_str(), static_cast<int>(key.size()));
            char* v = curl_easy_escape(handle_, value.c_str(), static_cast<int>(value.size()));
            if (k == nullptr || v == nullptr) {
                curl_free(k);
                curl_free(v);
                throw std::runtime_error("curl_easy_escape failed for query parameter " + key);
            }

            if (separator != '\0') {
                out += separator;
            }
            out += k;
            out += '=';
            out += v;
            separator = '&';

            curl_free(k);
            curl_free(v);
        }

        return out;
    }

    void CurlEasy::set_headers(const http::model::StringMap& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            // "Name;" is curl's way of sending a header with an empty value
            const std::string line = value.empty() ? name + ";" : name + ": " + value;
            curl_slist* appended = curl_slist_append(headers_, line.c_str());
            if (appended == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = appended;
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::set_method(const http::model::Request& req) {
        if (req.method_ == CurlDefaults::GET) {
            setopt(CURLOPT_HTTPGET, CurlDefaults::ON);
            return;
        }

        if (req.method_ == CurlDefaults::POST) {
            setopt(CURLOPT_POST, CurlDefaults::ON);
        } else {
            setopt(CURLOPT_CUSTOMREQUEST, req.method_.c_str());
        }

        if (req.body_) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_->size()));
            setopt(CURLOPT_POSTFIELDS, req.body_->c_str());
        } else if (req.method_ == CurlDefaults::POST) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
            setopt(CURLOPT_POSTFIELDS, "");
        }
    }

    void CurlEasy::set_timeout(const http::model::Request& req) {
        auto timeout = options_.timeout_;
        if (req.timeout_) {
            timeout = std::min(timeout, *req.timeout_);
        }
        // curl treats 0 as "no timeout"
        setopt(CURLOPT_TIMEOUT_MS, std::max(1L, static_cast<long>(timeout.count())));
    }

    void CurlEasy::collect_header_line(http::model::StringMap& headers, std::string_view line) {
        if (string_utils::ieq_prefix(line.data(), line.size(), HeaderKeys::STATUS_LINE_PREFIX)) {
            headers.clear();
            return;
        }

        auto parsed = string_utils::split_header_line(line);
        if (!parsed) {
            return;
        }

        auto& [name, value] = *parsed;
        for (auto& [existing_name, existing_value] : headers) {
            if (string_utils::ieq(existing_name, name)) {
                existing_value += HeaderKeys::SEPARATOR;
                existing_value += value;
                return;
            }
        }
        headers.emplace(std::move(name), std::move(value));
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        collect_header_line(self->last_response_headers_, std::string_view(buffer, bytes));

        return bytes;
    }

    int CurlEasy::xferinfo_cb(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        const auto* self = static_cast<const CurlEasy*>(userdata);
        // non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
        return self->cancel_flag_->load() ? 1 : 0;
    }

    http::model::Response CurlEasy::perform(const http::model::Request& req) {
        // Drops the previous transfer's options; open connections and caches stay with the handle.
        curl_easy_reset(handle_);
        error_buf_[0] = '\0';
        set_defaults();

        const std::string url = build_url(req.url_, req.query_params_);

        setopt(CURLOPT_URL, url.c_str());
        set_headers(req.headers_);
        set_method(req);
        set_timeout(req);

        std::string body;
        last_response_headers_.clear();
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));

        perform_throw(url);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            err += "transfer cancelled";
        } else if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::TransportError(url, err, static_cast<int>(rc));
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};

        for (const auto& [name, value] : last_response_headers_) {
            if (string_utils::ieq(name, HeaderKeys::CONTENT_TYPE)) {
                r.content_type_ = value;
                break;
            }
        }
        r.headers_ = std::move(last_response_headers_);
        last_response_headers_.clear();
        return r;
    }

}  // namespace http::client
