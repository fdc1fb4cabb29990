#ifndef CLUMP_CURL_TRANSPORT_HPP
#define CLUMP_CURL_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "../model/model.hpp"
#include "curl_easy.hpp"
#include "curl_global.hpp"
#include "curl_share.hpp"
#include "interface.hpp"

namespace http::client {

    // Thread-safe libcurl transport. Holds at most options.max_connections_ easy handles; a send() borrows an
    // idle one (reusing its open connection) or waits until another transfer returns one. Handles, and the
    // connections they keep alive, live exactly as long as the transport.
    class CurlTransport : public ITransport {
       public:
        explicit CurlTransport(TransportOptions options = {});

        ~CurlTransport() override;
        CurlTransport(const CurlTransport&) = delete;
        CurlTransport& operator=(const CurlTransport&) = delete;
        CurlTransport(CurlTransport&&) = delete;
        CurlTransport& operator=(CurlTransport&&) = delete;

        http::model::Response send(const http::model::Request& req) override;
        void cancel() override;
        [[nodiscard]] bool cancelled() const override;

        [[nodiscard]] const TransportOptions& options() const { return options_; }
        [[nodiscard]] size_t open_handles() const;

       private:
        using Deadline = std::optional<std::chrono::steady_clock::time_point>;

        std::unique_ptr<CurlEasy> acquire(const http::model::Request& req);
        void release(std::unique_ptr<CurlEasy> easy);

        CurlGlobal curl_global_;
        TransportOptions options_;
        CurlShare share_;
        std::atomic<bool> cancelled_ = false;

        mutable std::mutex pool_mutex_;
        std::condition_variable pool_cv_;
        std::vector<std::unique_ptr<CurlEasy>> idle_;
        size_t open_handles_ = 0;
    };

    [[nodiscard]] TransportFactory make_curl_transport_factory(const TransportOptions& options = {});
}  // namespace http::client

#endif
