#include "curl_transport.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"

namespace http::client {

    CurlTransport::CurlTransport(TransportOptions options) : options_(std::move(options)) {
        if (options_.max_connections_ == 0) {
            throw std::invalid_argument("max_connections must be greater than 0");
        }
        logging::logger()->debug("Opened connection pool with up to {} connections", options_.max_connections_);
    }

    CurlTransport::~CurlTransport() { logging::logger()->debug("Closing connection pool"); }

    http::model::Response CurlTransport::send(const http::model::Request& req) {
        if (cancelled_.load()) {
            throw http::http_error::TransportError(req.url_, "transport cancelled before send", static_cast<int>(CURLE_ABORTED_BY_CALLBACK));
        }

        std::unique_ptr<CurlEasy> easy = acquire(req);
        try {
            http::model::Response resp = easy->perform(req);
            release(std::move(easy));
            return resp;
        } catch (...) {
            release(std::move(easy));
            throw;
        }
    }

    std::unique_ptr<CurlEasy> CurlTransport::acquire(const http::model::Request& req) {
        Deadline deadline;
        if (req.timeout_) {
            deadline = std::chrono::steady_clock::now() + *req.timeout_;
        }

        std::unique_lock<std::mutex> lock(pool_mutex_);
        auto ready = [this] { return cancelled_.load() || !idle_.empty() || open_handles_ < options_.max_connections_; };

        if (deadline) {
            if (!pool_cv_.wait_until(lock, *deadline, ready)) {
                throw http::http_error::TransportError(req.url_, "timed out waiting for a free connection", static_cast<int>(CURLE_OPERATION_TIMEDOUT));
            }
        } else {
            pool_cv_.wait(lock, ready);
        }

        if (cancelled_.load()) {
            throw http::http_error::TransportError(req.url_, "transport cancelled before send", static_cast<int>(CURLE_ABORTED_BY_CALLBACK));
        }

        if (!idle_.empty()) {
            std::unique_ptr<CurlEasy> easy = std::move(idle_.back());
            idle_.pop_back();
            return easy;
        }

        // Reserve the slot before creating the handle outside the lock.
        ++open_handles_;
        lock.unlock();
        try {
            return std::make_unique<CurlEasy>(share_.get(), options_, &cancelled_);
        } catch (...) {
            lock.lock();
            --open_handles_;
            lock.unlock();
            pool_cv_.notify_one();
            throw;
        }
    }

    void CurlTransport::release(std::unique_ptr<CurlEasy> easy) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            idle_.push_back(std::move(easy));
        }
        pool_cv_.notify_one();
    }

    void CurlTransport::cancel() {
        if (!cancelled_.exchange(true)) {
            logging::logger()->debug("Cancelling in-flight transfers");
        }
        // Taking the lock orders the flag before any waiter's predicate check.
        { std::lock_guard<std::mutex> lock(pool_mutex_); }
        pool_cv_.notify_all();
    }

    bool CurlTransport::cancelled() const { return cancelled_.load(); }

    size_t CurlTransport::open_handles() const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return open_handles_;
    }

    TransportFactory make_curl_transport_factory(const TransportOptions& options) {
        return [options]() -> std::unique_ptr<ITransport> { return std::make_unique<CurlTransport>(options); };
    }
}  // namespace http::client
