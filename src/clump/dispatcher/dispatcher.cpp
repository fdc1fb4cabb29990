#include "dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "../../http/error/http_error.hpp"
#include "../../http/router/method_router.hpp"
#include "../../utils/logging.hpp"

namespace clump {
    using http::model::ErrorKind;
    using http::model::FailureRecord;
    using http::model::Outcome;
    using http::model::RequestDescriptor;

    namespace {
        // Shared by the units of work of one dispatch call.
        struct BatchState {
            std::mutex mutex_;
            std::condition_variable done_cv_;
            size_t remaining_ = 0;
            bool abort_ = false;
            std::exception_ptr first_error_;
            std::exception_ptr defect_;
            std::atomic<bool> stop_ = false;

            void finish_one() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    --remaining_;
                }
                done_cv_.notify_all();
            }

            void abort_with(std::exception_ptr error, bool is_defect) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (is_defect && !defect_) {
                        defect_ = std::move(error);
                    } else if (!is_defect && !first_error_) {
                        first_error_ = std::move(error);
                    }
                    abort_ = true;
                }
                stop_.store(true);
                done_cv_.notify_all();
            }
        };

        ErrorKind classify_current_exception() {
            try {
                throw;
            } catch (const http::http_error::TransportError&) {
                return ErrorKind::TRANSPORT;
            } catch (...) {
                return ErrorKind::INTERNAL;
            }
        }
    }  // namespace

    size_t AggregateResult::failure_count() const {
        if (mode_ == AggregateMode::SEGREGATED) {
            return exceptions_.size();
        }
        return static_cast<size_t>(std::count_if(outcomes_.begin(), outcomes_.end(), [](const Outcome& o) { return o.is_hard_failure(); }));
    }

    //
    // DispatcherBuilder implementation
    //

    DispatcherBuilder::DispatcherBuilder() : dispatcher_(std::make_unique<Dispatcher>()) {}

    DispatcherBuilder& DispatcherBuilder::with_transport_factory(http::client::TransportFactory transport_factory) {
        dispatcher_->set_transport_factory(std::move(transport_factory));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_executor_factory(concurrency::ExecutorFactory executor_factory) {
        dispatcher_->set_executor_factory(std::move(executor_factory));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_options(const DispatcherOptions& options) {
        options_ = options;
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_failure_status(long failure_status) {
        options_.failure_status_ = failure_status;
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_aggregate_mode(AggregateMode mode) {
        options_.aggregate_mode_ = mode;
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_deadline(std::chrono::milliseconds deadline) {
        options_.deadline_ = deadline;
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::validate() {
        if (dispatcher_->get_transport_factory() == nullptr) {
            throw std::runtime_error("Transport factory is required");
        }
        if (options_.failure_status_ != constants::DEFAULT_FAILURE_STATUS &&
            (options_.failure_status_ < constants::MIN_HTTP_STATUS || options_.failure_status_ > constants::MAX_HTTP_STATUS)) {
            throw std::runtime_error("Failure status must be 0 or a valid HTTP status code");
        }
        if (options_.deadline_ && options_.deadline_->count() <= 0) {
            throw std::runtime_error("Deadline must be positive");
        }
        return *this;
    }

    std::unique_ptr<Dispatcher> DispatcherBuilder::build() {
        if (dispatcher_->get_executor_factory() == nullptr) {
            dispatcher_->set_executor_factory(concurrency::default_executor_factory());
        }
        dispatcher_->set_options(options_);
        return std::move(dispatcher_);
    };

    //
    // Dispatcher implementation
    //

    void Dispatcher::set_transport_factory(http::client::TransportFactory transport_factory) { transport_factory_ = std::move(transport_factory); }

    void Dispatcher::set_executor_factory(concurrency::ExecutorFactory executor_factory) { executor_factory_ = std::move(executor_factory); }

    void Dispatcher::set_options(const DispatcherOptions& options) { options_ = options; }

    const http::client::TransportFactory& Dispatcher::get_transport_factory() const { return transport_factory_; }

    const concurrency::ExecutorFactory& Dispatcher::get_executor_factory() const { return executor_factory_; }

    const DispatcherOptions& Dispatcher::get_options() const { return options_; }

    AggregateResult Dispatcher::dispatch(const std::vector<RequestDescriptor>& requests, bool collect_errors) const {
        logging::logger()->info("Sending {} requests with collect_errors={}", requests.size(), collect_errors);

        if (requests.empty()) {
            return AggregateResult{.mode_ = options_.aggregate_mode_};
        }
        if (transport_factory_ == nullptr || executor_factory_ == nullptr) {
            throw std::logic_error("Dispatcher used without a transport or executor factory");
        }

        Deadline deadline;
        if (options_.deadline_) {
            deadline = std::chrono::steady_clock::now() + *options_.deadline_;
        }

        std::vector<std::optional<Outcome>> slots(requests.size());
        BatchState state;
        state.remaining_ = requests.size();

        // Declared before the executor so every worker is joined before the pool closes.
        std::unique_ptr<http::client::ITransport> transport = transport_factory_();
        std::unique_ptr<concurrency::IExecutor> executor = executor_factory_(requests.size());

        auto unit_of_work = [&, collect_errors](size_t i) {
            const RequestDescriptor& req = requests[i];

            if (state.stop_.load()) {
                state.finish_one();
                return;
            }

            auto contain_failure = [&]() {
                const ErrorKind kind = classify_current_exception();
                FailureRecord record = FailureRecord::from_current_exception(kind);
                logging::logger()->error("Error sending {} request to {}: {}", http::model::to_string(req.method()), req.url(), record.message_);

                if (collect_errors) {
                    slots[i] = Outcome::hard_failure(req, options_.failure_status_, std::move(record));
                } else {
                    state.abort_with(record.exception_, false);
                }
            };

            try {
                slots[i] = execute_one(req, *transport, deadline);
            } catch (const http::http_error::RoutingDefect&) {
                state.abort_with(std::current_exception(), true);
            } catch (...) {
                contain_failure();
            }

            state.finish_one();
        };

        logging::logger()->debug("Beginning execution of {} units of work", requests.size());
        try {
            for (size_t i = 0; i < requests.size(); ++i) {
                executor->enqueue([&unit_of_work, i]() { unit_of_work(i); });
            }
        } catch (...) {
            state.stop_.store(true);
            transport->cancel();
            executor->wait_all();
            throw;
        }

        bool aborted = false;
        {
            std::unique_lock<std::mutex> lock(state.mutex_);
            state.done_cv_.wait(lock, [&state]() { return state.remaining_ == 0 || state.abort_; });
            aborted = state.abort_;
        }

        if (aborted) {
            logging::logger()->error("Aborting batch, cancelling outstanding requests");
            transport->cancel();
        }
        executor->wait_all();
        logging::logger()->debug("Finished execution of units of work");

        if (state.defect_) {
            std::rethrow_exception(state.defect_);
        }
        if (state.first_error_) {
            std::rethrow_exception(state.first_error_);
        }

        AggregateResult result = aggregate(requests, slots);
        logging::logger()->info("Returning {} responses", result.size());
        return result;
    }

    Outcome Dispatcher::execute_one(const RequestDescriptor& req, http::client::ITransport& transport, const Deadline& deadline) const {
        http::router::Timeout timeout;
        if (deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw http::http_error::TransportError(req.url(), "batch deadline exceeded");
            }
            timeout = remaining;
        }

        http::model::Response resp = http::router::MethodRouter::route(req, transport, timeout);
        http::decoder::DecodeResult decoded = decoder_.decode(resp);

        if (decoded.error_) {
            return Outcome::decode_fallback(req, resp.status_, std::move(*decoded.body_),
                                            std::move(resp.headers_), std::move(*decoded.error_));
        }
        return Outcome::success(req, resp.status_, std::move(decoded.body_), std::move(resp.headers_));
    }

    AggregateResult Dispatcher::aggregate(const std::vector<RequestDescriptor>& requests, std::vector<std::optional<Outcome>>& slots) const {
        AggregateResult result{.mode_ = options_.aggregate_mode_};
        result.outcomes_.reserve(slots.size());

        for (size_t i = 0; i < slots.size(); ++i) {
            if (!slots[i]) {
                throw std::logic_error("No outcome recorded for request " + std::to_string(i));
            }

            if (options_.aggregate_mode_ == AggregateMode::SEGREGATED && slots[i]->is_hard_failure()) {
                result.exceptions_.push_back(TaskException{.index_ = i, .request_ = &requests[i], .error_ = *slots[i]->error()});
                continue;
            }

            result.outcomes_.push_back(std::move(*slots[i]));
        }

        return result;
    }
}  // namespace clump
