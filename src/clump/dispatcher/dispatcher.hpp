#ifndef CLUMP_DISPATCHER_HPP
#define CLUMP_DISPATCHER_HPP

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "../../http/client/interface.hpp"
#include "../../http/decoder/body_decoder.hpp"
#include "../../http/model/model.hpp"
#include "../../http/model/outcome.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/executor.hpp"

namespace clump {
    enum class AggregateMode { ALIGNED, SEGREGATED };

    struct DispatcherOptions {
        long failure_status_ = constants::DEFAULT_FAILURE_STATUS;
        AggregateMode aggregate_mode_ = AggregateMode::ALIGNED;
        std::optional<std::chrono::milliseconds> deadline_;  // whole-batch time limit, unset => unbounded
    };

    struct TaskException {
        size_t index_;
        const http::model::RequestDescriptor* request_;
        http::model::FailureRecord error_;
    };

    // ALIGNED: outcomes_[i] belongs to requests[i], hard failures inline, exceptions_ empty.
    // SEGREGATED: hard failures moved to exceptions_, remaining outcomes keep their relative order.
    struct AggregateResult {
        AggregateMode mode_ = AggregateMode::ALIGNED;
        std::vector<http::model::Outcome> outcomes_;
        std::vector<TaskException> exceptions_;

        [[nodiscard]] size_t size() const { return outcomes_.size() + exceptions_.size(); }
        [[nodiscard]] size_t failure_count() const;
    };

    class Dispatcher {
       public:
        void set_transport_factory(http::client::TransportFactory transport_factory);
        void set_executor_factory(concurrency::ExecutorFactory executor_factory);
        void set_options(const DispatcherOptions& options);

        [[nodiscard]] const http::client::TransportFactory& get_transport_factory() const;
        [[nodiscard]] const concurrency::ExecutorFactory& get_executor_factory() const;
        [[nodiscard]] const DispatcherOptions& get_options() const;

        // Runs every request concurrently over one transport opened for this call and closed before it returns.
        // collect_errors == false: the first failure recorded is rethrown once in-flight work is cancelled and
        // drained; which concurrent failure wins is not deterministic. A RoutingDefect is rethrown in both modes.
        [[nodiscard]] AggregateResult dispatch(const std::vector<http::model::RequestDescriptor>& requests, bool collect_errors = false) const;

       private:
        using Deadline = std::optional<std::chrono::steady_clock::time_point>;

        [[nodiscard]] http::model::Outcome execute_one(const http::model::RequestDescriptor& req, http::client::ITransport& transport,
                                                       const Deadline& deadline) const;
        [[nodiscard]] AggregateResult aggregate(const std::vector<http::model::RequestDescriptor>& requests,
                                                std::vector<std::optional<http::model::Outcome>>& slots) const;

        DispatcherOptions options_;
        http::decoder::BodyDecoder decoder_;
        http::client::TransportFactory transport_factory_;
        concurrency::ExecutorFactory executor_factory_;
    };

    class DispatcherBuilder {
       public:
        DispatcherBuilder();

        DispatcherBuilder& with_transport_factory(http::client::TransportFactory transport_factory);
        DispatcherBuilder& with_executor_factory(concurrency::ExecutorFactory executor_factory);
        DispatcherBuilder& with_options(const DispatcherOptions& options);
        DispatcherBuilder& with_failure_status(long failure_status);
        DispatcherBuilder& with_aggregate_mode(AggregateMode mode);
        DispatcherBuilder& with_deadline(std::chrono::milliseconds deadline);
        DispatcherBuilder& validate();
        std::unique_ptr<Dispatcher> build();

       private:
        std::unique_ptr<Dispatcher> dispatcher_;
        DispatcherOptions options_;
    };

}  // namespace clump

#endif
