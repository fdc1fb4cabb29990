#ifndef CLUMP_OUTCOME_HPP
#define CLUMP_OUTCOME_HPP

#include <exception>
#include <optional>
#include <string>

#include "model.hpp"

namespace http::model {
    enum class ErrorKind { DECODE, TRANSPORT, INTERNAL };

    enum class OutcomeState { SUCCESS, DECODE_FALLBACK, HARD_FAILURE };

    struct FailureRecord {
        ErrorKind kind_ = ErrorKind::INTERNAL;
        std::string message_;
        std::exception_ptr exception_;

        // Must be called from inside a catch block.
        static FailureRecord from_current_exception(ErrorKind kind);

        [[noreturn]] void rethrow() const;
    };

    [[nodiscard]] std::string to_string(ErrorKind kind);

    // Result of executing one RequestDescriptor. Only constructible through the three factories, which keep
    // state, status, body, headers and error consistent with each other.
    class Outcome {
       public:
        static Outcome success(const RequestDescriptor& request, long status, std::optional<StructuredMap> body, StringMap headers);
        static Outcome decode_fallback(const RequestDescriptor& request, long status, StructuredMap text_body, StringMap headers, FailureRecord error);
        static Outcome hard_failure(const RequestDescriptor& request, long failure_status, FailureRecord error);

        // The descriptor is not owned and must outlive the outcome.
        [[nodiscard]] const RequestDescriptor& request() const { return *request_; }
        [[nodiscard]] long status_code() const { return status_code_; }
        [[nodiscard]] const std::optional<StructuredMap>& body() const { return body_; }
        [[nodiscard]] const std::optional<StringMap>& headers() const { return headers_; }
        [[nodiscard]] const std::optional<FailureRecord>& error() const { return error_; }
        [[nodiscard]] OutcomeState state() const { return state_; }

        [[nodiscard]] bool is_success() const { return state_ == OutcomeState::SUCCESS; }
        [[nodiscard]] bool is_hard_failure() const { return state_ == OutcomeState::HARD_FAILURE; }

        // Case-insensitive header lookup.
        [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

       private:
        Outcome(const RequestDescriptor& request, OutcomeState state, long status);

        const RequestDescriptor* request_;
        OutcomeState state_;
        long status_code_;
        std::optional<StructuredMap> body_;
        std::optional<StringMap> headers_;
        std::optional<FailureRecord> error_;
    };
}  // namespace http::model

#endif
