#include "outcome.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"

namespace http::model {

    FailureRecord FailureRecord::from_current_exception(ErrorKind kind) {
        FailureRecord record{.kind_ = kind, .message_ = "unknown error", .exception_ = std::current_exception()};

        try {
            if (record.exception_) {
                std::rethrow_exception(record.exception_);
            }
        } catch (const std::exception& e) {
            record.message_ = e.what();
        } catch (...) {
            record.message_ = "non-standard exception";
        }

        return record;
    }

    void FailureRecord::rethrow() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        throw std::runtime_error(message_);
    }

    std::string to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::DECODE:
                return "decode";
            case ErrorKind::TRANSPORT:
                return "transport";
            case ErrorKind::INTERNAL:
                return "internal";
        }
        return "unknown";
    }

    Outcome::Outcome(const RequestDescriptor& request, OutcomeState state, long status) : request_(&request), state_(state), status_code_(status) {}

    Outcome Outcome::success(const RequestDescriptor& request, long status, std::optional<StructuredMap> body, StringMap headers) {
        Outcome o(request, OutcomeState::SUCCESS, status);
        o.body_ = std::move(body);
        o.headers_ = std::move(headers);
        return o;
    }

    Outcome Outcome::decode_fallback(const RequestDescriptor& request, long status, StructuredMap text_body, StringMap headers, FailureRecord error) {
        Outcome o(request, OutcomeState::DECODE_FALLBACK, status);
        o.body_ = std::move(text_body);
        o.headers_ = std::move(headers);
        error.kind_ = ErrorKind::DECODE;
        o.error_ = std::move(error);
        return o;
    }

    Outcome Outcome::hard_failure(const RequestDescriptor& request, long failure_status, FailureRecord error) {
        Outcome o(request, OutcomeState::HARD_FAILURE, failure_status);
        if (error.kind_ == ErrorKind::DECODE) {
            error.kind_ = ErrorKind::INTERNAL;
        }
        o.error_ = std::move(error);
        return o;
    }

    std::optional<std::string> Outcome::header(const std::string& name) const {
        if (!headers_) {
            return std::nullopt;
        }

        for (const auto& [key, value] : *headers_) {
            if (string_utils::ieq(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }
}  // namespace http::model
