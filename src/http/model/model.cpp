#include "model.hpp"

#include <string>
#include <utility>

#include "../error/http_error.hpp"

namespace http::model {

    struct MethodNames {
        static constexpr const char* GET = "GET";
        static constexpr const char* POST = "POST";
        static constexpr const char* PUT = "PUT";
        static constexpr const char* PATCH = "PATCH";
        static constexpr const char* OPTIONS = "OPTIONS";
        static constexpr const char* DELETE = "DELETE";
    };

    bool is_valid(Method m) {
        const auto index = static_cast<size_t>(m);
        return index < METHOD_COUNT;
    }

    std::string to_display_string(const StructuredMap& value) { return value.dump(-1, ' ', false, StructuredMap::error_handler_t::replace); }

    std::string to_string(Method m) {
        switch (m) {
            case Method::GET:
                return MethodNames::GET;
            case Method::POST:
                return MethodNames::POST;
            case Method::PUT:
                return MethodNames::PUT;
            case Method::PATCH:
                return MethodNames::PATCH;
            case Method::OPTIONS:
                return MethodNames::OPTIONS;
            case Method::DELETE:
                return MethodNames::DELETE;
        }
        return "UNKNOWN(" + std::to_string(static_cast<int>(m)) + ")";
    }

    Method method_from_string(std::string_view verb) {
        for (const Method m : ALL_METHODS) {
            if (verb == to_string(m)) {
                return m;
            }
        }
        throw http::http_error::ConstructionError("Unsupported HTTP method: " + std::string(verb));
    }

    RequestDescriptor::RequestDescriptor(std::string url, Method method, std::optional<StructuredMap> body, std::optional<StringMap> query_params,
                                         std::optional<StringMap> headers)
        : url_(std::move(url)), method_(method), body_(std::move(body)), query_params_(std::move(query_params)), headers_(std::move(headers)) {
        if (url_.empty()) {
            throw http::http_error::ConstructionError("Request url must not be empty");
        }
        if (!is_valid(method_)) {
            throw http::http_error::ConstructionError("Unsupported HTTP method: " + to_string(method_));
        }
    }

    RequestDescriptor RequestDescriptor::from_verb(std::string url, std::string_view verb, std::optional<StructuredMap> body,
                                                   std::optional<StringMap> query_params, std::optional<StringMap> headers) {
        return {std::move(url), method_from_string(verb), std::move(body), std::move(query_params), std::move(headers)};
    }
}  // namespace http::model
