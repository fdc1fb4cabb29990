//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef CLUMP_MODEL_HPP
#define CLUMP_MODEL_HPP

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace http::model {
    using StructuredMap = nlohmann::json;
    using StringMap = std::map<std::string, std::string>;

    enum class Method { GET, POST, PUT, PATCH, OPTIONS, DELETE };

    inline constexpr size_t METHOD_COUNT = 6;
    inline constexpr std::array<Method, METHOD_COUNT> ALL_METHODS = {Method::GET,   Method::POST,    Method::PUT,
                                                                     Method::PATCH, Method::OPTIONS, Method::DELETE};

    [[nodiscard]] bool is_valid(Method m);
    [[nodiscard]] std::string to_string(Method m);
    // Exact, upper-case match. Throws ConstructionError on anything else.
    [[nodiscard]] Method method_from_string(std::string_view verb);

    // Serialized form for display. Invalid UTF-8 in strings (a text fallback of a binary page) is replaced, not thrown.
    [[nodiscard]] std::string to_display_string(const StructuredMap& value);

    // Immutable description of one HTTP call. Validated on construction, never mutated by a dispatch.
    class RequestDescriptor {
       public:
        RequestDescriptor(std::string url, Method method, std::optional<StructuredMap> body = std::nullopt,
                          std::optional<StringMap> query_params = std::nullopt, std::optional<StringMap> headers = std::nullopt);

        static RequestDescriptor from_verb(std::string url, std::string_view verb, std::optional<StructuredMap> body = std::nullopt,
                                           std::optional<StringMap> query_params = std::nullopt, std::optional<StringMap> headers = std::nullopt);

        [[nodiscard]] const std::string& url() const { return url_; }
        [[nodiscard]] Method method() const { return method_; }
        [[nodiscard]] const std::optional<StructuredMap>& body() const { return body_; }
        [[nodiscard]] const std::optional<StringMap>& query_params() const { return query_params_; }
        [[nodiscard]] const std::optional<StringMap>& headers() const { return headers_; }

        bool operator==(const RequestDescriptor& other) const = default;

       private:
        std::string url_;
        Method method_;
        std::optional<StructuredMap> body_;
        std::optional<StringMap> query_params_;
        std::optional<StringMap> headers_;
    };

    // What the transport puts on the wire.
    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::optional<std::string> body_;

        StringMap query_params_;
        StringMap headers_;
        std::optional<std::chrono::milliseconds> timeout_;
    };

    // Fully buffered transport response.
    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;
        std::string content_type_;

        StringMap headers_;
    };
}  // namespace http::model

#endif
