#ifndef CLUMP_METHOD_ROUTER_HPP
#define CLUMP_METHOD_ROUTER_HPP

#include <array>
#include <chrono>
#include <optional>

#include "../client/interface.hpp"
#include "../model/model.hpp"

namespace http::router {

    using Timeout = std::optional<std::chrono::milliseconds>;

    struct Route {
        http::model::Method method_;
        const char* verb_;
        bool carries_body_;
    };

    class MethodRouter {
       public:
        // Throws http_error::RoutingDefect for a method outside the table.
        [[nodiscard]] static const Route& lookup(http::model::Method m);

        [[nodiscard]] static http::model::Request build_request(const http::model::RequestDescriptor& req, Timeout timeout = std::nullopt);

        static http::model::Response route(const http::model::RequestDescriptor& req, http::client::ITransport& transport, Timeout timeout = std::nullopt);
    };
}  // namespace http::router

#endif
