#include "method_router.hpp"

#include <array>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace http::router {
    using http::model::Method;

    namespace {
        constexpr const char* CONTENT_TYPE_HEADER = "Content-Type";

        // Indexed by Method.
        constexpr std::array<Route, http::model::METHOD_COUNT> ROUTES = {{
            {.method_ = Method::GET, .verb_ = "GET", .carries_body_ = false},
            {.method_ = Method::POST, .verb_ = "POST", .carries_body_ = true},
            {.method_ = Method::PUT, .verb_ = "PUT", .carries_body_ = true},
            {.method_ = Method::PATCH, .verb_ = "PATCH", .carries_body_ = true},
            {.method_ = Method::OPTIONS, .verb_ = "OPTIONS", .carries_body_ = true},
            {.method_ = Method::DELETE, .verb_ = "DELETE", .carries_body_ = true},
        }};

        bool has_header(const http::model::StringMap& headers, const char* name) {
            for (const auto& [key, value] : headers) {
                if (string_utils::ieq(key, name)) {
                    return true;
                }
            }
            return false;
        }
    }  // namespace

    const Route& MethodRouter::lookup(Method m) {
        const auto index = static_cast<size_t>(m);
        if (index >= ROUTES.size() || ROUTES.at(index).method_ != m) {
            logging::logger()->critical("No route for HTTP method {}", static_cast<int>(m));
            throw http::http_error::RoutingDefect("No route for HTTP method " + std::to_string(static_cast<int>(m)));
        }
        return ROUTES.at(index);
    }

    http::model::Request MethodRouter::build_request(const http::model::RequestDescriptor& req, Timeout timeout) {
        const Route& route = lookup(req.method());

        http::model::Request r;
        r.url_ = req.url();
        r.method_ = route.verb_;
        r.timeout_ = timeout;

        if (req.query_params()) {
            r.query_params_ = *req.query_params();
        }
        if (req.headers()) {
            r.headers_ = *req.headers();
        }

        if (route.carries_body_ && req.body()) {
            r.body_ = req.body()->dump();
            if (!has_header(r.headers_, CONTENT_TYPE_HEADER)) {
                r.headers_.emplace(CONTENT_TYPE_HEADER, constants::JSON_MEDIA_TYPE);
            }
        }

        return r;
    }

    http::model::Response MethodRouter::route(const http::model::RequestDescriptor& req, http::client::ITransport& transport, Timeout timeout) {
        const http::model::Request wire = build_request(req, timeout);
        logging::logger()->debug("Sending {} request to {}", wire.method_, wire.url_);

        http::model::Response resp = transport.send(wire);
        logging::logger()->debug("{} returned {}", resp.effective_url_.empty() ? wire.url_ : resp.effective_url_, resp.status_);
        return resp;
    }
}  // namespace http::router
