//
// Created by Daniel Griffiths on 11/1/25.
//

#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    ConstructionError::ConstructionError(const std::string &msg) : std::invalid_argument(msg) {}

    DecodeError::DecodeError(long s, std::string u,
                             std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                             const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    TransportError::TransportError(std::string u, const std::string &msg, int curl_code)
        : std::runtime_error(msg), url_(std::move(u)), curl_code_(curl_code) {}

    RoutingDefect::RoutingDefect(const std::string &msg) : std::logic_error(msg) {}

    std::string body_preview(const std::string &body) { return body.substr(0, ERROR_MESSAGE_LENGTH); }
};  // namespace http::http_error
