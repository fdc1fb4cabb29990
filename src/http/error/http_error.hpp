//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef CLUMP_HTTP_ERROR_HPP
#define CLUMP_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    // Invalid request descriptor. Raised at build time, never reaches a dispatch.
    struct ConstructionError : public std::invalid_argument {
        explicit ConstructionError(const std::string &msg);
    };

    // Body could not be decoded as JSON. Recorded on the outcome, never thrown out of a dispatch.
    struct DecodeError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit DecodeError(long s, std::string u, std::string preview, const std::string &msg);
    };

    // Connection, timeout, protocol or cancellation failure of a single transfer.
    struct TransportError : public std::runtime_error {
        std::string url_;
        int curl_code_;
        explicit TransportError(std::string u, const std::string &msg, int curl_code = 0);
    };

    // A verb that passed construction has no route. Internal consistency error, always surfaced.
    struct RoutingDefect : public std::logic_error {
        explicit RoutingDefect(const std::string &msg);
    };

    [[nodiscard]] std::string body_preview(const std::string &body);
}  // namespace http::http_error

#endif
