#ifndef CLUMP_CLIENT_INTERFACE_HPP
#define CLUMP_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace http::client {
    // One transport backs every unit of work of a dispatch, so send() must be safe to call concurrently.
    // Throws http_error::TransportError when a transfer cannot be completed.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        virtual ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        virtual ITransport& operator=(ITransport&&) = delete;

        virtual http::model::Response send(const http::model::Request& req) = 0;

        // Aborts in-flight transfers; later sends fail immediately.
        virtual void cancel() = 0;
        [[nodiscard]] virtual bool cancelled() const = 0;
    };

    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;
}  // namespace http::client

#endif
