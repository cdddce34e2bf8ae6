#ifndef PARCEL_BRIDGE_CLIENT_INTERFACE_HPP
#define PARCEL_BRIDGE_CLIENT_INTERFACE_HPP

#include <chrono>

#include "../model/model.hpp"

namespace http::client {
    // A single physical HTTP attempt. Implementations report transport problems in the result instead of throwing.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        virtual ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        virtual ITransport& operator=(ITransport&&) = delete;

        virtual http::model::AttemptResult perform(const http::model::Request& req, std::chrono::milliseconds timeout) = 0;
    };
}  // namespace http::client

#endif
