#ifndef PARCEL_BRIDGE_CURL_GLOBAL_HPP
#define PARCEL_BRIDGE_CURL_GLOBAL_HPP

#include <cstddef>

namespace http::client {

    // Reference-counted curl_global_init / curl_global_cleanup. Must outlive every CurlEasy handle; nesting
    // guards is allowed.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] static size_t live();
    };

}  // namespace http::client

#endif
