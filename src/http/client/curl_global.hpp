//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef CLUMP_CURL_GLOBAL_HPP
#define CLUMP_CURL_GLOBAL_HPP

namespace http::client {

    // Reference counted: libcurl is initialised by the first live instance and cleaned up by the last one.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
