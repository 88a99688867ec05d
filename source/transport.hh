// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gqlc {
    struct HttpRequest {
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::string contentType = "application/json";
    };

    struct HttpResponse {
        int status = 0;
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    // One synchronous POST over http:// or https://. Throws std::exception
    // (boost::system::system_error, std::invalid_argument) on connection or
    // protocol failure; any HTTP status is returned as-is.
    HttpResponse httpPost(HttpRequest const& request);
}
