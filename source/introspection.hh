// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "transport.hh"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gqlc {
    extern std::string_view const introspectionQuery;

    struct SchemaFetchError {
        enum class Kind {
            Transport,
            HttpStatus,
            Json,
            MissingSchema,
        };

        Kind kind = Kind::Transport;
        int status = 0; // HttpStatus only
        std::string message;

        friend std::ostream& operator<<(std::ostream& os, SchemaFetchError const& error);
    };

    struct FetchOptions {
        std::string url = "https://api.linear.app/graphql";
        std::vector<std::pair<std::string, std::string>> headers;
    };

    // Canonical SDL for the `__schema' object of an introspection result.
    // Total: missing or malformed pieces render as placeholders.
    std::string introspectionToSdl(nlohmann::json const& schema);

    // Renders `data.__schema' of a full introspection response.
    bool renderSchema(nlohmann::json const& response, std::string& out_sdl, SchemaFetchError& out_error);

    // Checks the status of an introspection response, parses its body and renders it.
    bool handleResponse(HttpResponse const& response, std::string& out_sdl, SchemaFetchError& out_error);

    // Runs the introspection query against options.url and renders the result.
    bool fetchSchema(FetchOptions const& options, std::string& out_sdl, SchemaFetchError& out_error);
}
