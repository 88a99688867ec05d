// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "decode.hh"
#include "projection.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gqlc {
    // Relay-style cursor information
    struct PageInfo {
        bool hasNextPage = false;
        std::optional<std::string> endCursor;

        static constexpr auto graphqlFields() {
            return fields(GQLC_FIELD(PageInfo, hasNextPage), GQLC_FIELD(PageInfo, endCursor));
        }
    };

    template <typename T>
    struct Connection {
        std::vector<T> nodes;
        PageInfo pageInfo;

        static constexpr auto graphqlFields() {
            return fields(GQLC_NESTED(Connection, nodes), GQLC_NESTED(Connection, pageInfo));
        }
    };

    // `query { viewer { id name } }'
    template <typename T>
    std::string queryText(std::string_view field) {
        std::string text = "query { ";
        text.append(field);
        text.append(" { ");
        text.append(selection<T>());
        text.append(" } }");
        return text;
    }

    // `query { issues { nodes { id } pageInfo { hasNextPage endCursor } } }'
    template <typename T>
    std::string connectionQueryText(std::string_view field) {
        return queryText<Connection<T>>(field);
    }

    // Decodes `data.<field>' of a GraphQL response. Fails if the response
    // reports errors or lacks the field.
    template <typename T>
    bool extractData(nlohmann::json const& response, std::string_view field, T& out, std::string& out_error) {
        if (auto const errors = response.find("errors"); errors != response.end() && errors->is_array() && !errors->empty()) {
            out_error = "GraphQL error: ";
            bool first = true;
            for (auto const& error : *errors) {
                if (!first)
                    out_error += "; ";
                first = false;

                auto const message = error.find("message");
                if (message != error.end() && message->is_string())
                    out_error += message->get<std::string>();
                else
                    out_error += error.dump();
            }
            return false;
        }

        auto const data = response.find("data");
        if (data == response.end() || !data->is_object()) {
            out_error = "no data in response";
            return false;
        }

        auto const value = data->find(std::string(field));
        if (value == data->end() || value->is_null()) {
            out_error = "no `" + std::string(field) + "' in response data";
            return false;
        }

        std::string error;
        if (!decode(*value, out, error)) {
            out_error = "failed to decode `" + std::string(field) + "': " + std::string(field) + error;
            return false;
        }
        return true;
    }
}
