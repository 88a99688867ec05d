// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "schema.hh"

#include <nlohmann/json.hpp>

namespace gqlc {
    nlohmann::ordered_json serializeToJson(schema::ParsedSchema const& schema);
}
