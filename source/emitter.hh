// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "schema.hh"

#include <string>

namespace gqlc {
    struct EmitOptions {
        std::string namespaceName = "schema";
        std::string sourceName; // mentioned in the banner when not empty
    };

    // One self-contained C++ header with a struct per schema object, an enum
    // class per schema enum and the root operation names.
    std::string emitHeader(schema::ParsedSchema const& schema, EmitOptions const& options);
}
