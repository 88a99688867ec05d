// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "schema.hh"

#include <filesystem>
#include <string_view>

namespace gqlc {
    struct Log;

    // Best-effort: never fails. Problems in the SDL are reported to the log as
    // warnings and the offending fragments are left out of the result.
    schema::ParsedSchema parseSchema(std::string_view sdl, Log& log, std::filesystem::path const& filename = "<sdl>");
}
