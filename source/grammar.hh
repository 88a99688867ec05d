// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

namespace gqlc {
    struct Log;
    namespace ast {
        struct Document;
    }

    // Never fails: malformed members and definitions are reported to the log
    // as warnings and skipped.
    std::unique_ptr<ast::Document> parse(std::string_view source, std::filesystem::path const& filename, Log& log);
}
