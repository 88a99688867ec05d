// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace gqlc {
    inline bool loadText(std::filesystem::path const& filename, std::string& out_text) {
        // open file and read contents
        std::ifstream stream(filename, std::ios::binary);
        if (!stream)
            return false;

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        stream.close();
        out_text = buffer.str();
        return true;
    }

    inline bool saveText(std::filesystem::path const& filename, std::string_view text) {
        std::ofstream stream(filename, std::ios::binary);
        if (!stream)
            return false;

        stream << text;
        return static_cast<bool>(stream);
    }
}
