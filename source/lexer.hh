// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "location.hh"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace gqlc {
    struct Log;

    enum class TokenType {
        Unknown,
        Name,
        String,
        BlockString,
        IntValue,
        FloatValue,
        Bang,
        Dollar,
        Ampersand,
        LeftParen,
        RightParen,
        Spread,
        Colon,
        Equal,
        At,
        LeftBracket,
        RightBracket,
        LeftBrace,
        RightBrace,
        Pipe,
        EndOfFile
    };
    std::ostream& operator<<(std::ostream& os, TokenType type);

    struct Token {
        TokenType type = TokenType::Unknown;
        Position pos;
        std::string dataString;

        constexpr operator bool() const noexcept { return type != TokenType::Unknown; }
        friend std::ostream& operator<<(std::ostream& os, Token const& tok);
    };

    // Always terminates the token list with EndOfFile; returns false if any
    // lexical problem was reported (as a warning) along the way.
    bool tokenize(std::string_view source, std::filesystem::path const& filename, std::vector<Token>& tokens, Log& log);

    std::string blockStringValue(std::string_view raw);
}
