// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gqlc {
    // Fixed-capacity name usable as a compile-time value.
    template <std::size_t N>
    struct FixedName {
        char data[N]{};
        std::size_t length = 0;

        constexpr FixedName() = default;
        constexpr FixedName(char const (&text)[N]) {
            for (std::size_t i = 0; i + 1 < N && text[i] != '\0'; ++i)
                data[length++] = text[i];
        }

        constexpr std::string_view view() const noexcept { return { data, length }; }
    };

    namespace _detail {
        constexpr bool isUpper(char ch) noexcept { return ch >= 'A' && ch <= 'Z'; }
        constexpr bool isLower(char ch) noexcept { return ch >= 'a' && ch <= 'z'; }
        constexpr char toUpper(char ch) noexcept { return isLower(ch) ? static_cast<char>(ch - 'a' + 'A') : ch; }
        constexpr char toLower(char ch) noexcept { return isUpper(ch) ? static_cast<char>(ch - 'A' + 'a') : ch; }

        // calls emit(char) for each character of the wire name for ident
        template <typename EmitT>
        constexpr void convertWireName(std::string_view ident, EmitT&& emit) {
            // trailing underscores escape C++ keywords (`default_', `class_')
            while (!ident.empty() && ident.back() == '_')
                ident.remove_suffix(1);

            bool first = true;
            std::size_t pos = 0;
            while (pos < ident.size()) {
                if (ident[pos] == '_') {
                    ++pos;
                    continue;
                }

                auto end = ident.find('_', pos);
                if (end == std::string_view::npos)
                    end = ident.size();
                auto const segment = ident.substr(pos, end - pos);

                // an all-caps segment is a single word: `url_ID' -> `urlId'
                bool acronym = false;
                for (char const ch : segment) {
                    if (isLower(ch)) {
                        acronym = false;
                        break;
                    }
                    if (isUpper(ch))
                        acronym = true;
                }

                for (std::size_t i = 0; i != segment.size(); ++i) {
                    if (i == 0)
                        emit(first ? toLower(segment[i]) : toUpper(segment[i]));
                    else
                        emit(acronym ? toLower(segment[i]) : segment[i]);
                }

                first = false;
                pos = end;
            }
        }
    }

    // `created_at' -> `createdAt', `default_' -> `default', `ID' -> `id'
    template <std::size_t N>
    constexpr FixedName<N> wireName(char const (&ident)[N]) {
        FixedName<N> result;
        _detail::convertWireName(std::string_view{ ident, N - 1 }, [&result](char ch) { result.data[result.length++] = ch; });
        return result;
    }

    inline std::string toWireName(std::string_view ident) {
        std::string result;
        _detail::convertWireName(ident, [&result](char ch) { result.push_back(ch); });
        return result;
    }

    inline constexpr std::string_view cppKeywords[] = {
        "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break",
        "case", "catch", "char", "char8_t", "char16_t", "char32_t", "class", "compl", "concept", "const",
        "consteval", "constexpr", "constinit", "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype", "default",
        "delete", "do", "double", "dynamic_cast", "else", "enum", "explicit", "export", "extern", "false",
        "float", "for", "friend", "goto", "if", "inline", "int", "long", "mutable", "namespace",
        "new", "noexcept", "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private", "protected",
        "public", "register", "reinterpret_cast", "requires", "return", "short", "signed", "sizeof", "static", "static_assert",
        "static_cast", "struct", "switch", "template", "this", "thread_local", "throw", "true", "try", "typedef",
        "typeid", "typename", "union", "unsigned", "using", "virtual", "void", "volatile", "wchar_t", "while",
        "xor", "xor_eq",
    };

    constexpr bool isCppKeyword(std::string_view name) noexcept {
        for (auto const keyword : cppKeywords)
            if (keyword == name)
                return true;
        return false;
    }

    // escapes names that collide with C++ keywords; toWireName undoes it
    inline std::string safeIdent(std::string_view name) {
        std::string result(name);
        if (isCppKeyword(name))
            result.push_back('_');
        return result;
    }
}
