// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "lexer.hh"
#include "log.hh"

#include <algorithm>
#include <charconv>
#include <ostream>
#include <sstream>

namespace gqlc {
    static auto isNameStartChar(char ch) -> bool { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_'; };
    static auto isNameChar(char ch) -> bool { return isNameStartChar(ch) || (ch >= '0' && ch <= '9'); };
    static auto isDigit(char ch) -> bool { return ch >= '0' && ch <= '9'; };
    static auto isWhiteSpace(char ch) -> bool { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == ','; }

    std::ostream& operator<<(std::ostream& os, TokenType type) {
        switch (type) {
        case TokenType::Unknown: os << "unknown"; break;
        case TokenType::Name: os << "name"; break;
        case TokenType::String: os << "string"; break;
        case TokenType::BlockString: os << "block string"; break;
        case TokenType::IntValue: os << "integer"; break;
        case TokenType::FloatValue: os << "float"; break;
        case TokenType::Bang: os << "`!'"; break;
        case TokenType::Dollar: os << "`$'"; break;
        case TokenType::Ampersand: os << "`&'"; break;
        case TokenType::LeftParen: os << "`('"; break;
        case TokenType::RightParen: os << "`)'"; break;
        case TokenType::Spread: os << "`...'"; break;
        case TokenType::Colon: os << "`:'"; break;
        case TokenType::Equal: os << "`='"; break;
        case TokenType::At: os << "`@'"; break;
        case TokenType::LeftBracket: os << "`['"; break;
        case TokenType::RightBracket: os << "`]'"; break;
        case TokenType::LeftBrace: os << "`{'"; break;
        case TokenType::RightBrace: os << "`}'"; break;
        case TokenType::Pipe: os << "`|'"; break;
        case TokenType::EndOfFile: os << "end of file"; break;
        default: os << "[unknown-token-type]"; break;
        }
        return os;
    }

    std::ostream& operator<<(std::ostream& os, Token const& tok) {
        if (tok.type == TokenType::Name)
            return os << '`' << tok.dataString << '\'';
        return os << tok.type;
    }

    static void appendUtf8(std::string& out, unsigned long codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        }
        else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
        else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
        else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string blockStringValue(std::string_view raw) {
        std::vector<std::string_view> lines;
        for (std::size_t start = 0;;) {
            auto const eol = raw.find_first_of("\r\n", start);
            if (eol == std::string_view::npos) {
                lines.push_back(raw.substr(start));
                break;
            }
            lines.push_back(raw.substr(start, eol - start));
            start = eol + 1;
            if (raw[eol] == '\r' && start < raw.size() && raw[start] == '\n')
                ++start;
        }

        auto const indentOf = [](std::string_view line) {
            return line.find_first_not_of(" \t");
        };

        auto commonIndent = std::string_view::npos;
        for (std::size_t index = 1; index < lines.size(); ++index) {
            auto const indent = indentOf(lines[index]);
            if (indent != std::string_view::npos && indent < commonIndent)
                commonIndent = indent;
        }

        if (commonIndent != std::string_view::npos) {
            for (std::size_t index = 1; index < lines.size(); ++index)
                lines[index] = lines[index].substr(std::min(commonIndent, lines[index].size()));
        }

        while (!lines.empty() && indentOf(lines.front()) == std::string_view::npos)
            lines.erase(lines.begin());
        while (!lines.empty() && indentOf(lines.back()) == std::string_view::npos)
            lines.pop_back();

        std::string result;
        for (std::size_t index = 0; index != lines.size(); ++index) {
            if (index != 0)
                result += '\n';
            result += lines[index];
        }
        return result;
    }

    bool tokenize(std::string_view source, std::filesystem::path const& filename, std::vector<Token>& tokens, Log& log) {
        decltype(source.size()) position = 0;
        int line = 1;
        decltype(position) lineStart = 0;
        bool clean = true;

        auto advance = [&, source](decltype(position) count = 1) {
            while (count-- > 0 && position < source.size()) {
                if (source[position++] == '\n') {
                    ++line;
                    lineStart = position;
                }
            }
        };

        auto const pos = [&](decltype(position) start) {
            return Position{ line, static_cast<int>(start - lineStart) + 1 };
        };

        auto const match = [&](std::string_view input) {
            if (source.substr(position, input.size()) != input)
                return false;

            advance(input.size());
            return true;
        };

        auto const warn = [&](Position where, auto const&... args) {
            log.warn(Location{ filename, where }, args...);
            clean = false;
        };

        struct TokenMap {
            std::string_view text;
            TokenType token;
        };
        constexpr TokenMap tokenMap[] = {
            { "...", TokenType::Spread },
            { "!", TokenType::Bang },
            { "$", TokenType::Dollar },
            { "&", TokenType::Ampersand },
            { "(", TokenType::LeftParen },
            { ")", TokenType::RightParen },
            { ":", TokenType::Colon },
            { "=", TokenType::Equal },
            { "@", TokenType::At },
            { "[", TokenType::LeftBracket },
            { "]", TokenType::RightBracket },
            { "{", TokenType::LeftBrace },
            { "}", TokenType::RightBrace },
            { "|", TokenType::Pipe },
        };

        // skip a UTF-8 byte order mark
        match("\xEF\xBB\xBF");

        // parse until end of file
        for (;;) {
            // consume all whitespace, commas included
            while (position < source.size() && isWhiteSpace(source[position]))
                advance();

            auto const start = position;

            // if we hit EOF, termine loop
            if (position == source.size()) {
                tokens.push_back({ TokenType::EndOfFile, pos(start) });
                break;
            }

            // check for line-comments
            if (source[position] == '#') {
                while (position < source.size() && source[position] != '\n')
                    advance();
                continue;
            }

            // block strings must be checked before plain strings
            if (match("\"\"\"")) {
                auto const tokPos = pos(start);
                std::string raw;
                bool closed = false;
                while (position < source.size()) {
                    if (match("\\\"\"\"")) {
                        raw += "\"\"\"";
                        continue;
                    }
                    if (match("\"\"\"")) {
                        closed = true;
                        break;
                    }
                    raw += source[position];
                    advance();
                }
                if (!closed)
                    warn(tokPos, "unterminated block string");

                tokens.push_back({ TokenType::BlockString, tokPos, blockStringValue(raw) });
                continue;
            }

            // string
            if (source[position] == '"') {
                auto const tokPos = pos(start);
                advance();
                std::string buf;
                bool closed = false;
                while (position < source.size() && source[position] != '\n') {
                    auto const ch = source[position];
                    advance();

                    if (ch == '"') {
                        closed = true;
                        break;
                    }
                    if (ch != '\\') {
                        buf += ch;
                        continue;
                    }
                    if (position >= source.size())
                        break;

                    auto const esc = source[position];
                    advance();
                    switch (esc) {
                    case '"': buf += '"'; break;
                    case '\\': buf += '\\'; break;
                    case '/': buf += '/'; break;
                    case 'b': buf += '\b'; break;
                    case 'f': buf += '\f'; break;
                    case 'n': buf += '\n'; break;
                    case 'r': buf += '\r'; break;
                    case 't': buf += '\t'; break;
                    case 'u': {
                        auto const peekHex = [&](size_t at, unsigned long& out) {
                            auto const digits = source.substr(at, 4);
                            auto const rs = std::from_chars(digits.data(), digits.data() + digits.size(), out, 16);
                            return digits.size() == 4 && rs.ptr == digits.data() + 4;
                        };
                        unsigned long codepoint = 0;
                        if (!peekHex(position, codepoint)) {
                            warn(pos(position), "invalid unicode escape sequence");
                            break;
                        }
                        advance(4);
                        // combine UTF-16 surrogate pairs; the next escape is left alone unless it is the low half
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                            unsigned long low = 0;
                            if (source.substr(position, 2) == "\\u" && peekHex(position + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                                advance(6);
                                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                            }
                        }
                        if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
                            warn(pos(position - 6), "invalid unicode surrogate");
                            codepoint = 0xFFFD;
                        }
                        appendUtf8(buf, codepoint);
                        break;
                    }
                    default:
                        warn(pos(position - 1), "invalid escape sequence `\\", esc, '\'');
                        buf += esc;
                        break;
                    }
                }
                if (!closed)
                    warn(tokPos, "unterminated string");

                tokens.push_back({ TokenType::String, tokPos, std::move(buf) });
                continue;
            }

            // check static inputs
            bool matched = false;
            for (auto [input, token] : tokenMap) {
                if (match(input)) {
                    tokens.push_back({ token, pos(start) });
                    matched = true;
                    break;
                }
            }
            if (matched)
                continue;

            // names; keywords are contextual in SDL and resolved by the grammar
            if (isNameStartChar(source[position])) {
                advance();
                while (position < source.size() && isNameChar(source[position]))
                    advance();
                tokens.push_back({ TokenType::Name, pos(start), std::string{ source.substr(start, position - start) } });
                continue;
            }

            // int and float values
            bool const isNegative = source[position] == '-';
            if (isNegative || isDigit(source[position])) {
                advance();
                while (position < source.size() && isDigit(source[position]))
                    advance();

                // only a negative sign is not a complete number
                if (isNegative && position - start <= 1) {
                    warn(pos(start), "expected digit after `-'");
                    continue;
                }

                auto type = TokenType::IntValue;
                if (position < source.size() && source[position] == '.') {
                    type = TokenType::FloatValue;
                    advance();
                    while (position < source.size() && isDigit(source[position]))
                        advance();
                }
                if (position < source.size() && (source[position] == 'e' || source[position] == 'E')) {
                    type = TokenType::FloatValue;
                    advance();
                    if (position < source.size() && (source[position] == '+' || source[position] == '-'))
                        advance();
                    while (position < source.size() && isDigit(source[position]))
                        advance();
                }

                tokens.push_back({ type, pos(start), std::string{ source.substr(start, position - start) } });
                continue;
            }

            // unknown input is reported and skipped
            warn(pos(start), "unexpected character `", source[position], '\'');
            advance();
        }

        return clean;
    }
}
