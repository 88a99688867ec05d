// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "grammar.hh"
#include "ast.hh"
#include "lexer.hh"
#include "location.hh"
#include "log.hh"

#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

#if defined(EXPECT)
#   undef EXPECT
#endif
#define EXPECT(first,...) do{ if (!mustConsume((first),##__VA_ARGS__)) return false; }while(0)

namespace gqlc {
    using namespace std::literals;

    namespace {
        constexpr std::string_view topLevelKeywords[] = {
            "schema"sv, "scalar"sv, "type"sv, "interface"sv, "union"sv, "enum"sv, "input"sv, "directive"sv, "extend"sv,
        };

        struct Grammar {
            std::vector<Token> const& tokens;
            Log& log;
            fs::path const& filename;
            ast::Document& document;
            size_t next = 0;

            inline Location pos() const;

            template <typename... T>
            bool fail(T const&... args);

            inline bool match(TokenType type) const;
            inline bool matchKeyword(std::string_view keyword) const;
            inline bool matchDescription() const;
            inline bool isTopLevelKeyword(size_t index) const;

            inline bool consume(TokenType type);
            inline bool consumeKeyword(std::string_view keyword);

            inline bool mustConsume(TokenType type);
            inline bool mustConsume(ast::Identifier& out);
            inline bool mustConsume(std::optional<schema::TypeRef>& out);
            inline bool mustConsume(std::vector<ast::Directive>& out);

            inline bool parseValue(std::string& out);
            inline std::optional<std::string> parseDescription();

            inline void parseDocument();
            inline bool parseDefinition();
            inline bool parseSchema(ast::SchemaDecl& decl);
            inline bool parseScalar(ast::ScalarDecl& decl);
            inline bool parseObject(ast::ObjectDecl& decl);
            inline bool parseUnion(ast::UnionDecl& decl);
            inline bool parseEnum(ast::EnumDecl& decl);
            inline bool parseInput(ast::InputDecl& decl);
            inline bool parseDirective(ast::DirectiveDecl& decl);

            inline bool parseField(ast::Field& field);
            inline bool parseInputValue(ast::InputValue& value);
            inline bool parseEnumValue(ast::EnumValue& value);
            inline bool parseArguments(std::vector<ast::InputValue>& arguments);

            template <typename MemberT, typename ParseT>
            bool parseBody(std::vector<MemberT>& members, ParseT parseMember);

            inline void recoverMember(size_t start);
            inline void recoverDefinition(size_t start);
        };
    }

    std::unique_ptr<ast::Document> parse(std::string_view source, std::filesystem::path const& filename, Log& log) {
        std::vector<Token> tokens;
        tokenize(source, filename, tokens, log);

        auto doc = std::make_unique<ast::Document>();
        doc->filename = filename;

        Grammar grammar{ tokens, log, filename, *doc };
        grammar.parseDocument();

        return doc;
    }

    void Grammar::parseDocument() {
        while (!match(TokenType::EndOfFile)) {
            auto const start = next;
            if (!parseDefinition())
                recoverDefinition(start);
        }
    }

    bool Grammar::parseDefinition() {
        auto description = parseDescription();
        bool const extension = consumeKeyword("extend");

        if (!match(TokenType::Name))
            return fail("expected definition, got ", tokens[next]);

        auto const keyword = tokens[next].dataString;
        ++next;

        std::unique_ptr<ast::Definition> def;
        bool parsed = false;

        if (keyword == "schema") {
            auto decl = std::make_unique<ast::SchemaDecl>();
            parsed = parseSchema(*decl);
            def = std::move(decl);
        }
        else if (keyword == "scalar") {
            auto decl = std::make_unique<ast::ScalarDecl>();
            parsed = parseScalar(*decl);
            def = std::move(decl);
        }
        else if (keyword == "type" || keyword == "interface") {
            auto decl = std::make_unique<ast::ObjectDecl>(keyword == "type" ? ast::Definition::Kind::Object : ast::Definition::Kind::Interface);
            parsed = parseObject(*decl);
            def = std::move(decl);
        }
        else if (keyword == "union") {
            auto decl = std::make_unique<ast::UnionDecl>();
            parsed = parseUnion(*decl);
            def = std::move(decl);
        }
        else if (keyword == "enum") {
            auto decl = std::make_unique<ast::EnumDecl>();
            parsed = parseEnum(*decl);
            def = std::move(decl);
        }
        else if (keyword == "input") {
            auto decl = std::make_unique<ast::InputDecl>();
            parsed = parseInput(*decl);
            def = std::move(decl);
        }
        else if (keyword == "directive" && !extension) {
            auto decl = std::make_unique<ast::DirectiveDecl>();
            parsed = parseDirective(*decl);
            def = std::move(decl);
        }
        else {
            --next;
            return fail("unexpected ", tokens[next]);
        }

        if (!parsed)
            return false;

        def->extension = extension;
        def->description = std::move(description);
        document.definitions.push_back(std::move(def));
        return true;
    }

    bool Grammar::parseSchema(ast::SchemaDecl& decl) {
        decl.name.id = "schema";
        decl.name.loc = pos();
        EXPECT(decl.directives);

        if (!match(TokenType::LeftBrace))
            return true;

        EXPECT(TokenType::LeftBrace);
        while (!consume(TokenType::RightBrace)) {
            auto& operation = decl.operations.emplace_back();
            EXPECT(operation.operation);
            EXPECT(TokenType::Colon);
            EXPECT(operation.type);
        }
        return true;
    }

    bool Grammar::parseScalar(ast::ScalarDecl& decl) {
        EXPECT(decl.name);
        EXPECT(decl.directives);
        return true;
    }

    bool Grammar::parseObject(ast::ObjectDecl& decl) {
        EXPECT(decl.name);

        if (consumeKeyword("implements")) {
            consume(TokenType::Ampersand);
            EXPECT(decl.interfaces.emplace_back());

            // `&' separated, or the legacy whitespace/comma separated form
            for (;;) {
                if (consume(TokenType::Ampersand))
                    EXPECT(decl.interfaces.emplace_back());
                else if (match(TokenType::Name) && !isTopLevelKeyword(next))
                    EXPECT(decl.interfaces.emplace_back());
                else
                    break;
            }
        }

        EXPECT(decl.directives);

        if (match(TokenType::LeftBrace))
            return parseBody(decl.fields, [this](ast::Field& field) { return parseField(field); });

        return true;
    }

    bool Grammar::parseUnion(ast::UnionDecl& decl) {
        EXPECT(decl.name);
        EXPECT(decl.directives);

        if (!consume(TokenType::Equal))
            return true;

        consume(TokenType::Pipe);
        EXPECT(decl.members.emplace_back());
        while (consume(TokenType::Pipe))
            EXPECT(decl.members.emplace_back());

        return true;
    }

    bool Grammar::parseEnum(ast::EnumDecl& decl) {
        EXPECT(decl.name);
        EXPECT(decl.directives);

        if (match(TokenType::LeftBrace))
            return parseBody(decl.values, [this](ast::EnumValue& value) { return parseEnumValue(value); });

        return true;
    }

    bool Grammar::parseInput(ast::InputDecl& decl) {
        EXPECT(decl.name);
        EXPECT(decl.directives);

        if (match(TokenType::LeftBrace))
            return parseBody(decl.fields, [this](ast::InputValue& value) { return parseInputValue(value); });

        return true;
    }

    bool Grammar::parseDirective(ast::DirectiveDecl& decl) {
        EXPECT(TokenType::At);
        EXPECT(decl.name);

        if (match(TokenType::LeftParen) && !parseArguments(decl.arguments))
            return false;

        decl.repeatable = consumeKeyword("repeatable");

        if (!consumeKeyword("on"))
            return fail("expected `on' after directive `@", decl.name, '\'');

        consume(TokenType::Pipe);
        EXPECT(decl.locations.emplace_back());
        while (consume(TokenType::Pipe))
            EXPECT(decl.locations.emplace_back());

        return true;
    }

    bool Grammar::parseField(ast::Field& field) {
        field.description = parseDescription();
        EXPECT(field.name);

        if (match(TokenType::LeftParen) && !parseArguments(field.arguments))
            return false;

        if (!consume(TokenType::Colon))
            log.warn(field.name.loc, "missing type annotation for field `", field.name, "', assuming String");
        else if (!match(TokenType::Name) && !match(TokenType::LeftBracket))
            log.warn(field.name.loc, "missing type for field `", field.name, "', assuming String");
        else
            EXPECT(field.type);

        EXPECT(field.directives);
        return true;
    }

    bool Grammar::parseInputValue(ast::InputValue& value) {
        value.description = parseDescription();
        EXPECT(value.name);

        if (!consume(TokenType::Colon))
            log.warn(value.name.loc, "missing type annotation for `", value.name, "', assuming String");
        else if (!match(TokenType::Name) && !match(TokenType::LeftBracket))
            log.warn(value.name.loc, "missing type for `", value.name, "', assuming String");
        else
            EXPECT(value.type);

        if (consume(TokenType::Equal)) {
            std::string defaultValue;
            if (!parseValue(defaultValue))
                return false;
            value.defaultValue = std::move(defaultValue);
        }

        EXPECT(value.directives);
        return true;
    }

    bool Grammar::parseEnumValue(ast::EnumValue& value) {
        value.description = parseDescription();
        EXPECT(value.name);
        EXPECT(value.directives);
        return true;
    }

    bool Grammar::parseArguments(std::vector<ast::InputValue>& arguments) {
        EXPECT(TokenType::LeftParen);
        while (!consume(TokenType::RightParen)) {
            if (match(TokenType::EndOfFile))
                return fail("unexpected end of file in argument list");

            if (!parseInputValue(arguments.emplace_back()))
                return false;
        }
        return true;
    }

    template <typename MemberT, typename ParseT>
    bool Grammar::parseBody(std::vector<MemberT>& members, ParseT parseMember) {
        auto const open = pos();
        EXPECT(TokenType::LeftBrace);

        while (!consume(TokenType::RightBrace)) {
            if (match(TokenType::EndOfFile)) {
                log.warn(pos(), "unexpected end of file");
                log.info(open, "unclosed body started here");
                return false;
            }

            auto const start = next;
            MemberT member;
            if (parseMember(member))
                members.push_back(std::move(member));
            else
                recoverMember(start);
        }

        return true;
    }

    bool Grammar::parseValue(std::string& out) {
        auto const quote = [](std::string const& text) {
            std::string result = "\"";
            for (char const ch : text) {
                switch (ch) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default: result += ch; break;
                }
            }
            return result + '"';
        };

        if (consume(TokenType::Dollar)) {
            ast::Identifier variable;
            EXPECT(variable);
            out = "$" + variable.id;
        }
        else if (consume(TokenType::IntValue) || consume(TokenType::FloatValue) || consume(TokenType::Name)) {
            out = tokens[next - 1].dataString;
        }
        else if (consume(TokenType::String) || consume(TokenType::BlockString)) {
            out = quote(tokens[next - 1].dataString);
        }
        else if (consume(TokenType::LeftBracket)) {
            out = "[";
            bool first = true;
            while (!consume(TokenType::RightBracket)) {
                std::string element;
                if (!parseValue(element))
                    return false;
                if (!first)
                    out += ", ";
                out += element;
                first = false;
            }
            out += "]";
        }
        else if (consume(TokenType::LeftBrace)) {
            out = "{";
            bool first = true;
            while (!consume(TokenType::RightBrace)) {
                ast::Identifier key;
                std::string element;
                EXPECT(key);
                EXPECT(TokenType::Colon);
                if (!parseValue(element))
                    return false;
                if (!first)
                    out += ", ";
                out += key.id + ": " + element;
                first = false;
            }
            out += "}";
        }
        else {
            return fail("expected value, got ", tokens[next]);
        }
        return true;
    }

    std::optional<std::string> Grammar::parseDescription() {
        if (!matchDescription())
            return std::nullopt;
        return tokens[next++].dataString;
    }

    bool Grammar::match(TokenType type) const {
        if (next >= tokens.size())
            return false;

        return tokens[next].type == type;
    }

    bool Grammar::matchKeyword(std::string_view keyword) const {
        return match(TokenType::Name) && tokens[next].dataString == keyword;
    }

    bool Grammar::matchDescription() const {
        return match(TokenType::String) || match(TokenType::BlockString);
    }

    bool Grammar::isTopLevelKeyword(size_t index) const {
        if (index >= tokens.size() || tokens[index].type != TokenType::Name)
            return false;
        for (auto const keyword : topLevelKeywords)
            if (tokens[index].dataString == keyword)
                return true;
        return false;
    }

    bool Grammar::consume(TokenType type) {
        if (!match(type))
            return false;

        ++next;
        return true;
    }

    bool Grammar::consumeKeyword(std::string_view keyword) {
        if (!matchKeyword(keyword))
            return false;

        ++next;
        return true;
    }

    Location Grammar::pos() const {
        auto const& tokPos = next > 0 ? tokens[next - 1].pos : tokens.front().pos;
        return Location{ filename, tokPos };
    }

    template <typename... T>
    bool Grammar::fail(T const&... args) {
        auto const& tok = next < tokens.size() ? tokens[next] : tokens.back();
        log.warn(Location{ filename, tok.pos }, args...);
        return false;
    }

    bool Grammar::mustConsume(TokenType type) {
        if (consume(type))
            return true;

        std::ostringstream buf;
        buf << "expected " << type;
        if (next > 0)
            buf << " after " << tokens[next - 1];
        if (next < tokens.size())
            buf << ", got " << tokens[next];
        return fail(buf.str());
    }

    bool Grammar::mustConsume(ast::Identifier& out) {
        if (!match(TokenType::Name)) {
            std::ostringstream buf;
            buf << "expected name";
            if (next > 0)
                buf << " after " << tokens[next - 1];
            if (next < tokens.size())
                buf << ", got " << tokens[next];
            return fail(buf.str());
        }

        out.id = tokens[next].dataString;
        out.loc = Location{ filename, tokens[next].pos };
        ++next;
        return true;
    }

    bool Grammar::mustConsume(std::optional<schema::TypeRef>& out) {
        if (consume(TokenType::LeftBracket)) {
            std::optional<schema::TypeRef> inner;
            EXPECT(inner);
            EXPECT(TokenType::RightBracket);
            out = schema::TypeRef::list(std::move(*inner));
        }
        else if (match(TokenType::Name)) {
            out = schema::TypeRef::named(tokens[next].dataString);
            ++next;
        }
        else {
            std::ostringstream buf;
            buf << "expected type";
            if (next < tokens.size())
                buf << ", got " << tokens[next];
            return fail(buf.str());
        }

        if (consume(TokenType::Bang))
            out = schema::TypeRef::nonNull(std::move(*out));

        return true;
    }

    bool Grammar::mustConsume(std::vector<ast::Directive>& out) {
        while (consume(TokenType::At)) {
            auto& directive = out.emplace_back();
            EXPECT(directive.name);

            if (!consume(TokenType::LeftParen))
                continue;

            while (!consume(TokenType::RightParen)) {
                auto& arg = directive.args.emplace_back();
                EXPECT(arg.name);
                EXPECT(TokenType::Colon);
                if (!parseValue(arg.value))
                    return false;
            }
        }
        return true;
    }

    // Skips to the next plausible member of a `{ ... }' body: a name followed
    // by `:' or `(', a description, or the closing brace.
    void Grammar::recoverMember(size_t start) {
        next = start + 1;
        int depth = 0;
        while (next < tokens.size() && !match(TokenType::EndOfFile)) {
            auto const type = tokens[next].type;
            if (depth == 0) {
                if (type == TokenType::RightBrace)
                    return;
                if (type == TokenType::Name && next + 1 < tokens.size()) {
                    auto const follow = tokens[next + 1].type;
                    if (follow == TokenType::Colon || follow == TokenType::LeftParen)
                        return;
                }
                if ((type == TokenType::String || type == TokenType::BlockString) && next + 1 < tokens.size() && tokens[next + 1].type == TokenType::Name)
                    return;
            }

            if (type == TokenType::LeftParen || type == TokenType::LeftBrace)
                ++depth;
            else if ((type == TokenType::RightParen || type == TokenType::RightBrace) && depth > 0)
                --depth;
            ++next;
        }
    }

    // Skips to the next top-level definition keyword (optionally preceded by
    // its description) outside of any braces.
    void Grammar::recoverDefinition(size_t start) {
        next = start + 1;
        int depth = 0;
        while (next < tokens.size() && !match(TokenType::EndOfFile)) {
            auto const type = tokens[next].type;
            if (depth == 0) {
                if (isTopLevelKeyword(next))
                    return;
                if ((type == TokenType::String || type == TokenType::BlockString) && isTopLevelKeyword(next + 1))
                    return;
            }

            if (type == TokenType::LeftBrace || type == TokenType::LeftParen)
                ++depth;
            else if ((type == TokenType::RightBrace || type == TokenType::RightParen) && depth > 0)
                --depth;
            ++next;
        }
    }
}
