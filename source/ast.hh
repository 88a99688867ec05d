// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "location.hh"
#include "schema.hh"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gqlc::ast {
    struct Identifier {
        std::string id;
        Location loc;

        bool empty() const noexcept { return id.empty(); }

        friend std::ostream& operator<<(std::ostream& os, Identifier const& id);
    };

    // values are kept as normalized SDL source text
    struct Argument {
        Identifier name;
        std::string value;
    };

    struct Directive {
        Identifier name;
        std::vector<Argument> args;
    };

    struct InputValue {
        std::optional<std::string> description;
        Identifier name;
        std::optional<schema::TypeRef> type; // empty when the annotation is missing
        std::optional<std::string> defaultValue;
        std::vector<Directive> directives;
    };

    struct Field {
        std::optional<std::string> description;
        Identifier name;
        std::vector<InputValue> arguments;
        std::optional<schema::TypeRef> type;
        std::vector<Directive> directives;
    };

    struct EnumValue {
        std::optional<std::string> description;
        Identifier name;
        std::vector<Directive> directives;
    };

    struct Definition {
        enum class Kind {
            Schema,
            Scalar,
            Object,
            Interface,
            Union,
            Enum,
            InputObject,
            Directive,
        };

        virtual ~Definition() = default;

        Kind kind = {};
        bool extension = false;
        std::optional<std::string> description;
        Identifier name;
        std::vector<Directive> directives;
    };

    struct OperationType {
        Identifier operation;
        Identifier type;
    };

    struct SchemaDecl : Definition {
        SchemaDecl() { kind = Kind::Schema; }

        std::vector<OperationType> operations;
    };

    struct ScalarDecl : Definition {
        ScalarDecl() { kind = Kind::Scalar; }
    };

    // object and interface definitions share their shape
    struct ObjectDecl : Definition {
        explicit ObjectDecl(Kind k) { kind = k; }

        std::vector<Identifier> interfaces;
        std::vector<Field> fields;
    };

    struct UnionDecl : Definition {
        UnionDecl() { kind = Kind::Union; }

        std::vector<Identifier> members;
    };

    struct EnumDecl : Definition {
        EnumDecl() { kind = Kind::Enum; }

        std::vector<EnumValue> values;
    };

    struct InputDecl : Definition {
        InputDecl() { kind = Kind::InputObject; }

        std::vector<InputValue> fields;
    };

    struct DirectiveDecl : Definition {
        DirectiveDecl() { kind = Kind::Directive; }

        std::vector<InputValue> arguments;
        std::vector<Identifier> locations;
        bool repeatable = false;
    };

    struct Document {
        std::filesystem::path filename;
        std::vector<std::unique_ptr<Definition>> definitions;
    };

    Directive const* findDirective(std::vector<Directive> const& directives, std::string_view name) noexcept;
}
