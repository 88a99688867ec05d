// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gqlc::schema {
    enum class TypeKind {
        Scalar,
        Enum,
        Object,
        InputObject,
        Interface,
        Union,
    };
    std::ostream& operator<<(std::ostream& os, TypeKind kind);

    // A declared field or argument type: Named(name) | List(inner) | NonNull(inner)
    struct TypeRef {
        enum class Kind {
            Named,
            List,
            NonNull,
        };

        Kind kind = Kind::Named;
        std::string name; // Named only
        std::unique_ptr<TypeRef> ofType; // List and NonNull only

        static TypeRef named(std::string name);
        static TypeRef list(TypeRef inner);
        static TypeRef nonNull(TypeRef inner);

        // strips all List/NonNull wrapping down to the leaf type name
        std::string const& baseName() const noexcept;

        bool isNonNull() const noexcept { return kind == Kind::NonNull; }
        bool isList() const noexcept;

        TypeRef clone() const;

        friend std::ostream& operator<<(std::ostream& os, TypeRef const& ref);
    };

    struct ArgumentDef {
        std::string name;
        std::optional<std::string> description;
        TypeRef type;
        std::optional<std::string> defaultValue;
    };

    struct FieldDef {
        std::string name;
        std::optional<std::string> description;
        TypeRef type;
        std::vector<ArgumentDef> arguments;
        bool deprecated = false;
    };

    struct EnumValueDef {
        std::string name;
        std::optional<std::string> description;
        bool deprecated = false;
        std::optional<std::string> deprecationReason;
    };

    struct EnumDef {
        std::string name;
        std::optional<std::string> description;
        std::vector<EnumValueDef> values;
    };

    struct ObjectDef {
        std::string name;
        std::optional<std::string> description;
        std::vector<std::string> interfaces;
        std::vector<FieldDef> fields;
    };

    struct InputDef {
        std::string name;
        std::optional<std::string> description;
        std::vector<FieldDef> fields;
    };

    struct ScalarDef {
        std::string name;
        std::optional<std::string> description;
    };

    struct ParsedSchema {
        std::vector<ScalarDef> scalars;
        std::vector<EnumDef> enums;
        std::vector<ObjectDef> objects;
        std::vector<InputDef> inputs;
        std::vector<FieldDef> queryFields;
        std::vector<FieldDef> mutationFields;
        std::unordered_map<std::string, TypeKind> typeKinds;

        std::string queryRoot = "Query";
        std::string mutationRoot = "Mutation";

        std::optional<TypeKind> kindOf(std::string const& name) const;
        ObjectDef const* findObject(std::string const& name) const;
        EnumDef const* findEnum(std::string const& name) const;
        InputDef const* findInput(std::string const& name) const;
    };

    inline constexpr char const* builtinScalars[] = { "String", "Int", "Float", "Boolean", "ID" };

    bool isBuiltinScalar(std::string const& name) noexcept;
}
