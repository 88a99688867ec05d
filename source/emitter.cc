// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "emitter.hh"
#include "naming.hh"
#include "schema.hh"

#include <optional>
#include <sstream>

namespace gqlc {
    using namespace std::literals;

    namespace {
        enum class MemberKind {
            Plain,
            Reference,
        };

        struct Emitter {
            Emitter(schema::ParsedSchema const& schema, EmitOptions const& options) : schema(schema), options(options) {}

            schema::ParsedSchema const& schema;
            EmitOptions const& options;
            std::ostringstream out;

            void emit();

            void emitDoc(std::optional<std::string> const& description, std::string_view indent);
            void emitEnum(schema::EnumDef const& def);
            void emitObject(schema::ObjectDef const& def);
            void emitOperations(std::string_view name, std::vector<schema::FieldDef> const& fields);

            std::string leafType(std::string const& name, MemberKind& kind) const;
            std::string valueType(schema::TypeRef const& ref, MemberKind& kind) const;
            std::string memberType(schema::TypeRef const& ref, MemberKind& kind) const;
        };
    }

    std::string emitHeader(schema::ParsedSchema const& schema, EmitOptions const& options) {
        Emitter emitter{ schema, options };
        emitter.emit();
        return emitter.out.str();
    }

    void Emitter::emit() {
        out << "// Generated by gqlc";
        if (!options.sourceName.empty())
            out << " from " << options.sourceName;
        out << ". Do not edit.\n\n";

        out << "#pragma once\n\n";
        out << "#include \"box.hh\"\n";
        out << "#include \"projection.hh\"\n";
        out << "#include \"timestamp.hh\"\n\n";
        out << "#include <nlohmann/json.hpp>\n\n";
        out << "#include <array>\n";
        out << "#include <optional>\n";
        out << "#include <string>\n";
        out << "#include <string_view>\n";
        out << "#include <vector>\n\n";

        out << "namespace " << options.namespaceName << " {\n";

        for (auto const& def : schema.enums)
            emitEnum(def);

        if (!schema.objects.empty()) {
            out << '\n';
            for (auto const& def : schema.objects)
                out << "    struct " << safeIdent(def.name) << ";\n";
        }

        for (auto const& def : schema.objects)
            emitObject(def);

        out << '\n';
        emitOperations("queryOperations"sv, schema.queryFields);
        emitOperations("mutationOperations"sv, schema.mutationFields);

        out << "}\n";
    }

    void Emitter::emitDoc(std::optional<std::string> const& description, std::string_view indent) {
        if (!description.has_value() || description->empty())
            return;

        std::string_view text = *description;
        while (!text.empty()) {
            auto const eol = text.find('\n');
            auto line = text.substr(0, eol);
            // a trailing backslash would splice the next source line into the comment
            while (!line.empty() && (line.back() == '\\' || line.back() == '\r'))
                line.remove_suffix(1);
            out << indent << "///";
            if (!line.empty())
                out << ' ' << line;
            out << '\n';
            if (eol == std::string_view::npos)
                break;
            text.remove_prefix(eol + 1);
        }
    }

    void Emitter::emitEnum(schema::EnumDef const& def) {
        auto const name = safeIdent(def.name);

        out << '\n';
        emitDoc(def.description, "    ");
        out << "    enum class " << name << " {\n";
        out << "        Unknown_,\n";
        for (auto const& value : def.values) {
            emitDoc(value.description, "        ");
            if (value.deprecated)
                emitDoc("Deprecated" + (value.deprecationReason.has_value() ? ": " + *value.deprecationReason : std::string()), "        ");
            out << "        " << safeIdent(value.name) << ",\n";
        }
        out << "    };\n";

        // unrecognized wire values decode to Unknown_
        out << "    NLOHMANN_JSON_SERIALIZE_ENUM(" << name << ", {\n";
        out << "        { " << name << "::Unknown_, nullptr },\n";
        for (auto const& value : def.values)
            out << "        { " << name << "::" << safeIdent(value.name) << ", \"" << value.name << "\" },\n";
        out << "    })\n";
    }

    void Emitter::emitObject(schema::ObjectDef const& def) {
        auto const name = safeIdent(def.name);

        out << '\n';
        emitDoc(def.description, "    ");
        out << "    struct " << name << " {\n";

        std::vector<MemberKind> kinds;
        kinds.reserve(def.fields.size());

        for (auto const& field : def.fields) {
            MemberKind kind = MemberKind::Plain;
            auto const type = memberType(field.type, kind);
            kinds.push_back(kind);

            emitDoc(field.description, "        ");
            out << "        " << type << ' ' << safeIdent(field.name) << ";\n";
        }

        if (!def.fields.empty())
            out << '\n';
        out << "        static constexpr auto graphqlFields() {\n";
        out << "            return gqlc::fields(";
        for (size_t index = 0; index != def.fields.size(); ++index) {
            auto const& field = def.fields[index];
            out << (index == 0 ? "\n" : ",\n");
            out << "                gqlc::" << (kinds[index] == MemberKind::Plain ? "field"sv : "reference"sv)
                << "<&" << name << "::" << safeIdent(field.name) << ">(\"" << field.name << "\")";
        }
        out << ");\n";
        out << "        }\n";
        out << "    };\n";
    }

    void Emitter::emitOperations(std::string_view name, std::vector<schema::FieldDef> const& fields) {
        out << "    inline constexpr std::array<std::string_view, " << fields.size() << "> " << name << "{";
        for (size_t index = 0; index != fields.size(); ++index)
            out << (index == 0 ? " "sv : ", "sv) << '"' << fields[index].name << '"';
        out << (fields.empty() ? "};\n"sv : " };\n"sv);
    }

    // C++ type for a named schema type. Objects, interfaces and unions are
    // references: they are not part of the default selection.
    std::string Emitter::leafType(std::string const& name, MemberKind& kind) const {
        auto const typeKind = schema.kindOf(name);
        if (!typeKind.has_value())
            return "nlohmann::json";

        switch (*typeKind) {
        case schema::TypeKind::Scalar:
            if (name == "String"sv || name == "ID"sv)
                return "std::string";
            if (name == "Int"sv)
                return "int";
            if (name == "Float"sv)
                return "double";
            if (name == "Boolean"sv)
                return "bool";
            if (name == "DateTime"sv)
                return "gqlc::Timestamp";
            if (name == "JSON"sv || name == "JSONObject"sv)
                return "nlohmann::json";
            return "std::string";
        case schema::TypeKind::Enum:
            return safeIdent(name);
        case schema::TypeKind::Object:
            kind = MemberKind::Reference;
            return "gqlc::Box<" + safeIdent(name) + ">";
        case schema::TypeKind::Interface:
        case schema::TypeKind::Union:
            kind = MemberKind::Reference;
            return "nlohmann::json";
        case schema::TypeKind::InputObject:
        default:
            return "nlohmann::json";
        }
    }

    // Type of a value inside a list: nullable elements are optional, except
    // JSON values which represent null themselves.
    std::string Emitter::valueType(schema::TypeRef const& ref, MemberKind& kind) const {
        bool const nonNull = ref.isNonNull();
        auto const& inner = nonNull && ref.ofType != nullptr ? *ref.ofType : ref;

        std::string type;
        if (inner.kind == schema::TypeRef::Kind::List && inner.ofType != nullptr)
            type = "std::vector<" + valueType(*inner.ofType, kind) + ">";
        else
            type = leafType(inner.baseName(), kind);

        if (nonNull || type == "nlohmann::json"sv)
            return type;
        return "std::optional<" + type + ">";
    }

    // Members are always optional: a projection decides what is selected.
    std::string Emitter::memberType(schema::TypeRef const& ref, MemberKind& kind) const {
        auto const& inner = ref.isNonNull() && ref.ofType != nullptr ? *ref.ofType : ref;

        std::string type;
        if (inner.kind == schema::TypeRef::Kind::List && inner.ofType != nullptr)
            type = "std::vector<" + valueType(*inner.ofType, kind) + ">";
        else
            type = leafType(inner.baseName(), kind);

        return "std::optional<" + type + ">";
    }
}
