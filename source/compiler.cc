// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "ast.hh"
#include "compiler.hh"
#include "grammar.hh"
#include "log.hh"
#include "schema.hh"

#include <algorithm>

namespace fs = std::filesystem;

namespace gqlc {
    using namespace std::literals;

    namespace {
        struct Compiler {
            Log& log;
            schema::ParsedSchema& result;

            void build(ast::Document const& doc);

            void configureRoots(ast::SchemaDecl const& schemaDecl);

            void build(ast::Definition const& def);
            void build(ast::ScalarDecl const& scalarDecl);
            void build(ast::ObjectDecl const& objectDecl);
            void build(ast::EnumDecl const& enumDecl);
            void build(ast::InputDecl const& inputDecl);

            bool declare(ast::Definition const& def, schema::TypeKind kind);

            schema::FieldDef translate(ast::Field const& field);
            schema::FieldDef translateInput(ast::InputValue const& value);
            schema::ArgumentDef translate(ast::InputValue const& value);
            schema::EnumValueDef translate(ast::EnumValue const& value);

            std::vector<schema::FieldDef>* rootFields(std::string const& name);
        };

        schema::TypeRef resolveType(std::optional<schema::TypeRef> const& type) {
            if (!type.has_value())
                return schema::TypeRef::named("String");
            return type->clone();
        }

        // reverses the escaping applied to string values by the grammar
        std::string unquote(std::string_view text) {
            if (text.size() < 2 || text.front() != '"' || text.back() != '"')
                return std::string(text);

            std::string result;
            text = text.substr(1, text.size() - 2);
            for (size_t i = 0; i != text.size(); ++i) {
                if (text[i] != '\\' || i + 1 == text.size()) {
                    result.push_back(text[i]);
                    continue;
                }

                switch (text[++i]) {
                case 'n': result.push_back('\n'); break;
                case 'r': result.push_back('\r'); break;
                case 't': result.push_back('\t'); break;
                default: result.push_back(text[i]); break;
                }
            }
            return result;
        }

        template <typename DefT>
        DefT* findByName(std::vector<DefT>& defs, std::string const& name) {
            auto const it = std::find_if(defs.begin(), defs.end(), [&name](DefT const& def) { return def.name == name; });
            return it != defs.end() ? &*it : nullptr;
        }
    }

    schema::ParsedSchema parseSchema(std::string_view sdl, Log& log, fs::path const& filename) {
        schema::ParsedSchema result;

        for (auto const* builtin : schema::builtinScalars)
            result.typeKinds.insert({ builtin, schema::TypeKind::Scalar });

        auto const doc = parse(sdl, filename, log);

        Compiler compiler{ log, result };
        compiler.build(*doc);
        return result;
    }

    void Compiler::build(ast::Document const& doc) {
        // root names must be known before any object is routed
        for (auto const& def : doc.definitions)
            if (def->kind == ast::Definition::Kind::Schema)
                configureRoots(static_cast<ast::SchemaDecl const&>(*def));

        for (auto const& def : doc.definitions)
            build(*def);
    }

    void Compiler::configureRoots(ast::SchemaDecl const& schemaDecl) {
        for (auto const& op : schemaDecl.operations) {
            if (op.operation.id == "query"sv)
                result.queryRoot = op.type.id;
            else if (op.operation.id == "mutation"sv)
                result.mutationRoot = op.type.id;
            else if (op.operation.id != "subscription"sv)
                log.warn(op.operation.loc, "unknown operation type `", op.operation, '\'');
        }
    }

    void Compiler::build(ast::Definition const& def) {
        switch (def.kind) {
        case ast::Definition::Kind::Scalar:
            return build(static_cast<ast::ScalarDecl const&>(def));
        case ast::Definition::Kind::Object:
            return build(static_cast<ast::ObjectDecl const&>(def));
        case ast::Definition::Kind::Interface:
            declare(def, schema::TypeKind::Interface);
            break;
        case ast::Definition::Kind::Union:
            declare(def, schema::TypeKind::Union);
            break;
        case ast::Definition::Kind::Enum:
            return build(static_cast<ast::EnumDecl const&>(def));
        case ast::Definition::Kind::InputObject:
            return build(static_cast<ast::InputDecl const&>(def));
        case ast::Definition::Kind::Schema:
        case ast::Definition::Kind::Directive:
            break;
        }
    }

    // Registers the definition's name. Returns false if the name is already
    // taken by a different kind of type, in which case the definition is ignored.
    bool Compiler::declare(ast::Definition const& def, schema::TypeKind kind) {
        auto const [it, inserted] = result.typeKinds.insert({ def.name.id, kind });
        if (inserted || it->second == kind)
            return true;

        log.warn(def.name.loc, "`", def.name, "' redeclared as ", kind, ", previously declared as ", it->second);
        return false;
    }

    void Compiler::build(ast::ScalarDecl const& scalarDecl) {
        if (!declare(scalarDecl, schema::TypeKind::Scalar))
            return;

        if (schema::isBuiltinScalar(scalarDecl.name.id) || findByName(result.scalars, scalarDecl.name.id) != nullptr)
            return;

        auto& scalar = result.scalars.emplace_back();
        scalar.name = scalarDecl.name.id;
        scalar.description = scalarDecl.description;
    }

    void Compiler::build(ast::ObjectDecl const& objectDecl) {
        if (!declare(objectDecl, schema::TypeKind::Object))
            return;

        if (auto* const fields = rootFields(objectDecl.name.id); fields != nullptr) {
            for (auto const& field : objectDecl.fields)
                fields->push_back(translate(field));
            return;
        }

        auto* obj = findByName(result.objects, objectDecl.name.id);
        if (obj == nullptr) {
            obj = &result.objects.emplace_back();
            obj->name = objectDecl.name.id;
        }
        else if (!objectDecl.extension) {
            log.warn(objectDecl.name.loc, "type `", objectDecl.name, "' defined more than once; fields are merged");
        }

        if (!obj->description.has_value())
            obj->description = objectDecl.description;

        for (auto const& iface : objectDecl.interfaces)
            if (std::find(obj->interfaces.begin(), obj->interfaces.end(), iface.id) == obj->interfaces.end())
                obj->interfaces.push_back(iface.id);

        for (auto const& field : objectDecl.fields)
            obj->fields.push_back(translate(field));
    }

    void Compiler::build(ast::EnumDecl const& enumDecl) {
        if (!declare(enumDecl, schema::TypeKind::Enum))
            return;

        auto* def = findByName(result.enums, enumDecl.name.id);
        if (def == nullptr) {
            def = &result.enums.emplace_back();
            def->name = enumDecl.name.id;
        }
        else if (!enumDecl.extension) {
            log.warn(enumDecl.name.loc, "enum `", enumDecl.name, "' defined more than once; values are merged");
        }

        if (!def->description.has_value())
            def->description = enumDecl.description;

        for (auto const& value : enumDecl.values)
            def->values.push_back(translate(value));
    }

    void Compiler::build(ast::InputDecl const& inputDecl) {
        if (!declare(inputDecl, schema::TypeKind::InputObject))
            return;

        auto* def = findByName(result.inputs, inputDecl.name.id);
        if (def == nullptr) {
            def = &result.inputs.emplace_back();
            def->name = inputDecl.name.id;
        }
        else if (!inputDecl.extension) {
            log.warn(inputDecl.name.loc, "input `", inputDecl.name, "' defined more than once; fields are merged");
        }

        if (!def->description.has_value())
            def->description = inputDecl.description;

        for (auto const& value : inputDecl.fields)
            def->fields.push_back(translateInput(value));
    }

    schema::FieldDef Compiler::translate(ast::Field const& field) {
        schema::FieldDef def;
        def.name = field.name.id;
        def.description = field.description;
        def.type = resolveType(field.type);
        def.deprecated = ast::findDirective(field.directives, "deprecated"sv) != nullptr;
        for (auto const& arg : field.arguments)
            def.arguments.push_back(translate(arg));
        return def;
    }

    schema::FieldDef Compiler::translateInput(ast::InputValue const& value) {
        schema::FieldDef def;
        def.name = value.name.id;
        def.description = value.description;
        def.type = resolveType(value.type);
        def.deprecated = ast::findDirective(value.directives, "deprecated"sv) != nullptr;
        return def;
    }

    schema::ArgumentDef Compiler::translate(ast::InputValue const& value) {
        schema::ArgumentDef def;
        def.name = value.name.id;
        def.description = value.description;
        def.type = resolveType(value.type);
        def.defaultValue = value.defaultValue;
        return def;
    }

    schema::EnumValueDef Compiler::translate(ast::EnumValue const& value) {
        schema::EnumValueDef def;
        def.name = value.name.id;
        def.description = value.description;

        if (auto const* deprecated = ast::findDirective(value.directives, "deprecated"sv); deprecated != nullptr) {
            def.deprecated = true;
            for (auto const& arg : deprecated->args)
                if (arg.name.id == "reason"sv)
                    def.deprecationReason = unquote(arg.value);
        }
        return def;
    }

    std::vector<schema::FieldDef>* Compiler::rootFields(std::string const& name) {
        if (name == result.queryRoot)
            return &result.queryFields;
        if (name == result.mutationRoot)
            return &result.mutationFields;
        return nullptr;
    }
}
