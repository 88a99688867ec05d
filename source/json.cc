// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "json.hh"
#include "schema.hh"

#include <algorithm>
#include <sstream>
#include <utility>

namespace gqlc {
    namespace schema {
        template <typename JsonT>
        void to_json(JsonT& j, TypeKind kind);
        template <typename JsonT>
        void to_json(JsonT& j, TypeRef const& ref);
        template <typename JsonT>
        void to_json(JsonT& j, ArgumentDef const& arg);
        template <typename JsonT>
        void to_json(JsonT& j, FieldDef const& field);
        template <typename JsonT>
        void to_json(JsonT& j, EnumDef const& def);
        template <typename JsonT>
        void to_json(JsonT& j, ObjectDef const& def);
        template <typename JsonT>
        void to_json(JsonT& j, InputDef const& def);
        template <typename JsonT>
        void to_json(JsonT& j, ScalarDef const& def);
    }

    nlohmann::ordered_json serializeToJson(schema::ParsedSchema const& schema) {
        using JsonT = nlohmann::ordered_json;

        auto doc = JsonT::object();

        auto roots_json = JsonT::object();
        roots_json["query"] = schema.queryRoot;
        roots_json["mutation"] = schema.mutationRoot;
        doc["roots"] = std::move(roots_json);

        auto scalars_json = JsonT::array();
        for (auto const& scalar : schema.scalars)
            scalars_json.push_back(scalar);
        doc["scalars"] = std::move(scalars_json);

        auto enums_json = JsonT::array();
        for (auto const& def : schema.enums)
            enums_json.push_back(def);
        doc["enums"] = std::move(enums_json);

        auto objects_json = JsonT::array();
        for (auto const& def : schema.objects)
            objects_json.push_back(def);
        doc["objects"] = std::move(objects_json);

        auto inputs_json = JsonT::array();
        for (auto const& def : schema.inputs)
            inputs_json.push_back(def);
        doc["inputs"] = std::move(inputs_json);

        auto query_json = JsonT::array();
        for (auto const& field : schema.queryFields)
            query_json.push_back(field);
        doc["queryFields"] = std::move(query_json);

        auto mutation_json = JsonT::array();
        for (auto const& field : schema.mutationFields)
            mutation_json.push_back(field);
        doc["mutationFields"] = std::move(mutation_json);

        // the kind map is unordered in memory; sort for stable output
        std::vector<std::pair<std::string, schema::TypeKind>> kinds(schema.typeKinds.begin(), schema.typeKinds.end());
        std::sort(kinds.begin(), kinds.end(), [](auto const& lhs, auto const& rhs) { return lhs.first < rhs.first; });

        auto kinds_json = JsonT::object();
        for (auto const& [name, kind] : kinds)
            kinds_json[name] = kind;
        doc["typeKinds"] = std::move(kinds_json);

        return doc;
    }

    template <typename JsonT>
    void schema::to_json(JsonT& j, TypeKind kind) {
        std::ostringstream buf;
        buf << kind;
        j = buf.str();
    }

    template <typename JsonT>
    void schema::to_json(JsonT& j, TypeRef const& ref) {
        j = JsonT::object();
        switch (ref.kind) {
        case TypeRef::Kind::Named:
            j["kind"] = "named";
            j["name"] = ref.name;
            break;
        case TypeRef::Kind::List:
            j["kind"] = "list";
            if (ref.ofType != nullptr)
                j["ofType"] = *ref.ofType;
            break;
        case TypeRef::Kind::NonNull:
            j["kind"] = "nonNull";
            if (ref.ofType != nullptr)
                j["ofType"] = *ref.ofType;
            break;
        }

        std::ostringstream buf;
        buf << ref;
        j["sdl"] = buf.str();
    }

    template <typename JsonT>
    void schema::to_json(JsonT& arg_json, ArgumentDef const& arg) {
        arg_json = JsonT::object();
        arg_json["name"] = arg.name;
        if (arg.description)
            arg_json["description"] = *arg.description;
        arg_json["type"] = arg.type;
        if (arg.defaultValue)
            arg_json["default"] = *arg.defaultValue;
    }

    template <typename JsonT>
    void schema::to_json(JsonT& field_json, FieldDef const& field) {
        field_json = JsonT::object();
        field_json["name"] = field.name;
        if (field.description)
            field_json["description"] = *field.description;
        field_json["type"] = field.type;

        if (!field.arguments.empty()) {
            auto args_json = JsonT::array();
            for (auto const& arg : field.arguments)
                args_json.push_back(arg);
            field_json["arguments"] = std::move(args_json);
        }

        if (field.deprecated)
            field_json["deprecated"] = true;
    }

    template <typename JsonT>
    void schema::to_json(JsonT& enum_json, EnumDef const& def) {
        enum_json = JsonT::object();
        enum_json["name"] = def.name;
        if (def.description)
            enum_json["description"] = *def.description;

        auto values_json = JsonT::array();
        for (auto const& value : def.values) {
            auto value_json = JsonT::object();
            value_json["name"] = value.name;
            if (value.description)
                value_json["description"] = *value.description;
            if (value.deprecated)
                value_json["deprecated"] = value.deprecationReason ? JsonT(*value.deprecationReason) : JsonT(true);
            values_json.push_back(std::move(value_json));
        }
        enum_json["values"] = std::move(values_json);
    }

    template <typename JsonT>
    void schema::to_json(JsonT& obj_json, ObjectDef const& def) {
        obj_json = JsonT::object();
        obj_json["name"] = def.name;
        if (def.description)
            obj_json["description"] = *def.description;
        if (!def.interfaces.empty())
            obj_json["interfaces"] = def.interfaces;

        auto fields_json = JsonT::array();
        for (auto const& field : def.fields)
            fields_json.push_back(field);
        obj_json["fields"] = std::move(fields_json);
    }

    template <typename JsonT>
    void schema::to_json(JsonT& input_json, InputDef const& def) {
        input_json = JsonT::object();
        input_json["name"] = def.name;
        if (def.description)
            input_json["description"] = *def.description;

        auto fields_json = JsonT::array();
        for (auto const& field : def.fields)
            fields_json.push_back(field);
        input_json["fields"] = std::move(fields_json);
    }

    template <typename JsonT>
    void schema::to_json(JsonT& scalar_json, ScalarDef const& def) {
        scalar_json = JsonT::object();
        scalar_json["name"] = def.name;
        if (def.description)
            scalar_json["description"] = *def.description;
    }
}
