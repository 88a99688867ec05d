// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "schema.hh"

#include <algorithm>
#include <ostream>

namespace gqlc::schema {
    std::ostream& operator<<(std::ostream& os, TypeKind kind) {
        switch (kind) {
        case TypeKind::Scalar: return os << "scalar";
        case TypeKind::Enum: return os << "enum";
        case TypeKind::Object: return os << "object";
        case TypeKind::InputObject: return os << "input";
        case TypeKind::Interface: return os << "interface";
        case TypeKind::Union: return os << "union";
        default: return os << "[unknown-type-kind]";
        }
    }

    TypeRef TypeRef::named(std::string name) {
        TypeRef ref;
        ref.kind = Kind::Named;
        ref.name = std::move(name);
        return ref;
    }

    TypeRef TypeRef::list(TypeRef inner) {
        TypeRef ref;
        ref.kind = Kind::List;
        ref.ofType = std::make_unique<TypeRef>(std::move(inner));
        return ref;
    }

    TypeRef TypeRef::nonNull(TypeRef inner) {
        TypeRef ref;
        ref.kind = Kind::NonNull;
        ref.ofType = std::make_unique<TypeRef>(std::move(inner));
        return ref;
    }

    std::string const& TypeRef::baseName() const noexcept {
        auto const* ref = this;
        while (ref->kind != Kind::Named && ref->ofType != nullptr)
            ref = ref->ofType.get();
        return ref->name;
    }

    bool TypeRef::isList() const noexcept {
        if (kind == Kind::NonNull && ofType != nullptr)
            return ofType->isList();
        return kind == Kind::List;
    }

    TypeRef TypeRef::clone() const {
        TypeRef copy;
        copy.kind = kind;
        copy.name = name;
        if (ofType != nullptr)
            copy.ofType = std::make_unique<TypeRef>(ofType->clone());
        return copy;
    }

    std::ostream& operator<<(std::ostream& os, TypeRef const& ref) {
        switch (ref.kind) {
        case TypeRef::Kind::Named:
            return os << ref.name;
        case TypeRef::Kind::List:
            os << '[';
            if (ref.ofType != nullptr)
                os << *ref.ofType;
            return os << ']';
        case TypeRef::Kind::NonNull:
            if (ref.ofType != nullptr)
                os << *ref.ofType;
            return os << '!';
        default:
            return os << "???";
        }
    }

    std::optional<TypeKind> ParsedSchema::kindOf(std::string const& name) const {
        auto const it = typeKinds.find(name);
        if (it == typeKinds.end())
            return std::nullopt;
        return it->second;
    }

    ObjectDef const* ParsedSchema::findObject(std::string const& name) const {
        auto const it = std::find_if(objects.begin(), objects.end(), [&name](ObjectDef const& def) { return def.name == name; });
        return it != objects.end() ? &*it : nullptr;
    }

    EnumDef const* ParsedSchema::findEnum(std::string const& name) const {
        auto const it = std::find_if(enums.begin(), enums.end(), [&name](EnumDef const& def) { return def.name == name; });
        return it != enums.end() ? &*it : nullptr;
    }

    InputDef const* ParsedSchema::findInput(std::string const& name) const {
        auto const it = std::find_if(inputs.begin(), inputs.end(), [&name](InputDef const& def) { return def.name == name; });
        return it != inputs.end() ? &*it : nullptr;
    }

    bool isBuiltinScalar(std::string const& name) noexcept {
        for (auto const* builtin : builtinScalars)
            if (name == builtin)
                return true;
        return false;
    }
}
