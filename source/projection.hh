// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "box.hh"
#include "compatibility.hh"
#include "naming.hh"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

// A projection is any class exposing its GraphQL shape as
//
//     static constexpr auto graphqlFields() {
//         return gqlc::fields(GQLC_FIELD(Issue, id), GQLC_NESTED(Issue, state));
//     }
//
// and optionally `using FullType = X;' naming the exhaustive type it narrows.
// With a FullType, every field must exist on X, and plain fields must have a
// type compatible with X's declaration (see IsCompatible).

#define GQLC_FIELD(Type, member) ::gqlc::field<&Type::member>(::gqlc::wireName(#member))
#define GQLC_NESTED(Type, member) ::gqlc::nested<&Type::member>(::gqlc::wireName(#member))
#define GQLC_REFERENCE(Type, member) ::gqlc::reference<&Type::member>(::gqlc::wireName(#member))

#define GQLC_VERIFY(Type) static_assert(::gqlc::verify<Type>(), "gqlc: " #Type " is not a valid projection of its FullType")

namespace gqlc {
    enum class FieldKind {
        Plain,     // scalar or enum, selected by name
        Nested,    // object selected through its own projection
        Reference, // exists on the type but is not selected
    };

    namespace _detail {
        template <typename M>
        struct MemberTraits;

        template <typename C, typename M>
        struct MemberTraits<M C::*> {
            using Owner = C;
            using Type = M;
        };
    }

    template <auto Member, FieldKind Kind, std::size_t N>
    struct FieldInfo {
        using Owner = typename _detail::MemberTraits<decltype(Member)>::Owner;
        using Type = typename _detail::MemberTraits<decltype(Member)>::Type;

        static constexpr auto member = Member;
        static constexpr FieldKind kind = Kind;

        FixedName<N> name;

        constexpr std::string_view wireName() const noexcept { return name.view(); }
    };

    template <auto Member, std::size_t N>
    constexpr FieldInfo<Member, FieldKind::Plain, N> field(FixedName<N> const& name) { return { name }; }
    template <auto Member, std::size_t N>
    constexpr FieldInfo<Member, FieldKind::Plain, N> field(char const (&name)[N]) { return { FixedName<N>(name) }; }

    template <auto Member, std::size_t N>
    constexpr FieldInfo<Member, FieldKind::Nested, N> nested(FixedName<N> const& name) { return { name }; }
    template <auto Member, std::size_t N>
    constexpr FieldInfo<Member, FieldKind::Nested, N> nested(char const (&name)[N]) { return { FixedName<N>(name) }; }

    template <auto Member, std::size_t N>
    constexpr FieldInfo<Member, FieldKind::Reference, N> reference(FixedName<N> const& name) { return { name }; }
    template <auto Member, std::size_t N>
    constexpr FieldInfo<Member, FieldKind::Reference, N> reference(char const (&name)[N]) { return { FixedName<N>(name) }; }

    template <typename... Fields>
    constexpr std::tuple<Fields...> fields(Fields const&... infos) { return { infos... }; }

    // strips optional, vector and Box down to the projected record type
    template <typename T>
    struct Unwrap { using type = T; };
    template <typename T>
    struct Unwrap<std::optional<T>> : Unwrap<T> {};
    template <typename T, typename A>
    struct Unwrap<std::vector<T, A>> : Unwrap<T> {};
    template <typename T>
    struct Unwrap<Box<T>> : Unwrap<T> {};

    template <typename T>
    using unwrap_t = typename Unwrap<T>::type;

    template <typename T, typename = void>
    struct HasFullType : std::false_type {};
    template <typename T>
    struct HasFullType<T, std::void_t<typename T::FullType>> : std::true_type {};

    template <typename T, typename = void>
    struct IsProjection : std::false_type {};
    template <typename T>
    struct IsProjection<T, std::void_t<decltype(T::graphqlFields())>> : std::true_type {};

    template <typename T>
    inline constexpr bool isProjection = IsProjection<T>::value;

    namespace _detail {
        inline constexpr std::size_t npos = static_cast<std::size_t>(-1);

        template <typename T>
        inline constexpr auto fieldsOf = T::graphqlFields();

        template <typename T>
        using FieldTuple = std::remove_cv_t<decltype(fieldsOf<T>)>;

        template <typename T>
        inline constexpr std::size_t fieldCount = std::tuple_size_v<FieldTuple<T>>;

        template <typename T, std::size_t... Is>
        constexpr std::size_t findFieldImpl(std::string_view name, std::index_sequence<Is...>) {
            std::size_t result = npos;
            ((result == npos && std::get<Is>(fieldsOf<T>).wireName() == name ? (result = Is, true) : false), ...);
            return result;
        }

        // index of the field with the given wire name in T's descriptors, or npos
        template <typename T>
        constexpr std::size_t findField(std::string_view name) {
            return findFieldImpl<T>(name, std::make_index_sequence<fieldCount<T>>{});
        }

        // The template arguments of the two checks below show up in the
        // compiler's instantiation backtrace and identify the offending field.
        template <typename Projection, typename Full, auto ProjectedMember, bool Found>
        struct CheckFieldExists {
            static_assert(Found, "gqlc: projected field does not exist on the FullType");
            static constexpr bool value = Found;
        };

        template <typename Projection, typename Full, auto ProjectedMember, auto FullMember, typename FullFieldType, typename ProjectedFieldType>
        struct CheckFieldCompatible {
            static constexpr bool value = isCompatible<FullFieldType, ProjectedFieldType>;
            static_assert(value, "gqlc: projected field type is not compatible with the FullType field type");
        };

        template <typename T, std::size_t I>
        constexpr bool verifyField() {
            using Full = typename T::FullType;
            using Projected = std::tuple_element_t<I, FieldTuple<T>>;

            constexpr std::size_t index = findField<Full>(std::get<I>(fieldsOf<T>).wireName());
            if constexpr (index == npos) {
                return CheckFieldExists<T, Full, Projected::member, false>::value;
            }
            else if constexpr (Projected::kind == FieldKind::Plain) {
                using FullInfo = std::tuple_element_t<index, FieldTuple<Full>>;
                return CheckFieldCompatible<T, Full, Projected::member, FullInfo::member, typename FullInfo::Type, typename Projected::Type>::value;
            }
            else {
                // nested projections verify themselves against their own FullType
                return true;
            }
        }

        template <typename T, std::size_t... Is>
        constexpr bool verifyFields(std::index_sequence<Is...>) {
            return (verifyField<T, Is>() && ... && true);
        }
    }

    template <typename T>
    constexpr bool verify() {
        static_assert(isProjection<T>, "gqlc: type has no static constexpr graphqlFields()");

        if constexpr (HasFullType<T>::value)
            return _detail::verifyFields<T>(std::make_index_sequence<_detail::fieldCount<T>>{});
        else
            return true;
    }

    template <typename T>
    std::string selection();

    namespace _detail {
        template <auto Member, FieldKind Kind, std::size_t N>
        void appendSelection(std::string& out, FieldInfo<Member, Kind, N> const& info) {
            if constexpr (Kind == FieldKind::Reference) {
                return;
            }
            else {
                if (!out.empty())
                    out.push_back(' ');
                out.append(info.wireName());

                if constexpr (Kind == FieldKind::Nested) {
                    using Inner = unwrap_t<typename FieldInfo<Member, Kind, N>::Type>;
                    static_assert(isProjection<Inner>, "gqlc: nested field type is not a projection");

                    out.append(" { ");
                    out.append(selection<Inner>());
                    out.append(" }");
                }
            }
        }
    }

    // Selection set text for T: plain fields by wire name in declaration order,
    // nested fields as `name { inner }', reference fields omitted.
    template <typename T>
    std::string selection() {
        static_assert(verify<T>(), "gqlc: invalid projection");

        std::string result;
        std::apply([&result](auto const&... infos) { (_detail::appendSelection(result, infos), ...); }, _detail::fieldsOf<T>);
        return result;
    }
}
