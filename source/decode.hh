// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "box.hh"
#include "projection.hh"
#include "timestamp.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

// Response decoding for projections. Members absent from the response, or
// null, keep their current value. On failure out_error holds the path to the
// offending value followed by the problem, e.g. `.state.name: expected string, got number'.

namespace gqlc {
    template <typename T>
    bool decode(nlohmann::json const& j, T& out, std::string& out_error);
    template <typename T>
    bool decode(nlohmann::json const& j, std::optional<T>& out, std::string& out_error);
    template <typename T, typename A>
    bool decode(nlohmann::json const& j, std::vector<T, A>& out, std::string& out_error);
    template <typename T>
    bool decode(nlohmann::json const& j, Box<T>& out, std::string& out_error);
    inline bool decode(nlohmann::json const& j, Timestamp& out, std::string& out_error);

    namespace _detail {
        template <typename T>
        inline constexpr bool alwaysFalse = false;

        inline bool expected(char const* what, nlohmann::json const& j, std::string& out_error) {
            out_error = ": expected ";
            out_error += what;
            out_error += ", got ";
            out_error += j.type_name();
            return false;
        }

        template <typename T, auto Member, FieldKind Kind, std::size_t N>
        bool decodeMember(nlohmann::json const& j, T& out, FieldInfo<Member, Kind, N> const& info, std::string& out_error) {
            auto const it = j.find(std::string(info.wireName()));
            if (it == j.end() || it->is_null())
                return true;

            if (decode(*it, out.*Member, out_error))
                return true;

            out_error = "." + std::string(info.wireName()) + out_error;
            return false;
        }
    }

    template <typename T>
    bool decode(nlohmann::json const& j, T& out, std::string& out_error) {
        if constexpr (isProjection<T>) {
            static_assert(verify<T>(), "gqlc: invalid projection");

            if (!j.is_object())
                return _detail::expected("object", j, out_error);

            return std::apply([&](auto const&... infos) { return (_detail::decodeMember(j, out, infos, out_error) && ... && true); }, _detail::fieldsOf<T>);
        }
        else if constexpr (std::is_same_v<T, nlohmann::json>) {
            out = j;
            return true;
        }
        else if constexpr (std::is_enum_v<T>) {
            if (!j.is_string())
                return _detail::expected("enum value", j, out_error);
            out = j.get<T>();
            return true;
        }
        else if constexpr (std::is_same_v<T, bool>) {
            if (!j.is_boolean())
                return _detail::expected("boolean", j, out_error);
            out = j.get<bool>();
            return true;
        }
        else if constexpr (std::is_integral_v<T>) {
            if (!j.is_number_integer())
                return _detail::expected("integer", j, out_error);

            if (j.is_number_unsigned()) {
                auto const value = j.get<std::uint64_t>();
                if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                    return _detail::expected("integer in range", j, out_error);
                out = static_cast<T>(value);
                return true;
            }

            auto const value = j.get<std::int64_t>();
            if constexpr (std::is_signed_v<T>) {
                if (value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max())
                    return _detail::expected("integer in range", j, out_error);
            }
            else {
                if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max())
                    return _detail::expected("integer in range", j, out_error);
            }
            out = static_cast<T>(value);
            return true;
        }
        else if constexpr (std::is_floating_point_v<T>) {
            if (!j.is_number())
                return _detail::expected("number", j, out_error);
            out = j.get<T>();
            return true;
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            if (!j.is_string())
                return _detail::expected("string", j, out_error);
            out = j.get<std::string>();
            return true;
        }
        else {
            static_assert(_detail::alwaysFalse<T>, "gqlc: no decoder for this type");
            return false;
        }
    }

    template <typename T>
    bool decode(nlohmann::json const& j, std::optional<T>& out, std::string& out_error) {
        if (j.is_null()) {
            out.reset();
            return true;
        }

        T value{};
        if (out.has_value())
            value = *out;
        if (!decode(j, value, out_error))
            return false;
        out = std::move(value);
        return true;
    }

    template <typename T, typename A>
    bool decode(nlohmann::json const& j, std::vector<T, A>& out, std::string& out_error) {
        if (!j.is_array())
            return _detail::expected("array", j, out_error);

        std::vector<T, A> values;
        values.reserve(j.size());
        for (std::size_t index = 0; index != j.size(); ++index) {
            if (!decode(j[index], values.emplace_back(), out_error)) {
                out_error = "[" + std::to_string(index) + "]" + out_error;
                return false;
            }
        }
        out = std::move(values);
        return true;
    }

    template <typename T>
    bool decode(nlohmann::json const& j, Box<T>& out, std::string& out_error) {
        return decode(j, *out, out_error);
    }

    inline bool decode(nlohmann::json const& j, Timestamp& out, std::string& out_error) {
        if (!j.is_string())
            return _detail::expected("timestamp string", j, out_error);
        if (!parseTimestamp(j.get_ref<std::string const&>(), out)) {
            out_error = ": invalid timestamp `" + j.get<std::string>() + "'";
            return false;
        }
        return true;
    }
}
