// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "box.hh"
#include "timestamp.hh"

#include <optional>
#include <string>
#include <type_traits>

namespace gqlc {
    // Whether a projection may declare a field as Projected when the full
    // type declares it as Full. Only narrowing is allowed: a projection may
    // drop optionality and indirection, or take a timestamp as its wire string.
    template <typename Full, typename Projected>
    struct IsCompatible : std::false_type {};

    template <typename T>
    struct IsCompatible<T, T> : std::true_type {};

    template <typename T>
    struct IsCompatible<std::optional<T>, T> : std::true_type {};

    template <typename T>
    struct IsCompatible<std::optional<Box<T>>, T> : std::true_type {};

    template <typename T>
    struct IsCompatible<std::optional<Box<T>>, std::optional<T>> : std::true_type {};

    template <>
    struct IsCompatible<Timestamp, std::string> : std::true_type {};

    template <>
    struct IsCompatible<std::optional<Timestamp>, std::optional<std::string>> : std::true_type {};

    template <>
    struct IsCompatible<std::optional<Timestamp>, std::string> : std::true_type {};

    template <typename Full, typename Projected>
    inline constexpr bool isCompatible = IsCompatible<Full, Projected>::value;
}
