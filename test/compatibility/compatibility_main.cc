#undef NDEBUG

#include "compatibility.hh"

#include <cassert>
#include <optional>
#include <string>
#include <utility>

using gqlc::Box;
using gqlc::isCompatible;
using gqlc::Timestamp;

using std::optional;
using std::string;

int main() {
    // identity
    static_assert(isCompatible<int, int>);
    static_assert(isCompatible<string, string>);
    static_assert(isCompatible<optional<int>, optional<int>>);
    static_assert(isCompatible<optional<Box<int>>, optional<Box<int>>>);

    // narrowing
    static_assert(isCompatible<optional<int>, int>);
    static_assert(isCompatible<optional<Box<string>>, string>);
    static_assert(isCompatible<optional<Box<string>>, optional<string>>);

    // timestamps travel as strings
    static_assert(isCompatible<Timestamp, string>);
    static_assert(isCompatible<optional<Timestamp>, optional<string>>);
    static_assert(isCompatible<optional<Timestamp>, string>);
    static_assert(isCompatible<optional<Timestamp>, Timestamp>);

    // widening is never allowed
    static_assert(!isCompatible<int, optional<int>>);
    static_assert(!isCompatible<string, optional<string>>);
    static_assert(!isCompatible<string, optional<Box<string>>>);
    static_assert(!isCompatible<optional<string>, optional<Box<string>>>);
    static_assert(!isCompatible<string, Timestamp>);
    static_assert(!isCompatible<optional<string>, optional<Timestamp>>);
    static_assert(!isCompatible<string, optional<Timestamp>>);

    // different underlying types
    static_assert(!isCompatible<int, string>);
    static_assert(!isCompatible<optional<int>, string>);
    static_assert(!isCompatible<optional<Box<string>>, int>);
    static_assert(!isCompatible<optional<Box<string>>, optional<int>>);
    static_assert(!isCompatible<optional<int>, optional<string>>);

    // one level of stripping at a time
    static_assert(!isCompatible<optional<optional<int>>, int>);
    static_assert(!isCompatible<Box<int>, int>);
    static_assert(!isCompatible<optional<Box<Timestamp>>, string>);

    // Box copies deeply
    Box<string> original{ string("a") };
    Box<string> copy = original;
    *copy = "b";
    assert(*original == "a");

    // moved-from boxes stay usable
    Box<string> moved = std::move(copy);
    assert(*moved == "b");
    assert(copy.get() != nullptr);
    assert(copy->empty());
    Box<string> again = copy;
    assert(again->empty());
    *copy = "c";
    assert(*copy == "c" && *moved == "b");

    Box<string> target{ string("t") };
    target = std::move(moved);
    assert(*target == "b");
    assert(moved.get() != nullptr);
    copy = moved;
    assert(*copy == "t");

    // optional<Box> moves keep the source engaged with a valid value
    optional<Box<string>> source{ Box<string>{ string("x") } };
    optional<Box<string>> sink = std::move(source);
    assert(source.has_value() && source->get() != nullptr);
    assert(**sink == "x");
    return 0;
}
