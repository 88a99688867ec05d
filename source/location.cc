// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "location.hh"

#include <ostream>

namespace gqlc {
    std::ostream& operator<<(std::ostream& os, Location const& loc) {
        os << loc.filename.string();
        if (loc.start.line > 0 && loc.start.column > 0)
            os << '(' << loc.start.line << ',' << loc.start.column << ')';
        else if (loc.start.line > 0)
            os << '(' << loc.start.line << ')';
        return os;
    }
}
