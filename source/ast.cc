// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "ast.hh"

#include <ostream>

namespace gqlc::ast {
    std::ostream& operator<<(std::ostream& os, Identifier const& id) {
        return os << id.id;
    }

    Directive const* findDirective(std::vector<Directive> const& directives, std::string_view name) noexcept {
        for (auto const& directive : directives)
            if (directive.name.id == name)
                return &directive;
        return nullptr;
    }
}
