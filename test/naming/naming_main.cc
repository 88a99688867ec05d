#undef NDEBUG

#include "naming.hh"

#include <cassert>
#include <string>
#include <string_view>

using namespace std::literals;

namespace {
    template <std::size_t N>
    constexpr bool wireIs(char const (&ident)[N], std::string_view expected) {
        return gqlc::wireName(ident).view() == expected;
    }
}

int main() {
    static_assert(wireIs("id", "id"));
    static_assert(wireIs("created_at", "createdAt"));
    static_assert(wireIs("has_next_page", "hasNextPage"));
    static_assert(wireIs("default_", "default"));
    static_assert(wireIs("class_", "class"));
    static_assert(wireIs("sub_issue_", "subIssue"));
    static_assert(wireIs("Title", "title"));
    static_assert(wireIs("alreadyCamel", "alreadyCamel"));
    static_assert(wireIs("_leading", "leading"));
    static_assert(wireIs("a__b", "aB"));
    static_assert(wireIs("ID", "id"));
    static_assert(wireIs("url_ID", "urlId"));
    static_assert(wireIs("issue_URL_path", "issueUrlPath"));
    static_assert(wireIs("team_id", "teamId"));
    static_assert(wireIs("issueID", "issueID"));

    // applying the conversion to its own output changes nothing
    for (auto const ident : { "created_at"sv, "default_"sv, "url_id"sv, "ID"sv, "x"sv, "sort_order_"sv, "a_b_c"sv, "url_ID"sv, "HTTP"sv, "issueID"sv }) {
        auto const once = gqlc::toWireName(ident);
        assert(gqlc::toWireName(once) == once);
    }

    assert(gqlc::toWireName("created_at") == "createdAt");
    assert(gqlc::toWireName("") == "");

    static_assert(gqlc::isCppKeyword("class"));
    static_assert(gqlc::isCppKeyword("default"));
    static_assert(!gqlc::isCppKeyword("type"));
    static_assert(!gqlc::isCppKeyword("state"));

    assert(gqlc::safeIdent("namespace") == "namespace_");
    assert(gqlc::safeIdent("priority") == "priority");

    // escaping for C++ never leaks into the wire name
    assert(gqlc::toWireName(gqlc::safeIdent("delete")) == "delete");
    assert(gqlc::toWireName(gqlc::safeIdent("union")) == "union");
}
