#undef NDEBUG

#include "box.hh"
#include "projection.hh"
#include "query.hh"
#include "timestamp.hh"

#include <cassert>
#include <optional>
#include <string>
#include <vector>

// exhaustive shapes, as a generator would write them
struct FullState {
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> color;

    static constexpr auto graphqlFields() {
        return gqlc::fields(gqlc::field<&FullState::id>("id"), gqlc::field<&FullState::name>("name"), gqlc::field<&FullState::color>("color"));
    }
};

struct FullIssue {
    std::optional<std::string> id;
    std::optional<std::string> title;
    std::optional<double> priority;
    std::optional<gqlc::Timestamp> createdAt;
    std::optional<gqlc::Box<std::string>> branchName;
    std::optional<gqlc::Box<FullState>> state;
    std::optional<gqlc::Box<FullIssue>> parent;

    static constexpr auto graphqlFields() {
        return gqlc::fields(
            gqlc::field<&FullIssue::id>("id"),
            gqlc::field<&FullIssue::title>("title"),
            gqlc::field<&FullIssue::priority>("priority"),
            gqlc::field<&FullIssue::createdAt>("createdAt"),
            gqlc::field<&FullIssue::branchName>("branchName"),
            gqlc::reference<&FullIssue::state>("state"),
            gqlc::reference<&FullIssue::parent>("parent"));
    }
};

// lean projections
struct StateRef {
    using FullType = FullState;

    std::string name;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(StateRef, name)); }
};
GQLC_VERIFY(StateRef);

struct IssueSummary {
    std::string id;
    StateRef state;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(IssueSummary, id), GQLC_NESTED(IssueSummary, state)); }
};

struct IssueDetail {
    using FullType = FullIssue;

    std::string id;
    std::optional<std::string> title;
    std::string created_at;
    std::string branch_name;
    std::optional<StateRef> state;

    static constexpr auto graphqlFields() {
        return gqlc::fields(
            GQLC_FIELD(IssueDetail, id),
            GQLC_FIELD(IssueDetail, title),
            GQLC_FIELD(IssueDetail, created_at),
            GQLC_FIELD(IssueDetail, branch_name),
            GQLC_NESTED(IssueDetail, state));
    }
};
GQLC_VERIFY(IssueDetail);

struct Inner {
    int a = 0;
    int b = 0;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(Inner, a), GQLC_FIELD(Inner, b)); }
};

struct Outer {
    std::vector<gqlc::Box<Inner>> outer_field;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_NESTED(Outer, outer_field)); }
};

struct Deep {
    std::string id;
    std::optional<Outer> level;
    std::string sort_order_;
    int hidden = 0;

    static constexpr auto graphqlFields() {
        return gqlc::fields(GQLC_FIELD(Deep, id), GQLC_NESTED(Deep, level), GQLC_FIELD(Deep, sort_order_), GQLC_REFERENCE(Deep, hidden));
    }
};

struct Empty {
    static constexpr auto graphqlFields() { return gqlc::fields(); }
};

int main() {
    static_assert(gqlc::isProjection<FullIssue>);
    static_assert(!gqlc::isProjection<int>);
    static_assert(!gqlc::HasFullType<IssueSummary>::value);
    static_assert(gqlc::HasFullType<IssueDetail>::value);

    // projections without a FullType carry no obligations
    static_assert(gqlc::verify<IssueSummary>());
    static_assert(gqlc::verify<FullIssue>());
    static_assert(gqlc::verify<IssueDetail>());

    static_assert(std::is_same_v<gqlc::unwrap_t<std::optional<std::vector<gqlc::Box<Inner>>>>, Inner>);

    assert(gqlc::selection<StateRef>() == "name");
    assert(gqlc::selection<IssueSummary>() == "id state { name }");
    assert(gqlc::selection<IssueDetail>() == "id title createdAt branchName state { name }");

    assert(gqlc::selection<Inner>() == "a b");
    assert(gqlc::selection<Outer>() == "outerField { a b }");
    assert(gqlc::selection<Deep>() == "id level { outerField { a b } } sortOrder");

    // reference fields are never selected
    assert(gqlc::selection<FullIssue>() == "id title priority createdAt branchName");
    assert(gqlc::selection<Empty>().empty());

    // stable across calls
    assert(gqlc::selection<Deep>() == gqlc::selection<Deep>());

    assert(gqlc::queryText<IssueSummary>("issue") == "query { issue { id state { name } } }");
    assert(gqlc::connectionQueryText<StateRef>("workflowStates") == "query { workflowStates { nodes { name } pageInfo { hasNextPage endCursor } } }");
}
