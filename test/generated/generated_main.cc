#undef NDEBUG

#include "mini_schema.hh"

#include "decode.hh"
#include "projection.hh"
#include "query.hh"
#include "timestamp.hh"

#include <nlohmann/json.hpp>

#include <cassert>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

// generated members are optional; objects are boxed references
static_assert(std::is_same_v<decltype(mini::Issue::id), std::optional<std::string>>);
static_assert(std::is_same_v<decltype(mini::Issue::priority), std::optional<double>>);
static_assert(std::is_same_v<decltype(mini::Issue::priorityLabel), std::optional<mini::IssuePriority>>);
static_assert(std::is_same_v<decltype(mini::Issue::estimate), std::optional<int>>);
static_assert(std::is_same_v<decltype(mini::Issue::createdAt), std::optional<gqlc::Timestamp>>);
static_assert(std::is_same_v<decltype(mini::Issue::state), std::optional<gqlc::Box<mini::WorkflowState>>>);
static_assert(std::is_same_v<decltype(mini::Issue::parent), std::optional<gqlc::Box<mini::Issue>>>);
static_assert(std::is_same_v<decltype(mini::Issue::labelIds), std::optional<std::vector<std::string>>>);
static_assert(std::is_same_v<decltype(mini::Issue::previousIdentifiers), std::optional<std::vector<std::optional<std::string>>>>);
static_assert(std::is_same_v<decltype(mini::Issue::metadata), std::optional<nlohmann::json>>);
static_assert(std::is_same_v<decltype(mini::Issue::related), std::optional<std::vector<nlohmann::json>>>);
static_assert(std::is_same_v<decltype(mini::WorkflowState::default_), std::optional<bool>>);
static_assert(std::is_same_v<decltype(mini::IssueConnection::nodes), std::optional<std::vector<gqlc::Box<mini::Issue>>>>);

static_assert(static_cast<int>(mini::StateType::Unknown_) == 0);
static_assert(static_cast<int>(mini::StateType::backlog) == 1);

static_assert(mini::queryOperations.size() == 3);
static_assert(mini::queryOperations[0] == "viewer");
static_assert(mini::queryOperations[2] == "issues");
static_assert(mini::mutationOperations.size() == 1);
static_assert(mini::mutationOperations[0] == "issueArchive");

static_assert(gqlc::isProjection<mini::Issue>);
static_assert(gqlc::verify<mini::Issue>());

// hand-written views over the generated types
struct StateView {
    using FullType = mini::WorkflowState;

    std::string name;
    mini::StateType type = mini::StateType::Unknown_;
    std::optional<std::string> color;
    bool default_ = false;

    static constexpr auto graphqlFields() {
        return gqlc::fields(GQLC_FIELD(StateView, name), GQLC_FIELD(StateView, type), GQLC_FIELD(StateView, color), GQLC_FIELD(StateView, default_));
    }
};
GQLC_VERIFY(StateView);

struct UserView {
    using FullType = mini::User;

    std::string id;
    std::string name;
    std::optional<std::string> email;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(UserView, id), GQLC_FIELD(UserView, name), GQLC_FIELD(UserView, email)); }
};
GQLC_VERIFY(UserView);

struct IssueView {
    using FullType = mini::Issue;

    std::string id;
    std::string identifier;
    std::string title;
    double priority = 0;
    std::optional<int> estimate;
    gqlc::Timestamp created_at;
    std::vector<std::string> label_ids;
    StateView state;
    std::optional<UserView> assignee;

    static constexpr auto graphqlFields() {
        return gqlc::fields(
            GQLC_FIELD(IssueView, id),
            GQLC_FIELD(IssueView, identifier),
            GQLC_FIELD(IssueView, title),
            GQLC_FIELD(IssueView, priority),
            GQLC_FIELD(IssueView, estimate),
            GQLC_FIELD(IssueView, created_at),
            GQLC_FIELD(IssueView, label_ids),
            GQLC_NESTED(IssueView, state),
            GQLC_NESTED(IssueView, assignee));
    }
};
GQLC_VERIFY(IssueView);

static void test_selection() {
    assert(gqlc::selection<mini::WorkflowState>() == "id name type color default");
    assert(gqlc::selection<mini::Issue>() == "id identifier title description priority priorityLabel estimate createdAt labelIds metadata previousIdentifiers");
    assert(gqlc::selection<mini::IssueConnection>().empty());

    assert(gqlc::selection<IssueView>() ==
        "id identifier title priority estimate createdAt labelIds state { name type color default } assignee { id name email }");
    assert(gqlc::connectionQueryText<UserView>("users") == "query { users { nodes { id name email } pageInfo { hasNextPage endCursor } } }");
}

static void test_connection() {
    auto const response = nlohmann::json::parse(R"({
        "data": {
            "issues": {
                "nodes": [
                    {
                        "id": "i1",
                        "identifier": "ENG-1",
                        "title": "Fix login",
                        "priority": 2,
                        "estimate": null,
                        "createdAt": "2024-01-15T10:30:00.000Z",
                        "labelIds": ["bug", "auth"],
                        "state": { "name": "Todo", "type": "unstarted", "color": "#e2e2e2", "default": true },
                        "assignee": null
                    },
                    {
                        "id": "i2",
                        "identifier": "ENG-2",
                        "title": "Add search",
                        "priority": 1.5,
                        "estimate": 3,
                        "createdAt": "2024-02-01T08:00:00+01:00",
                        "labelIds": [],
                        "state": { "name": "In Progress", "type": "started", "color": null },
                        "assignee": { "id": "u1", "name": "Ada", "email": "ada@example.com" }
                    }
                ],
                "pageInfo": { "hasNextPage": true, "endCursor": "c2" }
            }
        }
    })");

    gqlc::Connection<IssueView> page;
    std::string error;
    assert(gqlc::extractData(response, "issues", page, error));

    assert(page.nodes.size() == 2);
    assert(page.pageInfo.hasNextPage);
    assert(page.pageInfo.endCursor == "c2");

    auto const& first = page.nodes[0];
    assert(first.id == "i1" && first.identifier == "ENG-1" && first.title == "Fix login");
    assert(first.priority == 2.0);
    assert(!first.estimate.has_value());
    assert(gqlc::formatTimestamp(first.created_at) == "2024-01-15T10:30:00.000Z");
    assert((first.label_ids == std::vector<std::string>{ "bug", "auth" }));
    assert(first.state.name == "Todo");
    assert(first.state.type == mini::StateType::Unknown_);
    assert(first.state.color == "#e2e2e2");
    assert(first.state.default_);
    assert(!first.assignee.has_value());

    auto const& second = page.nodes[1];
    assert(second.priority == 1.5);
    assert(second.estimate == 3);
    assert(gqlc::formatTimestamp(second.created_at) == "2024-02-01T07:00:00.000Z");
    assert(second.label_ids.empty());
    assert(second.state.type == mini::StateType::started);
    assert(!second.state.color.has_value());
    assert(!second.state.default_);
    assert(second.assignee.has_value());
    assert(second.assignee->name == "Ada");
    assert(second.assignee->email == "ada@example.com");
}

static void test_full_type() {
    auto const data = nlohmann::json::parse(R"({
        "id": "i3",
        "priorityLabel": "URGENT",
        "state": { "id": "s1", "name": "Done", "type": "completed" },
        "parent": { "id": "i0", "title": "Epic" },
        "previousIdentifiers": ["ENG-0", null],
        "metadata": { "source": "import", "rank": 1 },
        "related": [{ "id": "u1", "__typename": "User" }]
    })");

    mini::Issue issue;
    std::string error;
    assert(gqlc::decode(data, issue, error));

    assert(issue.id == "i3");
    assert(!issue.title.has_value());
    assert(issue.priorityLabel == mini::IssuePriority::URGENT);
    assert(issue.state.has_value());
    assert((*issue.state)->name == "Done");
    assert((*issue.state)->type == mini::StateType::completed);
    assert(issue.parent.has_value());
    assert((*issue.parent)->id == "i0");
    assert((*issue.parent)->title == "Epic");
    assert(!(*issue.parent)->parent.has_value());
    assert(issue.previousIdentifiers->size() == 2);
    assert((*issue.previousIdentifiers)[0] == "ENG-0");
    assert(!(*issue.previousIdentifiers)[1].has_value());
    assert((*issue.metadata)["rank"] == 1);
    assert(issue.related->size() == 1);
    assert((*issue.related)[0]["__typename"] == "User");

    // generated types copy deeply
    auto copy = issue;
    (*copy.parent)->id = "changed";
    assert((*issue.parent)->id == "i0");
}

static void test_errors() {
    auto const response = nlohmann::json::parse(R"({
        "data": { "issue": { "id": "i1", "identifier": "ENG-1", "title": "t", "priority": 1, "createdAt": "2024-01-15T10:30:00Z",
                             "labelIds": [], "state": { "name": 7, "type": "started" } } }
    })");

    IssueView issue;
    std::string error;
    assert(!gqlc::extractData(response, "issue", issue, error));
    assert(error == "failed to decode `issue': issue.state.name: expected string, got number");

    assert(!gqlc::extractData(nlohmann::json::parse(R"({ "data": { "viewer": null } })"), "viewer", issue, error));
    assert(error == "no `viewer' in response data");
}

int main() {
    test_selection();
    test_connection();
    test_full_type();
    test_errors();
}
